// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_OUTPUT_INTERFACES_HPP
#define SLUICE_OUTPUT_INTERFACES_HPP

#include <cstdint>
#include <string>

namespace sluice {
namespace output {

/**
 * Interface for filesystem operations on staged chunk files.
 * Allows injecting size and delete failures in tests.
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  /**
   * Check if a file exists
   */
  virtual bool exists(const std::string& path) const = 0;

  /**
   * Get the size of a file in bytes
   * @throws std::filesystem::filesystem_error if the size cannot be read
   */
  virtual uint64_t file_size(const std::string& path) const = 0;

  /**
   * Remove a file
   * @return true if the file was removed, false otherwise
   */
  virtual bool remove(const std::string& path) const = 0;
};

/**
 * Result of an upload operation
 */
struct UploadResult {
  bool success;
  std::string etag;
  std::string error_message;
  std::string error_code;  // Error code for classification
  bool is_retryable;       // True for transient errors

  static UploadResult Success(const std::string& etag) {
    return {true, etag, "", "", false};
  }

  static UploadResult Failure(
    const std::string& message, const std::string& code = "", bool retryable = false
  ) {
    return {false, "", message, code, retryable};
  }
};

/**
 * Uploads one complete local file to the object store.
 *
 * Implementations overwrite any existing object at the key and do not retry
 * internally.
 */
class IObjectUploader {
public:
  virtual ~IObjectUploader() = default;

  /**
   * @param local_path Path to the complete local file
   * @param key Object key inside the configured bucket
   */
  virtual UploadResult uploadFile(const std::string& local_path, const std::string& key) = 0;
};

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_OUTPUT_INTERFACES_HPP
