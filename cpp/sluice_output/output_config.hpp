// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_OUTPUT_CONFIG_HPP
#define SLUICE_OUTPUT_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace sluice {
namespace output {

/**
 * Output configuration, immutable for the duration of a transaction.
 */
struct OutputConfig {
  // Object key layout: path_prefix + sequence_format(task, file) + file_ext
  std::string path_prefix;
  std::string file_ext;
  std::string sequence_format = ".%03d.%02d";

  // Object store
  std::string bucket;
  std::string endpoint;  // e.g. "https://s3.amazonaws.com" or "http://localhost:9000"
  std::string region = "us-east-1";
  bool path_style_access = false;  // Required for MinIO and most S3-compatible stores

  // Explicit credentials. Both or neither; when absent, credentials come from
  // the environment or the role attached to the host.
  std::optional<std::string> access_key_id;
  std::optional<std::string> secret_access_key;

  // Local staging
  std::string tmp_dir;  // Empty means the system temp directory
  std::string tmp_path_prefix = "embulk-output-s3-";

  // Total chunk size budget in bytes across all tasks, 0 = unlimited
  uint64_t file_buffer_chunk_limit = 0;

  // Client timeouts (milliseconds)
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;

  /**
   * One-line summary for logs. Never includes the secret access key.
   */
  std::string to_string() const;
};

/**
 * Saved configuration handed to every task of a transaction.
 *
 * Produced once by TransactionCoordinator::transaction() and re-used verbatim
 * by resume(), so every attempt derives the same keys and limits.
 */
struct TaskSource {
  OutputConfig config;
  uint64_t per_task_chunk_limit = 0;  // config.file_buffer_chunk_limit / task_count
};

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_OUTPUT_CONFIG_HPP
