// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_CHUNK_BUFFER_HPP
#define SLUICE_CHUNK_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

#include "output_interfaces.hpp"

namespace sluice {
namespace output {

/**
 * Local staging file for one chunk.
 *
 * open() creates a uniquely named file "<directory>/<prefix>XXXXXX" and an
 * output handle to it. The buffer owns the file until remove() or
 * closeAndDiscard() deletes it; the destructor closes the handle and deletes
 * whatever it still owns, so a chunk abandoned by an exception never leaks a
 * temp file.
 *
 * Usage:
 *   ChunkBuffer buffer(dir, "embulk-output-s3-", fs);
 *   buffer.open();
 *   buffer.write(data, size);
 *   buffer.closeAndKeep();   // flush, file stays for upload
 *   upload(buffer.path());
 *   buffer.remove();
 *
 * Not thread-safe; owned by a single ChunkWriter.
 */
class ChunkBuffer {
public:
  /**
   * @param directory Directory for the staging file, empty for the system temp directory
   * @param prefix File name prefix (tmp_path_prefix)
   * @param filesystem Filesystem used for size queries and deletion
   */
  ChunkBuffer(
    std::string directory, std::string prefix, std::shared_ptr<IFileSystem> filesystem
  );
  ~ChunkBuffer();

  ChunkBuffer(const ChunkBuffer&) = delete;
  ChunkBuffer& operator=(const ChunkBuffer&) = delete;

  /**
   * Create the staging file and open it for writing.
   *
   * @throws InvalidStateError if this buffer already owns a file
   * @throws IOFailure if the file cannot be created or opened
   */
  void open();

  /**
   * Append bytes to the open file.
   *
   * @throws IOFailure if no file is open or the write fails
   */
  void write(const void* data, size_t size);

  /**
   * Current on-disk size in bytes; flushes the handle first.
   * Returns 0 if no file was ever opened or the file was deleted.
   *
   * @throws IOFailure if the handle cannot be flushed or the size read
   */
  uint64_t size();

  /**
   * Flush and release the handle, keeping the file for upload.
   *
   * @throws IOFailure if buffered data could not be written out
   */
  void closeAndKeep();

  /**
   * Release the handle and delete the file. Pending data is dropped.
   *
   * @throws IOFailure if the file cannot be deleted
   */
  void closeAndDiscard();

  /**
   * Delete a file previously kept by closeAndKeep().
   *
   * @throws IOFailure if the file cannot be deleted
   */
  void remove();

  bool isOpen() const {
    return stream_.is_open();
  }

  bool hasFile() const {
    return !path_.empty();
  }

  /**
   * Path of the staging file, empty when the buffer owns no file
   */
  const std::string& path() const {
    return path_;
  }

  uint64_t bytesWritten() const {
    return bytes_written_;
  }

private:
  std::string directory_;
  std::string prefix_;
  std::shared_ptr<IFileSystem> filesystem_;

  std::ofstream stream_;
  std::string path_;
  uint64_t bytes_written_ = 0;
};

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_CHUNK_BUFFER_HPP
