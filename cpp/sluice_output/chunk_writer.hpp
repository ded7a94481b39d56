// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_CHUNK_WRITER_HPP
#define SLUICE_CHUNK_WRITER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "chunk_buffer.hpp"
#include "key_namer.hpp"
#include "output_config.hpp"
#include "output_interfaces.hpp"

namespace sluice {
namespace output {

/**
 * Empty success marker returned by a committed task
 */
struct TaskReport {};

/**
 * Mutable per-task counters, owned by exactly one ChunkWriter
 */
struct TaskState {
  int task_index = 0;
  int file_index = 0;               // Chunks uploaded so far by this task
  uint64_t per_task_byte_limit = 0; // 0 = unlimited
};

enum class ChunkWriterState {
  NoChunkOpen,
  ChunkOpen,
  Closed,
  Aborted
};

const char* chunk_writer_state_to_string(ChunkWriterState state);

/**
 * Per-task output sink that splits a byte stream into chunks.
 *
 * Bytes go to a local temp file; whenever a chunk is closed (explicit
 * nextFile(), size rotation or finish()) it is uploaded under
 * KeyNamer::buildKey(task_index, file_index) and deleted locally.
 *
 * Usage:
 *   ChunkWriter writer(task_index, task_source, std::move(uploader));
 *   writer.nextFile();
 *   writer.add(std::move(bytes));
 *   writer.finish();
 *   TaskReport report = writer.commit();
 *   writer.close();
 *
 * Single-threaded use only.
 */
class ChunkWriter {
public:
  /**
   * @param task_index Index of the owning task
   * @param task_source Saved transaction configuration
   * @param uploader Object store client owned by this task
   * @param filesystem Filesystem used for staged chunk files
   * @throws ConfigurationError if the sequence format is invalid
   */
  ChunkWriter(
    int task_index, const TaskSource& task_source, std::unique_ptr<IObjectUploader> uploader,
    std::shared_ptr<IFileSystem> filesystem = nullptr
  );
  ~ChunkWriter();

  // Non-copyable, non-movable
  ChunkWriter(const ChunkWriter&) = delete;
  ChunkWriter& operator=(const ChunkWriter&) = delete;
  ChunkWriter(ChunkWriter&&) = delete;
  ChunkWriter& operator=(ChunkWriter&&) = delete;

  /**
   * Close and upload the open chunk, if any, then open a new one.
   *
   * @throws InvalidStateError after finish() or abort()
   * @throws IOFailure, UploadFailure
   */
  void nextFile();

  /**
   * Append a buffer to the open chunk, rotating when the chunk grows past
   * the per-task byte limit. The buffer is released even if the write fails.
   *
   * @throws InvalidStateError if no chunk is open
   * @throws IOFailure, UploadFailure
   */
  void add(std::vector<uint8_t> buffer);

  /**
   * Upload the final chunk. Later calls are no-ops.
   *
   * @throws InvalidStateError after abort()
   * @throws IOFailure, UploadFailure
   */
  void finish();

  /**
   * Same as finish(); does nothing after abort().
   */
  void close();

  /**
   * Delete the pending chunk without uploading it.
   */
  void abort();

  /**
   * @throws InvalidStateError unless finish() succeeded
   */
  TaskReport commit();

  ChunkWriterState state() const {
    return state_;
  }

  /**
   * True once a chunk failed to close or upload
   */
  bool hasFailed() const {
    return failed_;
  }

  int taskIndex() const {
    return task_.task_index;
  }

  int fileIndex() const {
    return task_.file_index;
  }

  uint64_t perTaskByteLimit() const {
    return task_.per_task_byte_limit;
  }

  /**
   * On-disk size of the open chunk, 0 when none is open
   */
  uint64_t currentChunkSize();

  /**
   * Temp file of the open chunk, empty when none is open
   */
  std::string currentChunkPath() const;

private:
  // Upload and delete the open chunk; increments file_index on success
  void closeCurrent();

  void openChunk();

  void requireWritable(const char* operation) const;

  TaskState task_;
  OutputConfig config_;
  KeyNamer key_namer_;
  std::unique_ptr<IObjectUploader> uploader_;
  std::shared_ptr<IFileSystem> filesystem_;
  std::unique_ptr<ChunkBuffer> chunk_;
  ChunkWriterState state_ = ChunkWriterState::NoChunkOpen;
  bool failed_ = false;  // A chunk failed to close or upload; only abort() remains
};

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_CHUNK_WRITER_HPP
