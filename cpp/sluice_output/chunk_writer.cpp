// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunk_writer.hpp"

#include <utility>

#include "output_errors.hpp"
#include "output_impl.hpp"

#define SLUICE_LOG_COMPONENT "chunk_writer"
#include <sluice_log_macros.hpp>

namespace sluice {
namespace output {

const char* chunk_writer_state_to_string(ChunkWriterState state) {
  switch (state) {
    case ChunkWriterState::NoChunkOpen:
      return "no_chunk_open";
    case ChunkWriterState::ChunkOpen:
      return "chunk_open";
    case ChunkWriterState::Closed:
      return "closed";
    case ChunkWriterState::Aborted:
      return "aborted";
    default:
      return "unknown";
  }
}

ChunkWriter::ChunkWriter(
  int task_index, const TaskSource& task_source, std::unique_ptr<IObjectUploader> uploader,
  std::shared_ptr<IFileSystem> filesystem
)
    : config_(task_source.config)
    , key_namer_(task_source.config)
    , uploader_(std::move(uploader))
    , filesystem_(filesystem ? std::move(filesystem) : std::make_shared<FileSystemImpl>()) {
  if (!uploader_) {
    throw InvalidStateError("ChunkWriter requires an uploader");
  }
  task_.task_index = task_index;
  task_.file_index = 0;
  task_.per_task_byte_limit = task_source.per_task_chunk_limit;
}

ChunkWriter::~ChunkWriter() {
  if (chunk_ && chunk_->hasFile()) {
    SLUICE_LOG_WARN(
      "Discarding unfinished chunk" << logging::kv("task_index", task_.task_index)
                                    << logging::kv("path", chunk_->path())
    );
  }
}

// =============================================================================
// Pipeline operations
// =============================================================================

void ChunkWriter::nextFile() {
  requireWritable("nextFile");
  if (state_ == ChunkWriterState::ChunkOpen) {
    closeCurrent();
  }
  openChunk();
}

void ChunkWriter::add(std::vector<uint8_t> buffer) {
  // Taking the buffer by value releases it on every exit path
  std::vector<uint8_t> data = std::move(buffer);

  requireWritable("add");
  if (state_ != ChunkWriterState::ChunkOpen) {
    throw InvalidStateError("nextFile must precede add");
  }

  chunk_->write(data.data(), data.size());
  data.clear();
  data.shrink_to_fit();

  if (task_.per_task_byte_limit > 0 && chunk_->size() > task_.per_task_byte_limit) {
    nextFile();
  }
}

void ChunkWriter::finish() {
  if (state_ == ChunkWriterState::Closed) {
    return;
  }
  if (state_ == ChunkWriterState::Aborted) {
    throw InvalidStateError("finish called after abort");
  }
  if (failed_) {
    throw InvalidStateError("finish called after a failed chunk; abort the task instead");
  }

  if (state_ == ChunkWriterState::ChunkOpen) {
    closeCurrent();
  }
  state_ = ChunkWriterState::Closed;
  SLUICE_LOG_DEBUG(
    "Task finished" << logging::kv("task_index", task_.task_index)
                    << logging::kv("chunks", task_.file_index)
  );
}

void ChunkWriter::close() {
  if (state_ == ChunkWriterState::Aborted || state_ == ChunkWriterState::Closed || failed_) {
    return;
  }
  finish();
}

void ChunkWriter::abort() {
  if (state_ == ChunkWriterState::Aborted) {
    return;
  }

  if (chunk_) {
    std::string path = chunk_->path();
    try {
      chunk_->closeAndDiscard();
    } catch (const IOFailure& e) {
      // abort runs while another error propagates; that error wins
      SLUICE_LOG_WARN(
        "Failed to discard pending chunk" << logging::kv("path", path)
                                          << logging::kv("error", e.what())
      );
    }
    chunk_.reset();
  }

  state_ = ChunkWriterState::Aborted;
  SLUICE_LOG_DEBUG(
    "Task aborted" << logging::kv("task_index", task_.task_index)
                   << logging::kv("uploaded_chunks", task_.file_index)
  );
}

TaskReport ChunkWriter::commit() {
  if (state_ != ChunkWriterState::Closed) {
    throw InvalidStateError(
      std::string("commit requires a finished task, state is ") +
      chunk_writer_state_to_string(state_)
    );
  }
  return TaskReport{};
}

uint64_t ChunkWriter::currentChunkSize() {
  if (state_ != ChunkWriterState::ChunkOpen || !chunk_) {
    return 0;
  }
  return chunk_->size();
}

std::string ChunkWriter::currentChunkPath() const {
  if (state_ != ChunkWriterState::ChunkOpen || !chunk_) {
    return "";
  }
  return chunk_->path();
}

// =============================================================================
// Chunk lifecycle
// =============================================================================

void ChunkWriter::openChunk() {
  auto chunk = std::make_unique<ChunkBuffer>(config_.tmp_dir, config_.tmp_path_prefix, filesystem_);
  chunk->open();
  chunk_ = std::move(chunk);
  state_ = ChunkWriterState::ChunkOpen;

  SLUICE_LOG_DEBUG(
    "Opened chunk" << logging::kv("task_index", task_.task_index)
                   << logging::kv("file_index", task_.file_index)
                   << logging::kv("path", chunk_->path())
  );
}

void ChunkWriter::closeCurrent() {
  if (!chunk_ || !chunk_->hasFile()) {
    chunk_.reset();
    state_ = ChunkWriterState::NoChunkOpen;
    return;
  }

  // From here on the chunk is gone from the writer; its destructor deletes the
  // file if anything below throws before remove() succeeds
  std::unique_ptr<ChunkBuffer> chunk = std::move(chunk_);
  state_ = ChunkWriterState::NoChunkOpen;
  failed_ = true;

  // An incomplete file must never be uploaded
  chunk->closeAndKeep();

  const std::string key = key_namer_.buildKey(task_.task_index, task_.file_index);
  const uint64_t bytes = chunk->bytesWritten();
  UploadResult result = uploader_->uploadFile(chunk->path(), key);

  if (!result.success) {
    std::string path = chunk->path();
    try {
      chunk->remove();
    } catch (const IOFailure& e) {
      SLUICE_LOG_WARN(
        "Failed to delete chunk after failed upload" << logging::kv("path", path)
                                                     << logging::kv("error", e.what())
      );
    }
    throw UploadFailure(
      "Failed to upload chunk to " + key + ": " + result.error_message, key, result.error_code,
      result.is_retryable
    );
  }

  ++task_.file_index;
  SLUICE_LOG_INFO(
    "Uploaded chunk" << logging::kv("key", key) << logging::kv("bytes", bytes)
                     << logging::kv("etag", result.etag)
  );

  chunk->remove();
  failed_ = false;
}

void ChunkWriter::requireWritable(const char* operation) const {
  if (state_ == ChunkWriterState::Closed) {
    throw InvalidStateError(std::string(operation) + " called after finish");
  }
  if (state_ == ChunkWriterState::Aborted) {
    throw InvalidStateError(std::string(operation) + " called after abort");
  }
  if (failed_) {
    throw InvalidStateError(
      std::string(operation) + " called after a failed chunk; abort the task instead"
    );
  }
}

}  // namespace output
}  // namespace sluice
