// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunk_buffer.hpp"

#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <utility>
#include <vector>

#include "output_errors.hpp"

#define SLUICE_LOG_COMPONENT "chunk_buffer"
#include <sluice_log_macros.hpp>

namespace fs = std::filesystem;

namespace sluice {
namespace output {

ChunkBuffer::ChunkBuffer(
  std::string directory, std::string prefix, std::shared_ptr<IFileSystem> filesystem
)
    : directory_(std::move(directory))
    , prefix_(std::move(prefix))
    , filesystem_(std::move(filesystem)) {}

ChunkBuffer::~ChunkBuffer() {
  if (stream_.is_open()) {
    stream_.close();
  }
  if (!path_.empty() && !filesystem_->remove(path_) && filesystem_->exists(path_)) {
    SLUICE_LOG_WARN("Failed to delete abandoned temp file" << logging::kv("path", path_));
  }
}

void ChunkBuffer::open() {
  if (hasFile()) {
    throw InvalidStateError("Chunk buffer already owns temp file " + path_);
  }

  fs::path dir = directory_.empty() ? fs::temp_directory_path() : fs::path(directory_);
  std::string pattern = (dir / (prefix_ + "XXXXXX")).string();

  // mkstemp creates the file exclusively, so concurrent tasks never collide
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');
  int fd = ::mkstemp(name.data());
  if (fd < 0) {
    throw IOFailure("Failed to create temp file " + pattern + ": " + std::strerror(errno));
  }
  ::close(fd);
  path_ = name.data();

  stream_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!stream_.is_open()) {
    std::string failed_path = path_;
    if (!filesystem_->remove(path_)) {
      SLUICE_LOG_WARN("Failed to delete unopened temp file" << logging::kv("path", path_));
    }
    path_.clear();
    throw IOFailure("Failed to open temp file " + failed_path + " for writing");
  }

  bytes_written_ = 0;
  SLUICE_LOG_DEBUG("Opened temp file" << logging::kv("path", path_));
}

void ChunkBuffer::write(const void* data, size_t size) {
  if (!stream_.is_open()) {
    throw IOFailure("No chunk is open for writing");
  }

  stream_.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
  if (!stream_) {
    throw IOFailure("Failed to write " + std::to_string(size) + " bytes to " + path_);
  }
  bytes_written_ += size;
}

uint64_t ChunkBuffer::size() {
  if (path_.empty()) {
    return 0;
  }

  if (stream_.is_open()) {
    stream_.flush();
    if (!stream_) {
      throw IOFailure("Failed to flush temp file " + path_);
    }
  }

  try {
    return filesystem_->file_size(path_);
  } catch (const fs::filesystem_error& e) {
    throw IOFailure("Failed to read size of temp file " + path_ + ": " + e.what());
  }
}

void ChunkBuffer::closeAndKeep() {
  if (!stream_.is_open()) {
    return;
  }

  stream_.flush();
  bool flushed = static_cast<bool>(stream_);
  stream_.close();
  if (!flushed || stream_.fail()) {
    stream_.clear();
    throw IOFailure("Failed to close temp file " + path_);
  }
}

void ChunkBuffer::closeAndDiscard() {
  if (stream_.is_open()) {
    // Data is being dropped, so a failing flush is irrelevant
    stream_.close();
    stream_.clear();
  }
  remove();
}

void ChunkBuffer::remove() {
  if (path_.empty()) {
    return;
  }

  if (!filesystem_->remove(path_) && filesystem_->exists(path_)) {
    throw IOFailure("Failed to delete temp file " + path_);
  }

  SLUICE_LOG_DEBUG("Deleted temp file" << logging::kv("path", path_));
  path_.clear();
}

}  // namespace output
}  // namespace sluice
