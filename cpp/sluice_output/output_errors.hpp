// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_OUTPUT_ERRORS_HPP
#define SLUICE_OUTPUT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sluice {
namespace output {

/**
 * Classification of every failure raised by the output core.
 *
 * The hosting pipeline switches on the kind to decide between failing the
 * transaction (configuration), failing one task attempt and resuming later
 * (authentication, I/O, upload), or reporting a programming error.
 */
enum class ErrorKind {
  Configuration,
  Authentication,
  IO,
  Upload,
  InvalidState
};

inline const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Configuration:
      return "configuration";
    case ErrorKind::Authentication:
      return "authentication";
    case ErrorKind::IO:
      return "io";
    case ErrorKind::Upload:
      return "upload";
    case ErrorKind::InvalidState:
      return "invalid_state";
    default:
      return "unknown";
  }
}

/**
 * Base class of all output errors.
 */
class OutputError : public std::runtime_error {
public:
  OutputError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message)
      , kind_(kind) {}

  ErrorKind kind() const {
    return kind_;
  }

private:
  ErrorKind kind_;
};

/**
 * Bad sequence_format, bad credential pairing or missing required keys.
 * Raised before any task runs; never retried.
 */
class ConfigurationError : public OutputError {
public:
  explicit ConfigurationError(const std::string& message)
      : OutputError(ErrorKind::Configuration, message) {}
};

/**
 * Bad credentials or inaccessible bucket, raised while constructing a client.
 */
class AuthenticationError : public OutputError {
public:
  explicit AuthenticationError(const std::string& message)
      : OutputError(ErrorKind::Authentication, message) {}
};

/**
 * Local temp-file create/write/close/delete failure.
 */
class IOFailure : public OutputError {
public:
  explicit IOFailure(const std::string& message)
      : OutputError(ErrorKind::IO, message) {}
};

/**
 * Remote transmission failure of one chunk.
 *
 * Safe to retry through resume: the same (task, file) pair always maps to the
 * same key, so a re-upload overwrites the same object.
 */
class UploadFailure : public OutputError {
public:
  UploadFailure(
    const std::string& message, const std::string& key, const std::string& error_code,
    bool retryable
  )
      : OutputError(ErrorKind::Upload, message)
      , key_(key)
      , error_code_(error_code)
      , retryable_(retryable) {}

  const std::string& key() const {
    return key_;
  }

  const std::string& errorCode() const {
    return error_code_;
  }

  bool isRetryable() const {
    return retryable_;
  }

private:
  std::string key_;
  std::string error_code_;
  bool retryable_;
};

/**
 * Lifecycle misuse, e.g. add() before nextFile().
 */
class InvalidStateError : public OutputError {
public:
  explicit InvalidStateError(const std::string& message)
      : OutputError(ErrorKind::InvalidState, message) {}
};

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_OUTPUT_ERRORS_HPP
