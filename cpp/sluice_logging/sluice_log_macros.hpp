// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_LOG_MACROS_HPP
#define SLUICE_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <sstream>
#include <string>

#include "sluice_log_severity.hpp"

namespace sluice {
namespace logging {

// Global severity logger type. The multithreaded variant is required because
// every output task logs from its own thread.
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in sluice_log_init.cpp
 */
logger_type& get_logger();

/**
 * Simple key-value formatter for structured logging.
 * Usage: SLUICE_LOG_INFO("message" << kv("key", value));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace sluice

// =============================================================================
// Component identification
// Define SLUICE_LOG_COMPONENT before including this header to set the
// component name that prefixes every record of the compilation unit.
//
//   #define SLUICE_LOG_COMPONENT "chunk_writer"
//   #include <sluice_log_macros.hpp>
// =============================================================================
#ifndef SLUICE_LOG_COMPONENT
#define SLUICE_LOG_COMPONENT "sluice"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define SLUICE_LOG_ENABLE_DEBUG 0
#else
#define SLUICE_LOG_ENABLE_DEBUG 1
#endif

#define SLUICE_LOG_DEBUG(msg)                                                                  \
  do {                                                                                         \
    if (SLUICE_LOG_ENABLE_DEBUG) {                                                             \
      BOOST_LOG_SEV(::sluice::logging::get_logger(), ::sluice::logging::severity_level::debug) \
        << "[" << SLUICE_LOG_COMPONENT << "] " << msg;                                         \
    }                                                                                          \
  } while (0)

#define SLUICE_LOG_INFO(msg)                                                                \
  do {                                                                                      \
    BOOST_LOG_SEV(::sluice::logging::get_logger(), ::sluice::logging::severity_level::info) \
      << "[" << SLUICE_LOG_COMPONENT << "] " << msg;                                        \
  } while (0)

#define SLUICE_LOG_WARN(msg)                                                                \
  do {                                                                                      \
    BOOST_LOG_SEV(::sluice::logging::get_logger(), ::sluice::logging::severity_level::warn) \
      << "[" << SLUICE_LOG_COMPONENT << "] " << msg;                                        \
  } while (0)

#define SLUICE_LOG_ERROR(msg)                                                                \
  do {                                                                                       \
    BOOST_LOG_SEV(::sluice::logging::get_logger(), ::sluice::logging::severity_level::error) \
      << "[" << SLUICE_LOG_COMPONENT << "] " << msg;                                         \
  } while (0)

#define SLUICE_LOG_FATAL(msg)                                                                \
  do {                                                                                       \
    BOOST_LOG_SEV(::sluice::logging::get_logger(), ::sluice::logging::severity_level::fatal) \
      << "[" << SLUICE_LOG_COMPONENT << "] " << msg;                                         \
  } while (0)

// =============================================================================
// Task context using a scoped thread attribute.
// Usage: SLUICE_LOG_SCOPED_TASK(3);
// Records emitted from this thread carry task_index=3 until the scope exits.
// =============================================================================
#define SLUICE_LOG_SCOPED_TASK(task_index_val) \
  BOOST_LOG_SCOPED_THREAD_ATTR(                \
    "TaskIndex", boost::log::attributes::constant<int>(static_cast<int>(task_index_val)))

#endif  // SLUICE_LOG_MACROS_HPP
