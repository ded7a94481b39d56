// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_LOG_INIT_HPP
#define SLUICE_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "sluice_console_sink.hpp"
#include "sluice_file_sink.hpp"
#include "sluice_log_severity.hpp"

namespace sluice {
namespace logging {

/**
 * Logging configuration for sluice applications.
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  // File sink
  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse a string to severity_level.
 * Accepts: "debug", "info", "warn", "warning", "error", "fatal" (case-insensitive)
 *
 * @return The parsed level, or std::nullopt if invalid
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 * Supported environment variables:
 *   SLUICE_LOG_LEVEL           - Global level (overrides both console and file)
 *   SLUICE_LOG_CONSOLE_LEVEL   - Console sink level
 *   SLUICE_LOG_FILE_LEVEL      - File sink level
 *   SLUICE_LOG_FILE_DIR        - Log file directory
 *   SLUICE_LOG_FORMAT          - File format ("json" or "text")
 *   SLUICE_LOG_FILE_ENABLED    - Enable file logging ("true" or "false")
 *   SLUICE_LOG_CONSOLE_ENABLED - Enable console logging ("true" or "false")
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Initialize console and file sinks.
 * Calling it again before shutdown_logging() has no effect.
 */
void init_logging(const LoggingConfig& config);

/**
 * Initialize with defaults: console at INFO with colors, no file sink.
 */
void init_logging_default();

/**
 * Stop async sink threads, flush pending records and detach all sinks.
 */
void shutdown_logging();

/**
 * Flush all sinks.
 */
void flush_logging();

/**
 * Shut down existing sinks and reinitialize with the given config after
 * applying environment overrides.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace sluice

#endif  // SLUICE_LOG_INIT_HPP
