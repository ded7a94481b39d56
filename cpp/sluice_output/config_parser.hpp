// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_CONFIG_PARSER_HPP
#define SLUICE_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include "output_config.hpp"

namespace sluice {
namespace logging {
struct LoggingConfig;
}
}  // namespace sluice

namespace sluice {
namespace output {

/**
 * YAML loader for OutputConfig.
 *
 * Example:
 *   path_prefix: logs/out
 *   file_ext: .csv
 *   sequence_format: ".%03d.%02d"
 *   bucket: my-bucket
 *   endpoint: http://localhost:9000
 *   path_style_access: true
 *   file_buffer_chunk_limit: 104857600
 *   logging:
 *     console:
 *       level: info
 *     file:
 *       enabled: true
 *       directory: /var/log/sluice
 */
class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   *
   * @param log_config Receives the optional logging block, may be nullptr
   */
  bool load_from_file(
    const std::string& path, OutputConfig& config, logging::LoggingConfig* log_config = nullptr
  );

  /**
   * Load configuration from YAML string
   *
   * @param log_config Receives the optional logging block, may be nullptr
   */
  bool load_from_string(
    const std::string& yaml_content, OutputConfig& config,
    logging::LoggingConfig* log_config = nullptr
  );

  /**
   * Validate configuration
   */
  static bool validate(const OutputConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_output(const YAML::Node& node, OutputConfig& config);
  bool parse_logging(const YAML::Node& node, logging::LoggingConfig& log_config);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_CONFIG_PARSER_HPP
