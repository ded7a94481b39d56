// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <fstream>
#include <sstream>

#include "credentials.hpp"
#include "key_namer.hpp"
#include "output_errors.hpp"

#define SLUICE_LOG_COMPONENT "config_parser"
#include <sluice_log_init.hpp>
#include <sluice_log_macros.hpp>

namespace sluice {
namespace output {

namespace {

const char* const kRequiredKeys[] = {"path_prefix", "file_ext", "bucket", "endpoint"};

}  // namespace

// ============================================================================
// OutputConfig
// ============================================================================

std::string OutputConfig::to_string() const {
  std::ostringstream oss;
  oss << "bucket=" << bucket << " endpoint=" << endpoint << " region=" << region
      << " path_prefix=" << path_prefix << " sequence_format=" << sequence_format
      << " file_ext=" << file_ext << " path_style_access=" << (path_style_access ? "true" : "false")
      << " tmp_dir=" << (tmp_dir.empty() ? "<system>" : tmp_dir)
      << " tmp_path_prefix=" << tmp_path_prefix
      << " file_buffer_chunk_limit=" << file_buffer_chunk_limit
      << " access_key_id=" << (access_key_id ? *access_key_id : "<unset>")
      << " secret_access_key=" << (secret_access_key ? "****" : "<unset>");
  return oss.str();
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(
  const std::string& path, OutputConfig& config, logging::LoggingConfig* log_config
) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (!load_from_string(buffer.str(), config, log_config)) {
    return false;
  }

  SLUICE_LOG_DEBUG("Loaded configuration" << logging::kv("path", path));
  return true;
}

bool ConfigParser::load_from_string(
  const std::string& yaml_content, OutputConfig& config, logging::LoggingConfig* log_config
) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (!node.IsMap()) {
      last_error_ = "Configuration must be a YAML mapping";
      return false;
    }

    for (const char* key : kRequiredKeys) {
      if (!node[key]) {
        last_error_ = std::string("Missing required key: ") + key;
        return false;
      }
    }

    if (!parse_output(node, config)) {
      return false;
    }

    // Parse logging config
    if (log_config && node["logging"]) {
      if (!parse_logging(node["logging"], *log_config)) {
        return false;
      }
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_output(const YAML::Node& node, OutputConfig& config) {
  config.path_prefix = node["path_prefix"].as<std::string>();
  config.file_ext = node["file_ext"].as<std::string>();
  config.bucket = node["bucket"].as<std::string>();
  config.endpoint = node["endpoint"].as<std::string>();

  if (node["sequence_format"]) {
    config.sequence_format = node["sequence_format"].as<std::string>();
  }
  if (node["region"]) {
    config.region = node["region"].as<std::string>();
  }
  if (node["path_style_access"]) {
    config.path_style_access = node["path_style_access"].as<bool>();
  }
  if (node["access_key_id"]) {
    config.access_key_id = node["access_key_id"].as<std::string>();
  }
  if (node["secret_access_key"]) {
    config.secret_access_key = node["secret_access_key"].as<std::string>();
  }
  if (node["tmp_dir"]) {
    config.tmp_dir = node["tmp_dir"].as<std::string>();
  }
  if (node["tmp_path_prefix"]) {
    config.tmp_path_prefix = node["tmp_path_prefix"].as<std::string>();
  }
  if (node["file_buffer_chunk_limit"]) {
    config.file_buffer_chunk_limit = node["file_buffer_chunk_limit"].as<uint64_t>();
  }
  if (node["connect_timeout_ms"]) {
    config.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    config.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, logging::LoggingConfig& log_config) {
  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      log_config.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      log_config.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      std::string level = console["level"].as<std::string>();
      auto parsed = logging::parse_severity_level(level);
      if (!parsed) {
        last_error_ = "Invalid logging.console.level: " + level;
        return false;
      }
      log_config.console_level = *parsed;
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      log_config.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      std::string level = file["level"].as<std::string>();
      auto parsed = logging::parse_severity_level(level);
      if (!parsed) {
        last_error_ = "Invalid logging.file.level: " + level;
        return false;
      }
      log_config.file_level = *parsed;
    }
    if (file["directory"]) {
      log_config.file_config.directory = file["directory"].as<std::string>();
    }
    if (file["format"]) {
      std::string format = file["format"].as<std::string>();
      if (format != "json" && format != "text") {
        last_error_ = "Invalid logging.file.format (expected json or text): " + format;
        return false;
      }
      log_config.file_config.format_json = (format == "json");
    }
    if (file["rotation_size_mb"]) {
      log_config.file_config.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      log_config.file_config.max_files = file["max_files"].as<int>();
    }
  }

  return true;
}

bool ConfigParser::validate(const OutputConfig& config, std::string& error_msg) {
  if (config.bucket.empty()) {
    error_msg = "bucket is empty";
    return false;
  }

  if (config.endpoint.empty()) {
    error_msg = "endpoint is empty";
    return false;
  }

  // A bare host defaults to HTTPS; an explicit scheme must be http:// or https://
  if (config.endpoint.find("://") != std::string::npos &&
      config.endpoint.rfind("http://", 0) != 0 && config.endpoint.rfind("https://", 0) != 0) {
    error_msg = "Invalid endpoint - scheme must be http:// or https://";
    return false;
  }

  if (config.connect_timeout_ms <= 0 || config.request_timeout_ms <= 0) {
    error_msg = "Invalid timeouts - connect_timeout_ms and request_timeout_ms must be > 0";
    return false;
  }

  try {
    validateCredentialPairing(config);
    KeyNamer::validateSequenceFormat(config.sequence_format);
  } catch (const ConfigurationError& e) {
    error_msg = e.what();
    return false;
  }

  return true;
}

}  // namespace output
}  // namespace sluice
