// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_config_parser.cpp
 * @brief Unit tests for ConfigParser and OutputConfig
 *
 * Tests YAML parsing, validation and redaction of the output configuration.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <sluice_log_init.hpp>

#include "config_parser.hpp"

namespace fs = std::filesystem;

using namespace sluice::output;

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("sluice_config_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);
  }

  void TearDown() override {
    if (fs::exists(test_dir_)) {
      fs::remove_all(test_dir_);
    }
  }

  std::string write_test_file(const std::string& filename, const std::string& content) {
    auto path = test_dir_ / filename;
    std::ofstream file(path);
    file << content;
    return path.string();
  }

  fs::path test_dir_;
};

const char* const kMinimalYaml = R"(
path_prefix: logs/out
file_ext: .csv
bucket: my-bucket
endpoint: http://localhost:9000
)";

// ============================================================================
// Valid YAML Parsing Tests
// ============================================================================

TEST_F(ConfigParserTest, ParseMinimalConfigAppliesDefaults) {
  ConfigParser parser;
  OutputConfig config;
  ASSERT_TRUE(parser.load_from_string(kMinimalYaml, config)) << parser.get_last_error();

  EXPECT_EQ(config.path_prefix, "logs/out");
  EXPECT_EQ(config.file_ext, ".csv");
  EXPECT_EQ(config.bucket, "my-bucket");
  EXPECT_EQ(config.endpoint, "http://localhost:9000");
  EXPECT_EQ(config.sequence_format, ".%03d.%02d");
  EXPECT_EQ(config.region, "us-east-1");
  EXPECT_EQ(config.tmp_path_prefix, "embulk-output-s3-");
  EXPECT_EQ(config.file_buffer_chunk_limit, 0u);
  EXPECT_FALSE(config.path_style_access);
  EXPECT_FALSE(config.access_key_id.has_value());
  EXPECT_FALSE(config.secret_access_key.has_value());
  EXPECT_TRUE(config.tmp_dir.empty());
  EXPECT_EQ(config.connect_timeout_ms, 10000);
  EXPECT_EQ(config.request_timeout_ms, 300000);
}

TEST_F(ConfigParserTest, ParseFullConfig) {
  const std::string yaml = R"(
path_prefix: data/part
file_ext: .jsonl
sequence_format: "%d-%d"
bucket: archive
endpoint: https://s3.eu-west-1.amazonaws.com
region: eu-west-1
path_style_access: true
access_key_id: AKIAEXAMPLE
secret_access_key: topsecret
tmp_dir: /var/tmp
tmp_path_prefix: staging-
file_buffer_chunk_limit: 104857600
connect_timeout_ms: 2000
request_timeout_ms: 60000
)";

  ConfigParser parser;
  OutputConfig config;
  ASSERT_TRUE(parser.load_from_string(yaml, config)) << parser.get_last_error();

  EXPECT_EQ(config.sequence_format, "%d-%d");
  EXPECT_EQ(config.region, "eu-west-1");
  EXPECT_TRUE(config.path_style_access);
  EXPECT_EQ(config.access_key_id.value_or(""), "AKIAEXAMPLE");
  EXPECT_EQ(config.secret_access_key.value_or(""), "topsecret");
  EXPECT_EQ(config.tmp_dir, "/var/tmp");
  EXPECT_EQ(config.tmp_path_prefix, "staging-");
  EXPECT_EQ(config.file_buffer_chunk_limit, 104857600u);
  EXPECT_EQ(config.connect_timeout_ms, 2000);
  EXPECT_EQ(config.request_timeout_ms, 60000);

  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;
}

TEST_F(ConfigParserTest, LoadFromFile) {
  std::string path = write_test_file("output.yaml", kMinimalYaml);

  ConfigParser parser;
  OutputConfig config;
  ASSERT_TRUE(parser.load_from_file(path, config)) << parser.get_last_error();
  EXPECT_EQ(config.bucket, "my-bucket");
}

TEST_F(ConfigParserTest, ParseLoggingBlock) {
  const std::string yaml = std::string(kMinimalYaml) + R"(
logging:
  console:
    enabled: false
    colors: false
    level: warn
  file:
    enabled: true
    level: info
    directory: /tmp/sluice-logs
    format: text
    rotation_size_mb: 5
    max_files: 3
)";

  ConfigParser parser;
  OutputConfig config;
  sluice::logging::LoggingConfig log_config;
  ASSERT_TRUE(parser.load_from_string(yaml, config, &log_config)) << parser.get_last_error();

  EXPECT_FALSE(log_config.console_enabled);
  EXPECT_FALSE(log_config.console_colors);
  EXPECT_EQ(log_config.console_level, sluice::logging::severity_level::warn);
  EXPECT_TRUE(log_config.file_enabled);
  EXPECT_EQ(log_config.file_level, sluice::logging::severity_level::info);
  EXPECT_EQ(log_config.file_config.directory, "/tmp/sluice-logs");
  EXPECT_FALSE(log_config.file_config.format_json);
  EXPECT_EQ(log_config.file_config.rotation_size_mb, 5u);
  EXPECT_EQ(log_config.file_config.max_files, 3);
}

TEST_F(ConfigParserTest, LoggingBlockIgnoredWithoutTarget) {
  const std::string yaml = std::string(kMinimalYaml) + R"(
logging:
  console:
    level: nonsense
)";

  ConfigParser parser;
  OutputConfig config;
  EXPECT_TRUE(parser.load_from_string(yaml, config));
}

// ============================================================================
// Invalid YAML Tests
// ============================================================================

TEST_F(ConfigParserTest, MissingFileFails) {
  ConfigParser parser;
  OutputConfig config;
  EXPECT_FALSE(parser.load_from_file((test_dir_ / "missing.yaml").string(), config));
  EXPECT_NE(parser.get_last_error().find("not found"), std::string::npos);
}

TEST_F(ConfigParserTest, MalformedYamlFails) {
  ConfigParser parser;
  OutputConfig config;
  EXPECT_FALSE(parser.load_from_string("bucket: [unterminated", config));
  EXPECT_NE(parser.get_last_error().find("Failed to parse YAML"), std::string::npos);
}

TEST_F(ConfigParserTest, MissingRequiredKeyFails) {
  const std::string yaml = R"(
path_prefix: logs/out
file_ext: .csv
endpoint: http://localhost:9000
)";

  ConfigParser parser;
  OutputConfig config;
  EXPECT_FALSE(parser.load_from_string(yaml, config));
  EXPECT_EQ(parser.get_last_error(), "Missing required key: bucket");
}

TEST_F(ConfigParserTest, WrongValueTypeFails) {
  const std::string yaml = std::string(kMinimalYaml) + "file_buffer_chunk_limit: lots\n";

  ConfigParser parser;
  OutputConfig config;
  EXPECT_FALSE(parser.load_from_string(yaml, config));
}

TEST_F(ConfigParserTest, InvalidLogLevelFails) {
  const std::string yaml = std::string(kMinimalYaml) + R"(
logging:
  file:
    level: verbose
)";

  ConfigParser parser;
  OutputConfig config;
  sluice::logging::LoggingConfig log_config;
  EXPECT_FALSE(parser.load_from_string(yaml, config, &log_config));
  EXPECT_NE(parser.get_last_error().find("verbose"), std::string::npos);
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(ConfigParserTest, ValidateRejectsBadSequenceFormat) {
  const std::string yaml = std::string(kMinimalYaml) + "sequence_format: \"%s\"\n";

  ConfigParser parser;
  OutputConfig config;
  ASSERT_TRUE(parser.load_from_string(yaml, config));

  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("sequence_format"), std::string::npos);
}

TEST_F(ConfigParserTest, ValidateRejectsHalfConfiguredKeys) {
  const std::string yaml = std::string(kMinimalYaml) + "secret_access_key: topsecret\n";

  ConfigParser parser;
  OutputConfig config;
  ASSERT_TRUE(parser.load_from_string(yaml, config));

  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("access_key_id"), std::string::npos);
}

TEST_F(ConfigParserTest, ValidateAcceptsBareHostEndpoint) {
  const std::string yaml = R"(
path_prefix: logs/out
file_ext: .csv
bucket: my-bucket
endpoint: s3-ap-northeast-1.amazonaws.com
)";

  ConfigParser parser;
  OutputConfig config;
  ASSERT_TRUE(parser.load_from_string(yaml, config)) << parser.get_last_error();

  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;
}

TEST_F(ConfigParserTest, ValidateRejectsUnknownEndpointScheme) {
  OutputConfig config;
  config.path_prefix = "logs/out";
  config.bucket = "my-bucket";
  config.endpoint = "ftp://localhost:9000";

  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("endpoint"), std::string::npos);
}

TEST_F(ConfigParserTest, ValidateAcceptsEmptyPathPrefix) {
  const std::string yaml = R"(
path_prefix: ""
file_ext: .csv
bucket: my-bucket
endpoint: http://localhost:9000
)";

  ConfigParser parser;
  OutputConfig config;
  ASSERT_TRUE(parser.load_from_string(yaml, config)) << parser.get_last_error();
  EXPECT_TRUE(config.path_prefix.empty());

  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;
}

TEST_F(ConfigParserTest, ValidateRejectsEmptyBucket) {
  OutputConfig config;
  config.path_prefix = "logs/out";
  config.endpoint = "http://localhost:9000";

  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_EQ(error, "bucket is empty");
}

// ============================================================================
// Redaction
// ============================================================================

TEST_F(ConfigParserTest, ToStringNeverPrintsSecret) {
  OutputConfig config;
  config.bucket = "my-bucket";
  config.access_key_id = "AKIAEXAMPLE";
  config.secret_access_key = "topsecret";

  std::string summary = config.to_string();
  EXPECT_NE(summary.find("bucket=my-bucket"), std::string::npos);
  EXPECT_NE(summary.find("AKIAEXAMPLE"), std::string::npos);
  EXPECT_EQ(summary.find("topsecret"), std::string::npos);
}
