// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// sluice_upload - Stream local files into chunked objects on S3

#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <config_parser.hpp>
#include <output_errors.hpp>
#include <task_runner.hpp>
#include <transaction_coordinator.hpp>

#define SLUICE_LOG_COMPONENT "sluice_upload"
#include <sluice_log_init.hpp>
#include <sluice_log_macros.hpp>

namespace sluice {
namespace upload {

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitConfigError = 2;

constexpr size_t kDefaultBufferSize = 64 * 1024;

void print_usage(const char* program_name) {
  std::cout
    << "Usage: " << program_name << " --config PATH [OPTIONS] FILE...\n"
    << "\n"
    << "Sluice Upload - Split input files into chunks and upload them to S3\n"
    << "\n"
    << "Options:\n"
    << "  --config PATH         Path to YAML configuration file (required)\n"
    << "  --tasks N             Number of parallel tasks (default: 1)\n"
    << "  --buffer-size BYTES   Read buffer size per add() call (default: 65536)\n"
    << "  --help                Show this help message\n"
    << "\n"
    << "Input files are distributed round robin over the tasks. Every input file\n"
    << "starts a new chunk; chunks are also rotated once they exceed\n"
    << "file_buffer_chunk_limit / tasks bytes.\n"
    << "\n"
    << "Example config file structure:\n"
    << "  path_prefix: logs/out\n"
    << "  file_ext: .csv\n"
    << "  sequence_format: \".%03d.%02d\"\n"
    << "  bucket: my-bucket\n"
    << "  endpoint: http://localhost:9000\n"
    << "  path_style_access: true\n"
    << "  file_buffer_chunk_limit: 104857600\n"
    << "\n"
    << "Examples:\n"
    << "  " << program_name << " --config upload.yaml --tasks 4 data/*.csv\n"
    << std::endl;
}

/**
 * Stream one input file into the writer's current chunk
 */
void stream_file(const std::string& path, size_t buffer_size, output::ChunkWriter& writer) {
  std::ifstream input(path, std::ios::binary);
  if (!input.is_open()) {
    throw output::IOFailure("Cannot open input file " + path);
  }

  writer.nextFile();
  while (input) {
    std::vector<uint8_t> buffer(buffer_size);
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    std::streamsize count = input.gcount();
    if (count <= 0) {
      break;
    }
    buffer.resize(static_cast<size_t>(count));
    writer.add(std::move(buffer));
  }

  if (input.bad()) {
    throw output::IOFailure("Failed to read input file " + path);
  }
}

}  // namespace

}  // namespace upload
}  // namespace sluice

int main(int argc, char* argv[]) {
  using namespace sluice::upload;
  namespace output = sluice::output;
  namespace logging = sluice::logging;

  // Check for help flag
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return kExitSuccess;
    }
  }

  // Step 1: Parse command line arguments
  std::string config_file;
  int task_count = 1;
  size_t buffer_size = kDefaultBufferSize;
  std::vector<std::string> input_files;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--config") == 0) {
      if (i + 1 < argc) {
        config_file = argv[++i];
      } else {
        std::cerr << "Error: --config requires a file argument" << std::endl;
        return kExitConfigError;
      }
    } else if (strcmp(argv[i], "--tasks") == 0) {
      if (i + 1 < argc) {
        task_count = std::atoi(argv[++i]);
      } else {
        std::cerr << "Error: --tasks requires a number argument" << std::endl;
        return kExitConfigError;
      }
    } else if (strcmp(argv[i], "--buffer-size") == 0) {
      if (i + 1 < argc) {
        buffer_size = static_cast<size_t>(std::atol(argv[++i]));
      } else {
        std::cerr << "Error: --buffer-size requires a number argument" << std::endl;
        return kExitConfigError;
      }
    } else if (strncmp(argv[i], "--", 2) == 0) {
      std::cerr << "Error: Unknown argument: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return kExitConfigError;
    } else {
      input_files.push_back(argv[i]);
    }
  }

  if (config_file.empty()) {
    std::cerr << "Error: --config is required" << std::endl;
    print_usage(argv[0]);
    return kExitConfigError;
  }
  if (task_count <= 0) {
    std::cerr << "Error: --tasks must be a positive number" << std::endl;
    return kExitConfigError;
  }
  if (buffer_size == 0) {
    std::cerr << "Error: --buffer-size must be a positive number" << std::endl;
    return kExitConfigError;
  }
  if (input_files.empty()) {
    std::cerr << "Error: At least one input file is required" << std::endl;
    print_usage(argv[0]);
    return kExitConfigError;
  }

  // Step 2: Load and validate the configuration file
  output::OutputConfig config;
  logging::LoggingConfig log_config;
  output::ConfigParser parser;
  if (!parser.load_from_file(config_file, config, &log_config)) {
    std::cerr << "Error: Failed to load config file '" << config_file
              << "': " << parser.get_last_error() << std::endl;
    return kExitConfigError;
  }

  std::string error_msg;
  if (!output::ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    return kExitConfigError;
  }

  // Step 3: Logging
  logging::apply_env_overrides(log_config);
  logging::init_logging(log_config);

  // Step 4: Run the transaction
  int exit_code = kExitSuccess;
  try {
    output::TransactionCoordinator coordinator;
    output::TaskRunner runner(coordinator);

    auto task_body = [&input_files, task_count, buffer_size](
                       int task_index, output::ChunkWriter& writer
                     ) {
      for (size_t f = static_cast<size_t>(task_index); f < input_files.size();
           f += static_cast<size_t>(task_count)) {
        stream_file(input_files[f], buffer_size, writer);
      }
    };

    output::TransactionResult result = coordinator.transaction(
      config, task_count,
      [&runner, task_count, &task_body](const output::TaskSource& task_source) {
        return runner.runAll(task_source, task_count, task_body);
      }
    );

    SLUICE_LOG_INFO(
      "Upload complete" << logging::kv("tasks", result.task_count)
                        << logging::kv("files", input_files.size())
    );
  } catch (const output::ConfigurationError& e) {
    SLUICE_LOG_ERROR("Configuration error" << logging::kv("error", e.what()));
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = kExitConfigError;
  } catch (const std::exception& e) {
    SLUICE_LOG_ERROR("Upload failed" << logging::kv("error", e.what()));
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = kExitFailure;
  }

  logging::shutdown_logging();
  return exit_code;
}
