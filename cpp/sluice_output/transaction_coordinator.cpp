// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transaction_coordinator.hpp"

#include <utility>

#include "credentials.hpp"
#include "key_namer.hpp"
#include "output_errors.hpp"
#include "s3_client.hpp"

#define SLUICE_LOG_COMPONENT "transaction"
#include <sluice_log_macros.hpp>

namespace sluice {
namespace output {

TransactionCoordinator::TransactionCoordinator(UploaderFactory uploader_factory)
    : uploader_factory_(std::move(uploader_factory)) {
  if (!uploader_factory_) {
    uploader_factory_ = [](const OutputConfig& config) -> std::unique_ptr<IObjectUploader> {
      return std::make_unique<S3Client>(config);
    };
  }
}

TaskSource TransactionCoordinator::buildTaskSource(const OutputConfig& config, int task_count) {
  if (config.bucket.empty()) {
    throw ConfigurationError("bucket is required");
  }
  if (config.endpoint.empty()) {
    throw ConfigurationError("endpoint is required");
  }
  if (task_count <= 0) {
    throw ConfigurationError(
      "task count must be positive, got " + std::to_string(task_count)
    );
  }

  validateCredentialPairing(config);
  KeyNamer::validateSequenceFormat(config.sequence_format);

  TaskSource task_source;
  task_source.config = config;
  task_source.per_task_chunk_limit =
    config.file_buffer_chunk_limit / static_cast<uint64_t>(task_count);
  return task_source;
}

TransactionResult TransactionCoordinator::transaction(
  const OutputConfig& config, int task_count, const TaskRunFn& run_tasks
) {
  TaskSource task_source = buildTaskSource(config, task_count);

  SLUICE_LOG_INFO(
    "Starting transaction" << logging::kv("tasks", task_count)
                           << logging::kv("per_task_chunk_limit", task_source.per_task_chunk_limit)
                           << logging::kv("config", config.to_string())
  );

  return resume(task_source, task_count, run_tasks);
}

TransactionResult TransactionCoordinator::resume(
  const TaskSource& task_source, int task_count, const TaskRunFn& run_tasks
) {
  if (!run_tasks) {
    throw InvalidStateError("resume requires a task runner");
  }

  TransactionResult result;
  result.task_count = task_count;
  result.reports = run_tasks(task_source);

  SLUICE_LOG_INFO(
    "Tasks completed" << logging::kv("tasks", task_count)
                      << logging::kv("reports", result.reports.size())
  );
  return result;
}

void TransactionCoordinator::cleanup(
  const TaskSource& /*task_source*/, int /*task_count*/,
  const std::vector<TaskReport>& /*success_reports*/
) {}

std::unique_ptr<ChunkWriter> TransactionCoordinator::open(
  const TaskSource& task_source, int task_index
) {
  std::unique_ptr<IObjectUploader> uploader = uploader_factory_(task_source.config);
  if (!uploader) {
    throw InvalidStateError(
      "uploader factory returned no client for task " + std::to_string(task_index)
    );
  }
  return std::make_unique<ChunkWriter>(task_index, task_source, std::move(uploader));
}

}  // namespace output
}  // namespace sluice
