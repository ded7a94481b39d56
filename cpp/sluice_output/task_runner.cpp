// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "task_runner.hpp"

#include <exception>
#include <memory>
#include <thread>
#include <utility>

#include "output_errors.hpp"

#define SLUICE_LOG_COMPONENT "task_runner"
#include <sluice_log_macros.hpp>

namespace sluice {
namespace output {

TaskRunner::TaskRunner(TransactionCoordinator& coordinator, ThreadLauncher launcher)
    : coordinator_(coordinator)
    , launcher_(std::move(launcher)) {
  if (!launcher_) {
    launcher_ = [](std::function<void()> work) {
      return std::thread(std::move(work));
    };
  }
}

std::vector<TaskReport> TaskRunner::runAll(
  const TaskSource& task_source, int task_count, const TaskBody& task_body
) {
  if (task_count <= 0) {
    throw ConfigurationError("task count must be positive, got " + std::to_string(task_count));
  }

  std::vector<TaskReport> reports(static_cast<size_t>(task_count));
  std::vector<std::exception_ptr> failures(static_cast<size_t>(task_count));
  std::vector<std::thread> threads;
  threads.reserve(static_cast<size_t>(task_count));

  auto join_started = [&threads]() {
    for (auto& thread : threads) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  };

  try {
    for (int i = 0; i < task_count; ++i) {
      threads.push_back(launcher_([this, &task_source, &task_body, &reports, &failures, i]() {
        SLUICE_LOG_SCOPED_TASK(i);
        try {
          reports[static_cast<size_t>(i)] = runTask(task_source, i, task_body);
        } catch (const std::exception& e) {
          SLUICE_LOG_ERROR("Task failed" << logging::kv("error", e.what()));
          failures[static_cast<size_t>(i)] = std::current_exception();
        } catch (...) {
          SLUICE_LOG_ERROR("Task failed with a non-standard exception");
          failures[static_cast<size_t>(i)] = std::current_exception();
        }
      }));
    }
  } catch (const std::exception& e) {
    SLUICE_LOG_ERROR(
      "Failed to start task thread" << logging::kv("started", threads.size())
                                    << logging::kv("error", e.what())
    );
    join_started();
    throw;
  }

  join_started();

  for (const auto& failure : failures) {
    if (failure) {
      std::rethrow_exception(failure);
    }
  }
  return reports;
}

TaskReport TaskRunner::runTask(
  const TaskSource& task_source, int task_index, const TaskBody& task_body
) {
  std::unique_ptr<ChunkWriter> writer = coordinator_.open(task_source, task_index);
  TaskReport report;

  try {
    task_body(task_index, *writer);
    writer->finish();
    report = writer->commit();
  } catch (...) {
    writer->abort();
    writer->close();
    throw;
  }
  writer->close();

  SLUICE_LOG_DEBUG("Task committed" << logging::kv("chunks", writer->fileIndex()));
  return report;
}

}  // namespace output
}  // namespace sluice
