// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_TRANSACTION_COORDINATOR_HPP
#define SLUICE_TRANSACTION_COORDINATOR_HPP

#include <functional>
#include <memory>
#include <vector>

#include "chunk_writer.hpp"
#include "output_config.hpp"
#include "output_interfaces.hpp"

namespace sluice {
namespace output {

/**
 * Completion marker of a transaction or resume attempt
 */
struct TransactionResult {
  int task_count = 0;
  std::vector<TaskReport> reports;
};

/**
 * Runs every task index in [0, task_count) with the saved TaskSource and
 * returns one report per committed task.
 */
using TaskRunFn = std::function<std::vector<TaskReport>(const TaskSource& task_source)>;

/**
 * Creates the object store client of one task
 */
using UploaderFactory =
  std::function<std::unique_ptr<IObjectUploader>(const OutputConfig& config)>;

/**
 * Transaction handshake of the output.
 *
 * transaction() validates the configuration and derives the TaskSource once;
 * resume() re-runs the tasks with that same TaskSource, so every attempt maps
 * (task_index, file_index) to the same object keys.
 */
class TransactionCoordinator {
public:
  /**
   * @param uploader_factory Client factory, S3Client when empty
   */
  explicit TransactionCoordinator(UploaderFactory uploader_factory = nullptr);

  /**
   * Validate the configuration, derive the TaskSource and run the tasks.
   *
   * @throws ConfigurationError before any task runs
   */
  TransactionResult transaction(const OutputConfig& config, int task_count, const TaskRunFn& run_tasks);

  /**
   * Re-run the tasks of a previous attempt with its saved TaskSource
   */
  TransactionResult resume(const TaskSource& task_source, int task_count, const TaskRunFn& run_tasks);

  /**
   * Hook called after the pipeline committed the transaction; nothing to do
   */
  void cleanup(
    const TaskSource& task_source, int task_count, const std::vector<TaskReport>& success_reports
  );

  /**
   * Create the ChunkWriter of one task, with its own uploader
   *
   * @throws AuthenticationError if the uploader cannot reach the bucket
   */
  std::unique_ptr<ChunkWriter> open(const TaskSource& task_source, int task_index);

  /**
   * Validate a configuration and derive the TaskSource handed to tasks.
   *
   * @throws ConfigurationError on missing keys, bad credential pairing, bad
   *         sequence format or a non-positive task count
   */
  static TaskSource buildTaskSource(const OutputConfig& config, int task_count);

private:
  UploaderFactory uploader_factory_;
};

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_TRANSACTION_COORDINATOR_HPP
