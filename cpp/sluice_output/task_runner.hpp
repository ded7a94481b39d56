// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_TASK_RUNNER_HPP
#define SLUICE_TASK_RUNNER_HPP

#include <functional>
#include <thread>
#include <vector>

#include "chunk_writer.hpp"
#include "transaction_coordinator.hpp"

namespace sluice {
namespace output {

/**
 * Feeds one task's data into its writer via nextFile()/add()
 */
using TaskBody = std::function<void(int task_index, ChunkWriter& writer)>;

/**
 * Runs the tasks of a transaction in parallel, one thread per task.
 *
 * Each thread opens its ChunkWriter through the coordinator, runs the body,
 * then finishes and commits the writer; on failure the writer is aborted.
 * Either way it is closed before the thread ends.
 *
 * Usage:
 *   TransactionCoordinator coordinator;
 *   TaskRunner runner(coordinator);
 *   coordinator.transaction(config, 4, [&](const TaskSource& source) {
 *     return runner.runAll(source, 4, body);
 *   });
 */
/**
 * Starts the thread for one task; may throw std::system_error
 */
using ThreadLauncher = std::function<std::thread(std::function<void()> work)>;

class TaskRunner {
public:
  /**
   * @param coordinator Opens the writer for each task
   * @param launcher Thread factory (nullptr = std::thread)
   */
  explicit TaskRunner(TransactionCoordinator& coordinator, ThreadLauncher launcher = nullptr);

  /**
   * Run task indices [0, task_count) and wait for all of them.
   *
   * @return One report per task, in task order
   * @throws The failure of the lowest failed task index, after every task ended
   * @throws std::system_error if a thread cannot be started, after the
   *         already started tasks ended
   */
  std::vector<TaskReport> runAll(const TaskSource& task_source, int task_count, const TaskBody& task_body);

private:
  TaskReport runTask(const TaskSource& task_source, int task_index, const TaskBody& task_body);

  TransactionCoordinator& coordinator_;
  ThreadLauncher launcher_;
};

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_TASK_RUNNER_HPP
