#pragma once

#include "core/logger.h"
#include "core/observer.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace taskrun::core {

inline constexpr int kDefaultWorkerCount = 5;

/// Scheduler runtime configuration.
struct SchedulerConfig {
  int worker_count = kDefaultWorkerCount; // <= 0 falls back to the default
};

/// Status counts over the scheduler's tasks.
struct RunSummary {
  std::size_t total = 0;
  std::size_t pending = 0;
  std::size_t running = 0;
  std::size_t completed = 0;
  std::size_t failed = 0;
};

/// TaskScheduler — owns a set of tasks and runs them on a bounded pool.
///
/// add_task() attaches the scheduler's shared TaskLogger before anything
/// else can, so it is always the first observer notified.
///
/// run_all() blocks until every task has finished running. A task that
/// fails is contained in its own Failed status: siblings keep running and
/// run_all() still returns Ok. Only faults of the dispatch machinery
/// itself come back as Err(Orchestration).
///
/// add_task() and run_all() must not be called concurrently with each
/// other.
class TaskScheduler {
public:
  explicit TaskScheduler(SchedulerConfig config = {},
                         std::shared_ptr<ILogger> logger = nullptr);

  /// Attach the shared TaskLogger, then append. Err(Internal) on null.
  Result<void, TaskError> add_task(std::shared_ptr<Task> task);

  /// Run every task on a pool of config().worker_count workers, admitting
  /// them in insertion order, and wait for all of them.
  [[nodiscard]] Result<void, TaskError> run_all();

  [[nodiscard]] std::vector<std::shared_ptr<Task>> tasks() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] RunSummary summary() const;
  [[nodiscard]] const SchedulerConfig &config() const noexcept {
    return config_;
  }

  /// The observer attached to every task by add_task().
  [[nodiscard]] std::shared_ptr<ITaskObserver> task_logger() const {
    return task_logger_;
  }

private:
  static SchedulerConfig normalize_config(SchedulerConfig config);

  const SchedulerConfig config_;
  std::shared_ptr<ILogger> logger_;
  std::shared_ptr<ITaskObserver> task_logger_;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Task>> tasks_;
};

} // namespace taskrun::core
