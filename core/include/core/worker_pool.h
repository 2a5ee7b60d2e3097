#pragma once

#include "core/logger.h"
#include "core/result.h"
#include "core/task_error.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace taskrun::core {

/// Fixed-size pool of worker threads fed from a FIFO queue.
///
/// Jobs are admitted in submission order as workers become free; at most
/// worker_count() jobs execute at any instant. Completion order is not
/// guaranteed.
///
/// An exception escaping a job does not stop the pool; the first one is
/// kept and reported by wait_idle() as an Orchestration error.
class WorkerPool {
public:
  using Job = std::function<void()>;

  explicit WorkerPool(int worker_count,
                      std::shared_ptr<ILogger> logger = nullptr,
                      std::string trace_id = "pool");
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Spawn the worker threads. Err(Orchestration) if a thread cannot be
  /// created; threads already spawned are joined before returning.
  [[nodiscard]] Result<void, TaskError> start();

  /// Enqueue a job. Err(Orchestration) if the pool is not running.
  Result<void, TaskError> submit(Job job);

  /// Block until the queue is empty and no job is executing.
  [[nodiscard]] Result<void, TaskError> wait_idle();

  /// Workers finish their current job and exit; jobs never admitted are
  /// dropped. Idempotent; also called by the destructor.
  void stop();

  [[nodiscard]] int worker_count() const noexcept { return worker_count_; }
  [[nodiscard]] std::size_t queued() const;
  [[nodiscard]] bool running() const;

private:
  void worker_loop(int worker_index);

  const int worker_count_;
  std::shared_ptr<ILogger> logger_;
  const std::string trace_id_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_; // signalled on submit / stop
  std::condition_variable idle_cv_; // signalled when a job finishes
  std::deque<Job> queue_;
  int active_ = 0;
  bool started_ = false;
  bool stopping_ = false;
  std::string first_fault_;

  std::vector<std::thread> workers_;
};

} // namespace taskrun::core
