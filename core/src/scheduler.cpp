#include "core/scheduler.h"

#include "core/task_logger.h"
#include "core/worker_pool.h"

#include <atomic>
#include <chrono>
#include <string>
#include <utility>

namespace taskrun::core {
namespace {

std::string next_run_trace_id() {
  static std::atomic<unsigned> counter{0};
  return "run-" + std::to_string(counter.fetch_add(1) + 1);
}

std::string format_summary(const RunSummary &s) {
  return "total=" + std::to_string(s.total) +
         " completed=" + std::to_string(s.completed) +
         " failed=" + std::to_string(s.failed) +
         " pending=" + std::to_string(s.pending) +
         " running=" + std::to_string(s.running);
}

} // namespace

TaskScheduler::TaskScheduler(SchedulerConfig config,
                             std::shared_ptr<ILogger> logger)
    : config_(normalize_config(config)), logger_(std::move(logger)),
      task_logger_(std::make_shared<TaskLogger>(logger_)) {}

SchedulerConfig TaskScheduler::normalize_config(SchedulerConfig config) {
  if (config.worker_count <= 0) {
    config.worker_count = kDefaultWorkerCount;
  }
  return config;
}

Result<void, TaskError> TaskScheduler::add_task(std::shared_ptr<Task> task) {
  if (!task) {
    return Result<void, TaskError>::Err(
        TaskError::Internal("Task must not be null"));
  }

  task->attach(task_logger_);
  std::lock_guard<std::mutex> lock(mutex_);
  tasks_.push_back(std::move(task));
  return Result<void, TaskError>::Ok();
}

Result<void, TaskError> TaskScheduler::run_all() {
  const auto batch = tasks();
  const std::string trace_id = next_run_trace_id();
  if (batch.empty()) {
    return Result<void, TaskError>::Ok();
  }

  if (logger_) {
    logger_->info(trace_id, "scheduler", "run_start",
                  "tasks=" + std::to_string(batch.size()) +
                      " workers=" + std::to_string(config_.worker_count));
  }
  const auto started = std::chrono::steady_clock::now();

  WorkerPool pool(config_.worker_count, logger_, trace_id);
  auto started_pool = pool.start();
  if (started_pool.is_err()) {
    if (logger_) {
      logger_->error(trace_id, "scheduler", "run_aborted",
                     started_pool.error().message);
    }
    return started_pool;
  }

  Result<void, TaskError> outcome = Result<void, TaskError>::Ok();
  for (const auto &task : batch) {
    auto submitted = pool.submit([task]() { task->run(); });
    if (submitted.is_err()) {
      outcome = std::move(submitted);
      break;
    }
  }

  // Wait even if a submit failed: admitted tasks must reach a terminal state.
  auto drained = pool.wait_idle();
  pool.stop();
  if (outcome.is_ok() && drained.is_err()) {
    outcome = std::move(drained);
  }

  if (logger_) {
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started)
            .count();
    const std::string msg = format_summary(summary()) +
                            " elapsed_ms=" + std::to_string(elapsed_ms);
    if (outcome.is_ok()) {
      logger_->info(trace_id, "scheduler", "run_finished", msg);
    } else {
      logger_->error(trace_id, "scheduler", "run_fault",
                     outcome.error().message + " " + msg);
    }
  }
  return outcome;
}

std::vector<std::shared_ptr<Task>> TaskScheduler::tasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_;
}

std::size_t TaskScheduler::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

RunSummary TaskScheduler::summary() const {
  RunSummary s;
  for (const auto &task : tasks()) {
    ++s.total;
    switch (task->status()) {
    case TaskStatus::Pending:
      ++s.pending;
      break;
    case TaskStatus::Running:
      ++s.running;
      break;
    case TaskStatus::Completed:
      ++s.completed;
      break;
    case TaskStatus::Failed:
      ++s.failed;
      break;
    }
  }
  return s;
}

} // namespace taskrun::core
