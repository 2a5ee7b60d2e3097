#include "core/worker_pool.h"

#include <exception>
#include <system_error>
#include <utility>

namespace taskrun::core {

WorkerPool::WorkerPool(int worker_count, std::shared_ptr<ILogger> logger,
                       std::string trace_id)
    : worker_count_(worker_count > 0 ? worker_count : 1),
      logger_(std::move(logger)), trace_id_(std::move(trace_id)) {}

WorkerPool::~WorkerPool() { stop(); }

Result<void, TaskError> WorkerPool::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
      return Result<void, TaskError>::Err(
          TaskError::Orchestration("Worker pool already started"));
    }
    started_ = true;
    stopping_ = false;
  }

  workers_.reserve(static_cast<size_t>(worker_count_));
  try {
    for (int i = 0; i < worker_count_; ++i) {
      workers_.emplace_back([this, i]() { worker_loop(i); });
    }
  } catch (const std::system_error &e) {
    const std::string msg = "Failed to spawn worker " +
                            std::to_string(workers_.size()) + "/" +
                            std::to_string(worker_count_) + ": " + e.what();
    if (logger_) {
      logger_->error(trace_id_, "worker_pool", "spawn_failed", msg);
    }
    stop();
    return Result<void, TaskError>::Err(TaskError::Orchestration(msg));
  }

  if (logger_) {
    logger_->debug(trace_id_, "worker_pool", "started",
                   "workers=" + std::to_string(worker_count_));
  }
  return Result<void, TaskError>::Ok();
}

Result<void, TaskError> WorkerPool::submit(Job job) {
  if (!job) {
    return Result<void, TaskError>::Err(
        TaskError::Internal("Job must not be empty"));
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_ || stopping_) {
      return Result<void, TaskError>::Err(
          TaskError::Orchestration("Worker pool is not running"));
    }
    queue_.push_back(std::move(job));
  }
  work_cv_.notify_one();
  return Result<void, TaskError>::Ok();
}

Result<void, TaskError> WorkerPool::wait_idle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this]() {
    return (queue_.empty() && active_ == 0) || stopping_;
  });

  if (!first_fault_.empty()) {
    return Result<void, TaskError>::Err(TaskError::Orchestration(first_fault_));
  }
  return Result<void, TaskError>::Ok();
}

void WorkerPool::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ && workers_.empty()) {
      return;
    }
    stopping_ = true;
  }
  work_cv_.notify_all();
  idle_cv_.notify_all();

  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();

  std::lock_guard<std::mutex> lock(mutex_);
  queue_.clear();
}

std::size_t WorkerPool::queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool WorkerPool::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_ && !stopping_;
}

void WorkerPool::worker_loop(int worker_index) {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (stopping_) {
        return;
      }
      job = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }

    std::string fault;
    try {
      job();
    } catch (const std::exception &e) {
      fault = std::string("Job escaped with exception: ") + e.what();
    } catch (...) {
      fault = "Job escaped with a non-standard exception";
    }

    if (!fault.empty() && logger_) {
      logger_->error(trace_id_, "worker_pool", "job_fault",
                     "worker=" + std::to_string(worker_index) + " " + fault);
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --active_;
      if (!fault.empty() && first_fault_.empty()) {
        first_fault_ = std::move(fault);
      }
    }
    idle_cv_.notify_all();
  }
}

} // namespace taskrun::core
