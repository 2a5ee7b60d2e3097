#include "core/task.h"

#include <exception>
#include <utility>

namespace taskrun::core {

const char *to_string(TaskStatus status) {
  switch (status) {
  case TaskStatus::Pending:
    return "Pending";
  case TaskStatus::Running:
    return "Running";
  case TaskStatus::Completed:
    return "Completed";
  case TaskStatus::Failed:
    return "Failed";
  }
  return "Unknown";
}

bool is_terminal(TaskStatus status) {
  return status == TaskStatus::Completed || status == TaskStatus::Failed;
}

bool is_legal_transition(TaskStatus from, TaskStatus to) {
  switch (from) {
  case TaskStatus::Pending:
    return to == TaskStatus::Running;
  case TaskStatus::Running:
    return to == TaskStatus::Completed || to == TaskStatus::Failed;
  case TaskStatus::Completed:
  case TaskStatus::Failed:
    return false;
  }
  return false;
}

Task::Task(int id, std::string name)
    : id_(id), name_(std::move(name)), created_at_(Clock::now()) {}

TaskStatus Task::status() const noexcept {
  return status_.load(std::memory_order_acquire);
}

std::optional<Task::TimePoint> Task::started_at() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_at_;
}

std::optional<Task::TimePoint> Task::finished_at() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finished_at_;
}

std::optional<TaskError> Task::error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

void Task::attach(std::shared_ptr<ITaskObserver> observer) {
  if (!observer) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  observers_.push_back(std::move(observer));
}

std::optional<std::string> Task::observer_fault() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return observer_fault_;
}

std::size_t Task::observer_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return observers_.size();
}

Result<void, TaskError> Task::set_status(TaskStatus new_status) {
  TaskStatus old_status = status_.load(std::memory_order_acquire);
  // CAS so that two concurrent run() calls cannot both leave Pending.
  do {
    if (!is_legal_transition(old_status, new_status)) {
      return Result<void, TaskError>::Err(TaskError::Internal(
          std::string("Illegal status transition: ") + to_string(old_status) +
          " -> " + to_string(new_status) +
          " (task_id=" + std::to_string(id_) + ")"));
    }
  } while (!status_.compare_exchange_weak(old_status, new_status,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire));

  std::vector<std::shared_ptr<ITaskObserver>> observers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (new_status == TaskStatus::Running) {
      started_at_ = Clock::now();
    }
    if (is_terminal(new_status)) {
      finished_at_ = Clock::now();
    }
    observers = observers_;
  }

  for (const auto &observer : observers) {
    try {
      observer->on_transition(*this, old_status, new_status);
    } catch (const std::exception &e) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!observer_fault_.has_value()) {
        observer_fault_ = std::string("Observer threw on ") +
                          to_string(new_status) + ": " + e.what();
      }
    }
  }
  return Result<void, TaskError>::Ok();
}

TaskStatus Task::run() {
  auto outcome = Result<void, TaskError>::Ok();
  try {
    auto running = set_status(TaskStatus::Running);
    if (running.is_err()) {
      // Already started by another caller, or already terminal.
      return status();
    }
    outcome = execute();
  } catch (const std::exception &e) {
    outcome = Result<void, TaskError>::Err(
        TaskError::Execution(std::string("Work step threw: ") + e.what()));
  } catch (...) {
    outcome = Result<void, TaskError>::Err(TaskError::Execution(
        "Work step threw a non-standard exception"));
  }

  if (outcome.is_ok()) {
    finish(TaskStatus::Completed);
  } else {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      error_ = outcome.error();
    }
    finish(TaskStatus::Failed);
  }
  return status();
}

void Task::finish(TaskStatus terminal) {
  auto finished = set_status(terminal);
  if (finished.is_err()) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = finished.error();
  }
}

} // namespace taskrun::core
