#pragma once

#include "core/observer.h"
#include "core/result.h"
#include "core/task_error.h"
#include "core/task_status.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskrun::core {

/// A unit of work with identity, a name and a lifecycle status.
///
/// Status changes only from inside run(): Pending -> Running, then
/// Completed or Failed depending on the outcome of the variant's work step.
/// Every transition is pushed synchronously to the attached observers, in
/// attachment order, before run() continues.
///
/// run() never lets a work-step fault escape; callers inspect status() and
/// error() afterwards. A std::exception thrown by an observer is caught,
/// does not stop the remaining observers and is kept in observer_fault().
class Task {
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  Task(int id, std::string name);
  virtual ~Task() = default;

  Task(const Task &) = delete;
  Task &operator=(const Task &) = delete;

  [[nodiscard]] int id() const noexcept { return id_; }
  [[nodiscard]] const std::string &name() const noexcept { return name_; }
  [[nodiscard]] TaskStatus status() const noexcept;
  [[nodiscard]] TimePoint created_at() const noexcept { return created_at_; }
  [[nodiscard]] std::optional<TimePoint> started_at() const;
  [[nodiscard]] std::optional<TimePoint> finished_at() const;

  /// Error recorded by the Failed transition, if any.
  [[nodiscard]] std::optional<TaskError> error() const;

  /// First exception message thrown by an observer, if any.
  [[nodiscard]] std::optional<std::string> observer_fault() const;

  /// Discriminant of the concrete variant (e.g. "email").
  [[nodiscard]] virtual std::string kind() const = 0;

  /// Append an observer. The same observer attached twice is notified twice.
  void attach(std::shared_ptr<ITaskObserver> observer);

  [[nodiscard]] std::size_t observer_count() const;

  /// Drive the task through its lifecycle. Returns the terminal status.
  /// Calling run() on a task that already left Pending does nothing and
  /// returns the current status.
  TaskStatus run();

protected:
  /// Variant-specific work step. Ok -> Completed, Err -> Failed.
  virtual Result<void, TaskError> execute() = 0;

  /// Sole mutation path for status. Rejects illegal transitions with an
  /// Internal error, leaving status untouched and observers uncalled.
  [[nodiscard]] Result<void, TaskError> set_status(TaskStatus new_status);

private:
  void finish(TaskStatus terminal);

  const int id_;
  const std::string name_;
  const TimePoint created_at_;

  std::atomic<TaskStatus> status_{TaskStatus::Pending};

  mutable std::mutex mutex_; // guards everything below
  std::vector<std::shared_ptr<ITaskObserver>> observers_;
  std::optional<TimePoint> started_at_;
  std::optional<TimePoint> finished_at_;
  std::optional<TaskError> error_;
  std::optional<std::string> observer_fault_;
};

} // namespace taskrun::core
