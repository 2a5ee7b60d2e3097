#pragma once

#include "core/logger.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"
#include "core/task_variants.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace taskrun::core {

/// Untyped description of a task, as read from a task document.
struct TaskDescription {
  int task_id = 0;
  std::string name;
  std::string type; // discriminant: "email", "backup", "report", ...
};

/// Maps a description's discriminant to the constructor of a task variant.
///
/// The registry is an explicit map built in the constructor; registering a
/// new variant means adding one entry here (or via register_type()).
/// Only the discriminant is validated; task_id uniqueness and name
/// contents are the caller's business.
class TaskFactory {
public:
  using Creator =
      std::function<std::shared_ptr<Task>(const TaskDescription &desc)>;

  /// Registers the built-in variants. `logger` receives their completion
  /// lines; `time_unit` scales their simulated durations.
  explicit TaskFactory(std::shared_ptr<ILogger> logger = nullptr,
                       std::chrono::milliseconds time_unit = kDefaultTimeUnit);

  /// Build the variant selected by desc.type.
  /// Err(UnknownTaskType) with details["type"] when the type is not
  /// registered; no task is constructed in that case.
  [[nodiscard]] Result<std::shared_ptr<Task>, TaskError>
  create_task(const TaskDescription &desc) const;

  /// Add or replace a discriminant. Err(Internal) on empty type or null
  /// creator.
  Result<void, TaskError> register_type(const std::string &type,
                                        Creator creator);

  [[nodiscard]] bool has_type(const std::string &type) const;

  /// Registered discriminants, sorted.
  [[nodiscard]] std::vector<std::string> types() const;

private:
  std::map<std::string, Creator> registry_;
};

} // namespace taskrun::core
