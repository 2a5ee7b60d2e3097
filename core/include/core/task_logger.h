#pragma once

#include "core/logger.h"
#include "core/observer.h"

#include <memory>

namespace taskrun::core {

/// Default observer: one log line per transition.
///   Task 1 (Send Welcome Email) status changed: Pending -> Running
/// Holds no per-task state; a single instance is shared by every task a
/// scheduler owns.
class TaskLogger final : public ITaskObserver {
public:
  explicit TaskLogger(std::shared_ptr<ILogger> logger);

  void on_transition(const Task &task, TaskStatus old_status,
                     TaskStatus new_status) override;

private:
  std::shared_ptr<ILogger> logger_;
};

} // namespace taskrun::core
