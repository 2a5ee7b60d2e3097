#pragma once

#include "core/task_status.h"

namespace taskrun::core {

class Task;

/// Receives every status transition of the tasks it is attached to.
///
/// Invoked synchronously on the thread executing the task, so a slow
/// observer delays that task. One instance may be attached to many tasks
/// and must tolerate concurrent calls. Implementations must not throw and
/// must not mutate the task.
class ITaskObserver {
public:
  virtual ~ITaskObserver() = default;

  virtual void on_transition(const Task &task, TaskStatus old_status,
                             TaskStatus new_status) = 0;
};

} // namespace taskrun::core
