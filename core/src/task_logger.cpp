#include "core/task_logger.h"

#include "core/task.h"

#include <string>
#include <utility>

namespace taskrun::core {

TaskLogger::TaskLogger(std::shared_ptr<ILogger> logger)
    : logger_(std::move(logger)) {}

void TaskLogger::on_transition(const Task &task, TaskStatus old_status,
                               TaskStatus new_status) {
  if (!logger_) {
    return;
  }

  const std::string trace_id = "task-" + std::to_string(task.id());
  std::string msg = "Task " + std::to_string(task.id()) + " (" + task.name() +
                    ") status changed: " + to_string(old_status) + " -> " +
                    to_string(new_status);

  if (new_status == TaskStatus::Failed) {
    const auto err = task.error();
    if (err.has_value()) {
      msg += " [" + std::string(to_string(err->category)) + "] " + err->message;
    }
    logger_->warn(trace_id, "task_logger", "task_status_changed", msg);
    return;
  }

  logger_->info(trace_id, "task_logger", "task_status_changed", msg);
}

} // namespace taskrun::core
