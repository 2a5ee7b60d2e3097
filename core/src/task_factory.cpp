#include "core/task_factory.h"

#include <utility>

namespace taskrun::core {

TaskFactory::TaskFactory(std::shared_ptr<ILogger> logger,
                         std::chrono::milliseconds time_unit) {
  registry_[EmailTask::kType] = [logger, time_unit](const TaskDescription &d) {
    return std::make_shared<EmailTask>(d.task_id, d.name, time_unit, logger);
  };
  registry_[BackupTask::kType] = [logger, time_unit](const TaskDescription &d) {
    return std::make_shared<BackupTask>(d.task_id, d.name, time_unit, logger);
  };
  registry_[ReportTask::kType] = [logger, time_unit](const TaskDescription &d) {
    return std::make_shared<ReportTask>(d.task_id, d.name, time_unit, logger);
  };
}

Result<std::shared_ptr<Task>, TaskError>
TaskFactory::create_task(const TaskDescription &desc) const {
  auto it = registry_.find(desc.type);
  if (it == registry_.end()) {
    return Result<std::shared_ptr<Task>, TaskError>::Err(
        TaskError::UnknownTaskType(desc.type));
  }

  auto task = it->second(desc);
  if (!task) {
    return Result<std::shared_ptr<Task>, TaskError>::Err(TaskError::Internal(
        "Creator for type '" + desc.type + "' returned null"));
  }
  return Result<std::shared_ptr<Task>, TaskError>::Ok(std::move(task));
}

Result<void, TaskError> TaskFactory::register_type(const std::string &type,
                                                   Creator creator) {
  if (type.empty()) {
    return Result<void, TaskError>::Err(
        TaskError::Internal("Task type must not be empty"));
  }
  if (!creator) {
    return Result<void, TaskError>::Err(
        TaskError::Internal("Creator must not be null for type: " + type));
  }
  registry_[type] = std::move(creator);
  return Result<void, TaskError>::Ok();
}

bool TaskFactory::has_type(const std::string &type) const {
  return registry_.find(type) != registry_.end();
}

std::vector<std::string> TaskFactory::types() const {
  std::vector<std::string> out;
  out.reserve(registry_.size());
  for (const auto &entry : registry_) {
    out.push_back(entry.first);
  }
  return out;
}

} // namespace taskrun::core
