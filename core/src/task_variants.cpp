#include "core/task_variants.h"

#include <thread>
#include <utility>

namespace taskrun::core {

SimulatedTask::SimulatedTask(int id, std::string name, std::string kind,
                             std::chrono::milliseconds duration,
                             std::string completion_message,
                             std::shared_ptr<ILogger> logger)
    : Task(id, std::move(name)), kind_(std::move(kind)), duration_(duration),
      completion_message_(std::move(completion_message)),
      logger_(std::move(logger)) {}

Result<void, TaskError> SimulatedTask::execute() {
  std::this_thread::sleep_for(duration_);

  if (logger_) {
    logger_->info("task-" + std::to_string(id()), component(), "work_done",
                  completion_message_);
  }
  return Result<void, TaskError>::Ok();
}

// ---- Variants ----

EmailTask::EmailTask(int id, std::string name,
                     std::chrono::milliseconds time_unit,
                     std::shared_ptr<ILogger> logger)
    : SimulatedTask(id, std::move(name), kType, time_unit * kDurationUnits,
                    "Sending email for Task " + std::to_string(id),
                    std::move(logger)) {}

BackupTask::BackupTask(int id, std::string name,
                       std::chrono::milliseconds time_unit,
                       std::shared_ptr<ILogger> logger)
    : SimulatedTask(id, std::move(name), kType, time_unit * kDurationUnits,
                    "Backing up data for Task " + std::to_string(id),
                    std::move(logger)) {}

ReportTask::ReportTask(int id, std::string name,
                       std::chrono::milliseconds time_unit,
                       std::shared_ptr<ILogger> logger)
    : SimulatedTask(id, std::move(name), kType, time_unit * kDurationUnits,
                    "Generating report for Task " + std::to_string(id),
                    std::move(logger)) {}

} // namespace taskrun::core
