#include "core/logger.h"
#include "core/scheduler.h"
#include "core/task_factory.h"
#include "infra/config.h"
#include "infra/logger.h"
#include "infra/task_loader.h"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

// Used when neither a path argument nor TASKRUN_TASKS_FILE is given.
const char *kSampleTasks = R"([
  {"task_id": 1, "name": "Send Welcome Email", "type": "email"},
  {"task_id": 2, "name": "Daily DB Backup", "type": "backup"},
  {"task_id": 3, "name": "Sales Report", "type": "report"},
  {"task_id": 4, "name": "Another Email", "type": "email"}
])";

void print_usage(const char *argv0) {
  std::cout << "Usage: " << argv0 << " [tasks.json]\n"
            << "\n"
            << "Runs every task in the JSON array on a bounded worker pool.\n"
            << "Environment: TASKRUN_WORKERS, TASKRUN_TIME_UNIT_MS,\n"
            << "             TASKRUN_TASKS_FILE, TASKRUN_LOG_LEVEL\n";
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc > 2) {
    print_usage(argv[0]);
    return EXIT_FAILURE;
  }
  if (argc == 2 && (std::string(argv[1]) == "-h" ||
                    std::string(argv[1]) == "--help")) {
    print_usage(argv[0]);
    return EXIT_SUCCESS;
  }

  auto logger = std::shared_ptr<taskrun::core::ILogger>(
      taskrun::infra::create_console_logger());

  const auto config = taskrun::infra::AppConfig::from_environment(logger);
  if (!taskrun::infra::set_log_level(config.log_level)) {
    logger->warn("startup", "app", "config_invalid",
                 "Unknown TASKRUN_LOG_LEVEL=" + config.log_level +
                     ", keeping info");
  }

  std::string source = argc == 2 ? argv[1] : config.tasks_file;
  auto loaded = source.empty()
                    ? taskrun::infra::parse_task_descriptions(kSampleTasks)
                    : taskrun::infra::load_task_descriptions(source);
  if (loaded.is_err()) {
    const auto &err = loaded.error();
    logger->error("startup", "app", "load_failed",
                  std::string("[") + taskrun::core::to_string(err.category) +
                      "] " + err.message);
    return EXIT_FAILURE;
  }
  const auto descriptions = std::move(loaded).value();
  logger->info("startup", "app", "tasks_loaded",
               "count=" + std::to_string(descriptions.size()) + " source=" +
                   (source.empty() ? std::string("<built-in sample>") : source));

  taskrun::core::TaskFactory factory(logger, config.time_unit());
  taskrun::core::TaskScheduler scheduler(config.scheduler_config(), logger);

  for (const auto &desc : descriptions) {
    auto created = factory.create_task(desc);
    if (created.is_err()) {
      // Unknown discriminants are skipped; the rest of the batch still runs.
      logger->warn("startup", "app", "task_rejected",
                   "task_id=" + std::to_string(desc.task_id) + " " +
                       created.error().message);
      continue;
    }
    auto added = scheduler.add_task(std::move(created).value());
    if (added.is_err()) {
      logger->error("startup", "app", "task_rejected", added.error().message);
      return EXIT_FAILURE;
    }
  }

  std::cout << "=== Starting Task Scheduler ===" << std::endl;
  auto ran = scheduler.run_all();
  std::cout << "=== All Tasks Finished ===" << std::endl;

  if (ran.is_err()) {
    logger->error("main", "app", "run_failed", ran.error().message);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
