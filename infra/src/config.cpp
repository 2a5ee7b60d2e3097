#include "infra/config.h"

#include <cstdlib>

namespace taskrun::infra {

int parse_env_int(const char *name, int fallback,
                  const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  char *end = nullptr;
  const long value = std::strtol(raw, &end, 10);
  const bool valid = end && *end == 0 && value > 0 && value <= 1000000;
  if (!valid) {
    if (logger) {
      logger->warn("startup", "config", "config_invalid",
                   std::string("Invalid value for ") + name + "=" + raw +
                       ", fallback=" + std::to_string(fallback));
    }
    return fallback;
  }

  return static_cast<int>(value);
}

AppConfig AppConfig::from_environment(
    const std::shared_ptr<core::ILogger> &logger) {
  AppConfig config;

  config.worker_count =
      parse_env_int("TASKRUN_WORKERS", config.worker_count, logger);
  config.time_unit_ms =
      parse_env_int("TASKRUN_TIME_UNIT_MS", config.time_unit_ms, logger);

  const char *tasks_file = std::getenv("TASKRUN_TASKS_FILE");
  if (tasks_file && tasks_file[0] != '\0') {
    config.tasks_file = tasks_file;
  }

  const char *log_level = std::getenv("TASKRUN_LOG_LEVEL");
  if (log_level && log_level[0] != '\0') {
    config.log_level = log_level;
  }

  return config;
}

core::SchedulerConfig AppConfig::scheduler_config() const {
  core::SchedulerConfig cfg;
  cfg.worker_count = worker_count;
  return cfg;
}

} // namespace taskrun::infra
