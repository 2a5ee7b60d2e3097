#pragma once

#include "core/logger.h"
#include "core/scheduler.h"
#include "core/task_variants.h"

#include <chrono>
#include <memory>
#include <string>

namespace taskrun::infra {

/// Application configuration, read from the environment.
///
///   TASKRUN_WORKERS       worker pool size (> 0), default 5
///   TASKRUN_TIME_UNIT_MS  length of one simulated time unit (> 0), default 1000
///   TASKRUN_TASKS_FILE    task document used when no path is given on the
///                         command line
///   TASKRUN_LOG_LEVEL     spdlog level name (trace/debug/info/warn/err/off)
struct AppConfig {
  int worker_count = core::kDefaultWorkerCount;
  int time_unit_ms = static_cast<int>(core::kDefaultTimeUnit.count());
  std::string tasks_file;
  std::string log_level = "info";

  /// Invalid values are reported through `logger` and replaced by the
  /// default.
  static AppConfig
  from_environment(const std::shared_ptr<core::ILogger> &logger = nullptr);

  [[nodiscard]] core::SchedulerConfig scheduler_config() const;
  [[nodiscard]] std::chrono::milliseconds time_unit() const {
    return std::chrono::milliseconds(time_unit_ms);
  }
};

/// Parse a positive integer environment variable. Unset or empty returns
/// `fallback` silently; anything else that is not a positive integer is
/// logged as a warning and returns `fallback`.
int parse_env_int(const char *name, int fallback,
                  const std::shared_ptr<core::ILogger> &logger);

} // namespace taskrun::infra
