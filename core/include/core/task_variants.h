#pragma once

#include "core/logger.h"
#include "core/task.h"

#include <chrono>
#include <memory>
#include <string>

namespace taskrun::core {

/// Length of one unit of simulated work unless configured otherwise.
inline constexpr std::chrono::milliseconds kDefaultTimeUnit{1000};

/// Task whose work step is a fixed delay standing in for blocking I/O,
/// followed by a completion line written to the logger.
class SimulatedTask : public Task {
public:
  SimulatedTask(int id, std::string name, std::string kind,
                std::chrono::milliseconds duration,
                std::string completion_message,
                std::shared_ptr<ILogger> logger);

  [[nodiscard]] std::string kind() const override { return kind_; }
  [[nodiscard]] std::chrono::milliseconds duration() const noexcept {
    return duration_;
  }
  [[nodiscard]] const std::string &completion_message() const noexcept {
    return completion_message_;
  }

protected:
  Result<void, TaskError> execute() override;

  /// Component name used for the completion line, e.g. "EmailTask".
  [[nodiscard]] virtual std::string component() const { return "SimulatedTask"; }

private:
  const std::string kind_;
  const std::chrono::milliseconds duration_;
  const std::string completion_message_;
  std::shared_ptr<ILogger> logger_;
};

/// "email": 2 time units.
class EmailTask final : public SimulatedTask {
public:
  static constexpr const char *kType = "email";
  static constexpr int kDurationUnits = 2;

  EmailTask(int id, std::string name,
            std::chrono::milliseconds time_unit = kDefaultTimeUnit,
            std::shared_ptr<ILogger> logger = nullptr);

protected:
  [[nodiscard]] std::string component() const override { return "EmailTask"; }
};

/// "backup": 3 time units.
class BackupTask final : public SimulatedTask {
public:
  static constexpr const char *kType = "backup";
  static constexpr int kDurationUnits = 3;

  BackupTask(int id, std::string name,
             std::chrono::milliseconds time_unit = kDefaultTimeUnit,
             std::shared_ptr<ILogger> logger = nullptr);

protected:
  [[nodiscard]] std::string component() const override {
    return "BackupTask";
  }
};

/// "report": 1 time unit.
class ReportTask final : public SimulatedTask {
public:
  static constexpr const char *kType = "report";
  static constexpr int kDurationUnits = 1;

  ReportTask(int id, std::string name,
             std::chrono::milliseconds time_unit = kDefaultTimeUnit,
             std::shared_ptr<ILogger> logger = nullptr);

protected:
  [[nodiscard]] std::string component() const override {
    return "ReportTask";
  }
};

} // namespace taskrun::core
