#pragma once

#include <map>
#include <string>

namespace taskrun::core {

/// Error categories — callers branch on the category, never on the message.
enum class ErrorCategory {
  UnknownTaskType, // Factory: discriminant outside the registered set
  TaskExecution,   // Fault inside a task's work step (contained by Task::run)
  Orchestration,   // Worker pool / dispatch machinery cannot make progress
  InvalidInput,    // Malformed task-description document
  Internal,        // Programming error / invariant violation
  Unknown
};

/// Numeric codes for the categories above, stable for log aggregation.
enum ErrorCode : int {
  kUnknownTaskTypeCode = 1001,
  kTaskExecutionCode = 2001,
  kOrchestrationCode = 3001,
  kInvalidInputCode = 4001,
  kInternalCode = 5001,
};

/// Structured error type for task, factory and scheduler operations.
struct TaskError {
  ErrorCategory category = ErrorCategory::Unknown;
  int code = 0;
  std::string message;
  std::map<std::string, std::string> details; // e.g. {"type": "bogus"}

  TaskError() = default;

  TaskError(ErrorCategory cat, int c, std::string msg,
            std::map<std::string, std::string> dets = {})
      : category(cat), code(c), message(std::move(msg)),
        details(std::move(dets)) {}

  static TaskError UnknownTaskType(const std::string &type) {
    return {ErrorCategory::UnknownTaskType, kUnknownTaskTypeCode,
            "Unknown task type: " + type, {{"type", type}}};
  }
  static TaskError Execution(std::string msg) {
    return {ErrorCategory::TaskExecution, kTaskExecutionCode, std::move(msg)};
  }
  static TaskError Orchestration(std::string msg) {
    return {ErrorCategory::Orchestration, kOrchestrationCode, std::move(msg)};
  }
  static TaskError InvalidInput(std::string msg,
                                std::map<std::string, std::string> dets = {}) {
    return {ErrorCategory::InvalidInput, kInvalidInputCode, std::move(msg),
            std::move(dets)};
  }
  static TaskError Internal(std::string msg) {
    return {ErrorCategory::Internal, kInternalCode, std::move(msg)};
  }
};

inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::UnknownTaskType:
    return "UnknownTaskType";
  case ErrorCategory::TaskExecution:
    return "TaskExecution";
  case ErrorCategory::Orchestration:
    return "Orchestration";
  case ErrorCategory::InvalidInput:
    return "InvalidInput";
  case ErrorCategory::Internal:
    return "Internal";
  case ErrorCategory::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

} // namespace taskrun::core
