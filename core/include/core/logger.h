#pragma once

#include <string>

namespace taskrun::core {

/// Logging sink used by core components. The spdlog-backed implementation
/// lives in infra; tests inject a recording implementation.
///
/// Implementations must be safe to call concurrently from worker threads.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void debug(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace taskrun::core
