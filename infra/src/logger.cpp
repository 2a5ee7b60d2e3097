#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace taskrun::infra {

namespace {

/// ConsoleLogger — spdlog-based structured logger. The `_mt` sink makes it
/// safe to share between worker threads.
class ConsoleLogger : public core::ILogger {
public:
  explicit ConsoleLogger(const std::string &name) {
    logger_ = spdlog::get(name);
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt(name);
    }
    logger_->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v");
  }

  void debug(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->debug("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

std::unique_ptr<core::ILogger> create_console_logger(const std::string &name) {
  return std::make_unique<ConsoleLogger>(name);
}

bool set_log_level(const std::string &level) {
  const auto parsed = spdlog::level::from_str(level);
  // from_str() maps unknown names to off; only accept "off" when asked for.
  if (parsed == spdlog::level::off && level != "off") {
    return false;
  }
  spdlog::set_level(parsed);
  return true;
}

} // namespace taskrun::infra
