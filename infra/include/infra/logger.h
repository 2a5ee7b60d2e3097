#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace taskrun::infra {

/// spdlog-backed console logger.
/// Format: [ts] [level] [trace_id] [component] event: msg
///
/// Loggers are registered with spdlog under `name`; asking for the same
/// name twice shares the underlying sink.
std::unique_ptr<core::ILogger>
create_console_logger(const std::string &name = "taskrun");

/// Set the global spdlog level from its name ("debug", "info", "warn", ...).
/// Returns false, leaving the level unchanged, for an unrecognised name.
bool set_log_level(const std::string &level);

} // namespace taskrun::infra
