#pragma once

#include "core/result.h"
#include "core/task_error.h"
#include "core/task_factory.h"

#include <string>
#include <vector>

namespace taskrun::infra {

/// Parse a JSON array of flat task-description objects:
///
///   [ {"task_id": 1, "name": "Send Welcome Email", "type": "email"}, ... ]
///
/// "taskId" is accepted in place of "task_id". Objects must be flat (no
/// nested objects or arrays); string values may contain any character and
/// standard escapes, \uXXXX included, are decoded to UTF-8.
/// Err(InvalidInput) names the offending object
/// index in details["index"].
core::Result<std::vector<core::TaskDescription>, core::TaskError>
parse_task_descriptions(const std::string &json);

/// Read `path` and parse it with parse_task_descriptions().
core::Result<std::vector<core::TaskDescription>, core::TaskError>
load_task_descriptions(const std::string &path);

} // namespace taskrun::infra
