#pragma once

namespace taskrun::core {

enum class TaskStatus {
  Pending,   // Created, not yet picked up by a worker
  Running,   // Work step executing
  Completed, // Work step succeeded (terminal)
  Failed     // Work step faulted (terminal)
};

/// Convert TaskStatus to string for logging.
const char *to_string(TaskStatus status);

/// Completed and Failed are terminal; no transition leaves them.
bool is_terminal(TaskStatus status);

/// Legal transitions:
///   Pending -> Running
///   Running -> Completed, Failed
bool is_legal_transition(TaskStatus from, TaskStatus to);

} // namespace taskrun::core
