#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace cpupool {

enum class ErrorKind {
  TaskTimeout,          // deadline passed before a result arrived
  TaskExecutionError,   // handler ran and reported failure
  UnknownTaskType,      // no handler registered for task.type
  WorkerCrashed,        // worker died while running the task
  PoolShuttingDown,     // submitted after shutdown began, or drained by it
  DuplicateTaskId       // id already queued or executing
};

const char* errorKindName(ErrorKind kind);

/// Rejection carried by a task's future. One per task, never shared.
class TaskError : public std::runtime_error {
public:
  TaskError(ErrorKind kind, const std::string& message,
            std::chrono::milliseconds duration = std::chrono::milliseconds(0))
    : std::runtime_error(message), kind_(kind), duration_(duration) {}

  ErrorKind kind() const noexcept { return kind_; }
  std::chrono::milliseconds duration() const noexcept { return duration_; }

private:
  ErrorKind kind_;
  std::chrono::milliseconds duration_;
};

/// Thrown from a handler when the execution context itself is no longer
/// usable. The worker reports a crash and is removed from the pool.
class WorkerFault : public std::runtime_error {
public:
  explicit WorkerFault(const std::string& message) : std::runtime_error(message) {}
};

} // namespace cpupool
