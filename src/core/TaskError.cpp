#include "cpupool/TaskError.hpp"

namespace cpupool {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::TaskTimeout:        return "TaskTimeout";
    case ErrorKind::TaskExecutionError: return "TaskExecutionError";
    case ErrorKind::UnknownTaskType:    return "UnknownTaskType";
    case ErrorKind::WorkerCrashed:      return "WorkerCrashed";
    case ErrorKind::PoolShuttingDown:   return "PoolShuttingDown";
    case ErrorKind::DuplicateTaskId:    return "DuplicateTaskId";
  }
  return "Unknown";
}

} // namespace cpupool
