#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "cpupool/TaskError.hpp"

namespace cpupool {

namespace task_types {
inline constexpr const char* HashFile     = "hash_file";
inline constexpr const char* CompressFile = "compress_file";
inline constexpr const char* AnalyzeCode  = "analyze_code";
inline constexpr const char* SearchInFile = "search_in_file";
} // namespace task_types

struct Task {
  std::string id;        // empty -> assigned by the pool
  std::string type;      // selects the registered handler
  std::string data;      // passed verbatim to the handler
  int priority = 0;      // higher runs first
  std::optional<std::chrono::milliseconds> timeout;
};

struct TaskResult {
  std::string id;
  bool success = false;
  std::string result;                  // meaningful iff success
  std::string error;                   // meaningful iff !success
  std::optional<ErrorKind> errorKind;  // set iff !success
  std::chrono::milliseconds duration{0};
  std::string workerId;                // empty if no worker ran it

  static TaskResult ok(std::string id, std::string result,
                       std::chrono::milliseconds duration, std::string workerId) {
    TaskResult r;
    r.id = std::move(id);
    r.success = true;
    r.result = std::move(result);
    r.duration = duration;
    r.workerId = std::move(workerId);
    return r;
  }

  static TaskResult failure(std::string id, ErrorKind kind, std::string error,
                            std::chrono::milliseconds duration = std::chrono::milliseconds(0),
                            std::string workerId = {}) {
    TaskResult r;
    r.id = std::move(id);
    r.success = false;
    r.error = std::move(error);
    r.errorKind = kind;
    r.duration = duration;
    r.workerId = std::move(workerId);
    return r;
  }
};

/// Receives the settled outcome of one task, exactly once.
using CompletionHandler = std::function<void(const TaskResult&)>;

} // namespace cpupool
