#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace cpupool {
namespace util {

class Config {
public:
  // Construct with the engine defaults.
  Config();

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Apply one setting. Returns false for unknown keys.
  bool apply(const std::string& key, const std::string& value);

  // Upper bound for every *Ms setting read from a file (ten years).
  static constexpr long kMaxDurationMs = 10L * 365 * 24 * 60 * 60 * 1000;

  // host cores - 1, never below 1
  static std::size_t defaultMaxWorkers();

  std::chrono::milliseconds taskTimeout() const { return std::chrono::milliseconds(taskTimeoutMs); }
  std::chrono::milliseconds idleTimeout() const { return std::chrono::milliseconds(idleTimeoutMs); }
  std::chrono::milliseconds metricsInterval() const { return std::chrono::milliseconds(metricsIntervalMs); }
  std::chrono::milliseconds shutdownGracePeriod() const { return std::chrono::milliseconds(shutdownGracePeriodMs); }

  // --- Pool ---
  std::size_t maxWorkers;
  long taskTimeoutMs         = 30000;
  long idleTimeoutMs         = 60000;
  int  retryAttempts         = 3;      // advisory only
  bool enableMetrics         = true;
  long metricsIntervalMs     = 5000;
  long shutdownGracePeriodMs = 5000;

  // --- Logging ---
  std::string logLevel  = "info";
  std::string logFormat = "text";     // "text" | "json"
  std::string logFile;                // empty -> stdout

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
  static bool parseBool(const std::string& s, bool fallback);
  static long parseMs(const std::string& s, long lo);
};

} // namespace util
} // namespace cpupool
