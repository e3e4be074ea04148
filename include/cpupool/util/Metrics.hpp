#pragma once

#include <atomic>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cpupool {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
// Optional: can run a background reporter thread that logs both.
class MetricRegistry {
public:
  static MetricRegistry& instance();

  MetricRegistry() = default;
  ~MetricRegistry();

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  // Start/stop a background reporter that logs counters every N seconds.
  void startReporter(unsigned int intervalSeconds = 10);
  void stopReporter();

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

private:
  void reporterLoop(unsigned int intervalSeconds);

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;

  std::mutex              sleepMx_;
  std::condition_variable sleepCv_;
  std::atomic<bool> running_{false};
  std::thread thr_;
};

// Resident set size of this process in bytes, 0 if it cannot be read.
std::uint64_t residentMemoryBytes();

} // namespace util

// -----------------------------------------------------------------------------
// Pool-local metrics
// -----------------------------------------------------------------------------

struct WorkerMetrics {
  std::string workerId;
  std::uint64_t tasksCompleted  = 0;
  std::uint64_t tasksSuccessful = 0;
  std::uint64_t tasksFailed     = 0;
  std::chrono::milliseconds totalDuration{0};
  double averageTaskDuration    = 0.0;   // ms
  bool isActive                 = false;
  std::uint64_t memoryUsage     = 0;     // process RSS when the last task finished
  std::chrono::system_clock::time_point lastTaskTime{};
};

struct PoolMetrics {
  std::size_t   activeWorkers       = 0;
  std::size_t   totalWorkers        = 0;
  std::size_t   queuedTasks         = 0;
  std::uint64_t completedTasks      = 0;
  std::uint64_t failedTasks         = 0;
  double        averageTaskDuration = 0.0;   // ms
  double        throughput          = 0.0;   // completed tasks per second of uptime
  std::uint64_t memoryUsage         = 0;     // process RSS, bytes
};

struct MetricsSample {
  std::chrono::steady_clock::time_point at{};
  PoolMetrics pool;
  std::vector<WorkerMetrics> workers;
  double windowThroughput = 0.0;   // tasks per second since the previous sample
};

// Counters are written only by the pool coordinator; readers on any thread take
// the collector's own lock and never touch the coordinator's structures.
class MetricsCollector {
public:
  using Clock = std::chrono::steady_clock;

  MetricsCollector();

  void workerCreated(const std::string& workerId);
  void workerRemoved(const std::string& workerId);
  void taskStarted(const std::string& workerId);
  void taskFinished(const std::string& workerId, std::chrono::milliseconds duration, bool success,
                    std::uint64_t memoryUsage = 0);
  void setQueued(std::size_t queued);

  PoolMetrics pool() const;
  std::vector<WorkerMetrics> workers() const;
  std::optional<WorkerMetrics> worker(const std::string& workerId) const;

  // Record a periodic snapshot and publish it as gauges.
  MetricsSample sample();
  std::optional<MetricsSample> lastSample() const;

private:
  PoolMetrics poolLocked(std::uint64_t memoryUsage) const;

  mutable std::mutex mu_;
  std::unordered_map<std::string, WorkerMetrics> workers_;
  std::vector<std::string> order_;   // creation order, for stable listings
  std::size_t queued_ = 0;

  // Counters of workers that have been removed; keeps totals monotonic.
  std::uint64_t retiredCompleted_ = 0;
  std::uint64_t retiredFailed_    = 0;
  std::chrono::milliseconds retiredDuration_{0};

  Clock::time_point start_;
  std::optional<MetricsSample> last_;
};

// -----------------------------------------------------------------------------
// Optional convenience macros
// -----------------------------------------------------------------------------
#define CPUPOOL_METRIC_INC(name, d) ::cpupool::util::MetricRegistry::instance().increment((name), (d))
#define CPUPOOL_METRIC_HIT(name)    ::cpupool::util::MetricRegistry::instance().increment((name), 1.0)
#define CPUPOOL_METRIC_SET(name, v) ::cpupool::util::MetricRegistry::instance().setGauge((name), (v))

} // namespace cpupool
