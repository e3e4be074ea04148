#include "cpupool/util/Metrics.hpp"
#include "cpupool/util/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace cpupool {
namespace util {

std::uint64_t residentMemoryBytes() {
  // statm: size resident shared text lib data dt, in pages
  std::ifstream in("/proc/self/statm");
  std::uint64_t size = 0, resident = 0;
  if (!(in >> size >> resident)) return 0;
  const long page = ::sysconf(_SC_PAGESIZE);
  return page > 0 ? resident * static_cast<std::uint64_t>(page) : 0;
}

MetricRegistry& MetricRegistry::instance() {
  static MetricRegistry inst;
  return inst;
}

MetricRegistry::~MetricRegistry() {
  stopReporter();
}

void MetricRegistry::startReporter(unsigned int intervalSeconds) {
  // If already running, restart with new interval.
  stopReporter();

  running_.store(true, std::memory_order_release);
  thr_ = std::thread([this, intervalSeconds]{
    reporterLoop(intervalSeconds);
  });
}

void MetricRegistry::stopReporter() {
  {
    std::lock_guard<std::mutex> lk(sleepMx_);
    running_.store(false, std::memory_order_release);
  }
  sleepCv_.notify_all();
  if (thr_.joinable()) thr_.join();
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

void MetricRegistry::reporterLoop(unsigned int intervalSeconds) {
  const auto period = std::chrono::seconds(intervalSeconds > 0 ? intervalSeconds : 10);

  while (running_.load(std::memory_order_acquire)) {
    {
      std::unique_lock<std::mutex> lk(sleepMx_);
      sleepCv_.wait_for(lk, period, [this]{ return !running_.load(std::memory_order_acquire); });
    }
    if (!running_.load(std::memory_order_acquire)) break;

    std::unordered_map<std::string, double> c;
    std::unordered_map<std::string, double> g;
    {
      std::lock_guard<std::mutex> lk(mu_);
      c = counters_;
      g = gauges_;
    }
    if (c.empty() && g.empty()) continue;

    std::vector<Field> fields;
    fields.reserve(c.size() + g.size());
    for (auto& kv : c) fields.push_back({kv.first, std::to_string(kv.second)});
    for (auto& kv : g) fields.push_back({kv.first, std::to_string(kv.second)});
    logger().log(LogLevel::Info, "metrics", fields);
  }
}

} // namespace util

// -----------------------------------------------------------------------------

MetricsCollector::MetricsCollector() : start_(Clock::now()) {}

void MetricsCollector::workerCreated(const std::string& workerId) {
  std::lock_guard<std::mutex> lk(mu_);
  WorkerMetrics m;
  m.workerId = workerId;
  m.lastTaskTime = std::chrono::system_clock::now();
  if (workers_.emplace(workerId, m).second) order_.push_back(workerId);
}

void MetricsCollector::workerRemoved(const std::string& workerId) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = workers_.find(workerId);
  if (it == workers_.end()) return;
  retiredCompleted_ += it->second.tasksCompleted;
  retiredFailed_    += it->second.tasksFailed;
  retiredDuration_  += it->second.totalDuration;
  workers_.erase(it);
  order_.erase(std::remove(order_.begin(), order_.end(), workerId), order_.end());
}

void MetricsCollector::taskStarted(const std::string& workerId) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = workers_.find(workerId);
  if (it != workers_.end()) it->second.isActive = true;
}

void MetricsCollector::taskFinished(const std::string& workerId,
                                    std::chrono::milliseconds duration,
                                    bool success,
                                    std::uint64_t memoryUsage) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = workers_.find(workerId);
  if (it == workers_.end()) return;

  auto& m = it->second;
  m.tasksCompleted++;
  if (success) m.tasksSuccessful++;
  else         m.tasksFailed++;
  m.totalDuration += duration;
  m.averageTaskDuration = static_cast<double>(m.totalDuration.count()) / static_cast<double>(m.tasksCompleted);
  if (memoryUsage != 0) m.memoryUsage = memoryUsage;
  m.lastTaskTime = std::chrono::system_clock::now();
  m.isActive = false;
}

void MetricsCollector::setQueued(std::size_t queued) {
  std::lock_guard<std::mutex> lk(mu_);
  queued_ = queued;
}

PoolMetrics MetricsCollector::poolLocked(std::uint64_t memoryUsage) const {
  PoolMetrics p;
  p.memoryUsage  = memoryUsage;
  p.totalWorkers = workers_.size();
  p.queuedTasks  = queued_;

  std::uint64_t completed = retiredCompleted_;
  std::uint64_t failed    = retiredFailed_;
  auto total              = retiredDuration_;
  for (auto& kv : workers_) {
    const auto& m = kv.second;
    if (m.isActive) p.activeWorkers++;
    completed += m.tasksCompleted;
    failed    += m.tasksFailed;
    total     += m.totalDuration;
  }

  p.completedTasks = completed;
  p.failedTasks    = failed;
  p.averageTaskDuration = completed > 0
      ? static_cast<double>(total.count()) / static_cast<double>(completed)
      : 0.0;

  const std::chrono::duration<double> uptime = Clock::now() - start_;
  p.throughput = uptime.count() > 0.0 ? static_cast<double>(completed) / uptime.count() : 0.0;
  return p;
}

PoolMetrics MetricsCollector::pool() const {
  const auto rss = util::residentMemoryBytes();
  std::lock_guard<std::mutex> lk(mu_);
  return poolLocked(rss);
}

std::vector<WorkerMetrics> MetricsCollector::workers() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<WorkerMetrics> out;
  out.reserve(order_.size());
  for (auto& id : order_) out.push_back(workers_.at(id));
  return out;
}

std::optional<WorkerMetrics> MetricsCollector::worker(const std::string& workerId) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = workers_.find(workerId);
  if (it == workers_.end()) return std::nullopt;
  return it->second;
}

MetricsSample MetricsCollector::sample() {
  MetricsSample s;
  const auto rss = util::residentMemoryBytes();
  {
    std::lock_guard<std::mutex> lk(mu_);
    s.at = Clock::now();
    s.pool = poolLocked(rss);
    s.workers.reserve(order_.size());
    for (auto& id : order_) s.workers.push_back(workers_.at(id));

    if (last_) {
      const std::chrono::duration<double> dt = s.at - last_->at;
      const auto delta = s.pool.completedTasks - last_->pool.completedTasks;
      s.windowThroughput = dt.count() > 0.0 ? static_cast<double>(delta) / dt.count() : 0.0;
    } else {
      s.windowThroughput = s.pool.throughput;
    }
    last_ = s;
  }

  CPUPOOL_METRIC_SET("pool.workers.active", static_cast<double>(s.pool.activeWorkers));
  CPUPOOL_METRIC_SET("pool.workers.total",  static_cast<double>(s.pool.totalWorkers));
  CPUPOOL_METRIC_SET("pool.tasks.queued",   static_cast<double>(s.pool.queuedTasks));
  CPUPOOL_METRIC_SET("pool.tasks.completed", static_cast<double>(s.pool.completedTasks));
  CPUPOOL_METRIC_SET("pool.tasks.failed",   static_cast<double>(s.pool.failedTasks));
  CPUPOOL_METRIC_SET("pool.tasks.avg_ms",   s.pool.averageTaskDuration);
  CPUPOOL_METRIC_SET("pool.throughput",     s.windowThroughput);
  CPUPOOL_METRIC_SET("pool.memory.rss",     static_cast<double>(s.pool.memoryUsage));
  return s;
}

std::optional<MetricsSample> MetricsCollector::lastSample() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_;
}

} // namespace cpupool
