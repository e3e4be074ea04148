#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "cpupool/EventBus.hpp"
#include "cpupool/HandlerRegistry.hpp"
#include "cpupool/Task.hpp"
#include "cpupool/TaskError.hpp"
#include "cpupool/rt/PendingRegistry.hpp"
#include "cpupool/rt/TaskQueue.hpp"
#include "cpupool/rt/Worker.hpp"
#include "cpupool/util/Config.hpp"
#include "cpupool/util/Metrics.hpp"

namespace cpupool {

/// Bounded pool of worker threads fed from a priority queue.
///
/// All pool state (worker set, queue, pending registry) lives on a single
/// coordinator thread running an io_context. Submissions, worker messages and
/// timer expiries are handlers on that context, so they never interleave.
/// Completion handlers and event listeners run on the coordinator thread and
/// must not block on the pool (no shutdown(), executeBatch() or future.get()).
class TaskPool {
public:
  TaskPool(util::Config cfg, std::shared_ptr<const HandlerRegistry> handlers);
  ~TaskPool();

  TaskPool(const TaskPool&)            = delete;
  TaskPool& operator=(const TaskPool&) = delete;

  /// Queue a task. The future yields the handler's result or throws TaskError.
  std::future<std::string> submit(Task task);

  /// Callback form; `onDone` runs exactly once. It runs inline on the calling
  /// thread only when the pool is already shutting down.
  void submit(Task task, CompletionHandler onDone);

  /// All-settled: one TaskResult per input, in input order. Never throws for
  /// task failures.
  std::vector<TaskResult> executeBatch(std::vector<Task> tasks);

  /// Runs `taskType` once per item in chunks of `concurrency` (default
  /// maxWorkers). Output[i] belongs to items[i]. The first failure throws.
  template <typename T, typename PayloadFn>
  std::vector<std::string> parallelMap(const std::vector<T>& items,
                                       const std::string& taskType,
                                       PayloadFn toPayload,
                                       std::size_t concurrency = 0) {
    std::vector<std::string> payloads;
    payloads.reserve(items.size());
    for (const auto& item : items) payloads.push_back(toPayload(item));
    return parallelMapPayloads(taskType, std::move(payloads), concurrency);
  }

  std::vector<std::string> parallelMapPayloads(const std::string& taskType,
                                               std::vector<std::string> payloads,
                                               std::size_t concurrency = 0);

  /// Rejects new work, settles everything queued or pending with
  /// PoolShuttingDown and stops the workers. Idempotent.
  void shutdown();
  bool isShuttingDown() const { return !accepting_.load(std::memory_order_acquire); }

  PoolMetrics poolMetrics() const { return metrics_.pool(); }
  std::vector<WorkerMetrics> workerMetrics() const { return metrics_.workers(); }
  std::optional<WorkerMetrics> workerMetrics(const std::string& workerId) const { return metrics_.worker(workerId); }
  std::optional<MetricsSample> lastSample() const { return metrics_.lastSample(); }

  EventBus& events() { return events_; }
  const util::Config& config() const { return cfg_; }

private:
  struct WorkerInfo {
    std::shared_ptr<rt::Worker> worker;
    bool isActive = false;
    std::optional<Task> currentTask;
    std::uint64_t ticket = 0;
    std::chrono::steady_clock::time_point lastUsed{};
  };

  // --- coordinator thread only ---
  void admit(Task task, CompletionHandler onDone);
  void dispatch();
  WorkerInfo* findIdleWorker();
  WorkerInfo* createWorker();
  bool isRunning(const std::string& taskId) const;
  void removeWorker(const std::string& workerId);

  void onWorkerMessage(rt::WorkerMessage msg);
  void onTaskReport(rt::WorkerMessage& msg);
  void onWorkerError(rt::WorkerMessage& msg);
  void onWorkerExited(rt::WorkerMessage& msg);
  void onTimeout(const std::string& taskId, std::uint64_t ticket, std::chrono::milliseconds timeout);

  void scheduleMetrics();
  void scheduleReaper();
  void reapIdleWorkers();

  std::vector<std::shared_ptr<rt::Worker>> drainForShutdown();

  void settle(rt::PendingEntry& entry, const TaskResult& result);
  void emit(EventType type, const std::string& workerId, const std::string& taskId,
            const std::string& message = {},
            std::chrono::milliseconds duration = std::chrono::milliseconds(0),
            int exitCode = 0);

  void assertNotCoordinator(const char* what) const;

private:
  util::Config                           cfg_;
  std::shared_ptr<const HandlerRegistry> handlers_;

  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  boost::asio::steady_timer metricsTimer_;
  boost::asio::steady_timer reaperTimer_;

  // Owned by the coordinator thread.
  rt::TaskQueue                               queue_;
  rt::PendingRegistry                         pending_;
  std::unordered_map<std::string, WorkerInfo> workers_;
  std::vector<std::shared_ptr<rt::Worker>>    retired_;   // stopping, not yet joined
  bool          stopped_        = false;
  std::uint64_t nextTicket_     = 0;
  std::uint64_t nextTaskSeq_    = 0;
  std::uint64_t nextWorkerSeq_  = 0;

  MetricsCollector metrics_;
  EventBus         events_;

  std::mutex               admissionMx_;
  std::atomic<bool>        accepting_{true};
  std::mutex               shutdownMx_;
  bool                     shutdownComplete_ = false;
  std::atomic<std::uint64_t> nextMapSeq_{0};

  std::thread     coordinator_;
  std::thread::id coordinatorId_;
};

} // namespace cpupool
