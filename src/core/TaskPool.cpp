#include "cpupool/TaskPool.hpp"
#include "cpupool/util/Logger.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace cpupool {

using util::logger;
using util::LogLevel;
using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

namespace {
const char* kShuttingDown = "Worker pool is shutting down";

// from + d, pinned to time_point::max() instead of overflowing. Compared in
// milliseconds: a huge millisecond count does not fit in clock ticks.
Clock::time_point deadlineAfter(Clock::time_point from, milliseconds d) {
  if (d <= milliseconds(0)) return from;
  if (d >= std::chrono::duration_cast<milliseconds>(Clock::time_point::max() - from))
    return Clock::time_point::max();
  return from + std::chrono::duration_cast<Clock::duration>(d);
}
}

TaskPool::TaskPool(util::Config cfg, std::shared_ptr<const HandlerRegistry> handlers)
  : cfg_(std::move(cfg)),
    handlers_(std::move(handlers)),
    work_(boost::asio::make_work_guard(ioc_)),
    metricsTimer_(ioc_),
    reaperTimer_(ioc_)
{
  if (!handlers_) throw std::invalid_argument("TaskPool: handler registry is required");
  if (cfg_.maxWorkers == 0) cfg_.maxWorkers = 1;

  logger().log(LogLevel::Info, "pool starting", {
    {"maxWorkers",    std::to_string(cfg_.maxWorkers)},
    {"taskTimeoutMs", std::to_string(cfg_.taskTimeoutMs)},
    {"idleTimeoutMs", std::to_string(cfg_.idleTimeoutMs)},
    {"retryAttempts", std::to_string(cfg_.retryAttempts) + " (advisory)"},
    {"metrics",       cfg_.enableMetrics ? "on" : "off"}
  });

  boost::asio::post(ioc_, [this]{
    if (cfg_.enableMetrics) scheduleMetrics();
    scheduleReaper();
  });

  coordinator_ = std::thread([this]{
    util::Logger::Scoped ctx(std::vector<util::Field>{ {"thread", "coordinator"} });
    for (;;) {
      try {
        ioc_.run();
        return;
      } catch (const std::exception& ex) {
        logger().log(LogLevel::Error, std::string("coordinator handler threw: ") + ex.what());
      }
    }
  });
  coordinatorId_ = coordinator_.get_id();
}

TaskPool::~TaskPool() {
  try {
    shutdown();
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, std::string("pool destructor: ") + ex.what());
  }
}

void TaskPool::assertNotCoordinator(const char* what) const {
  if (std::this_thread::get_id() == coordinatorId_) {
    throw std::logic_error(std::string("TaskPool::") + what + " called from the coordinator thread");
  }
}

// ---------------------------------------------------------------------------
// Admission
// ---------------------------------------------------------------------------

std::future<std::string> TaskPool::submit(Task task) {
  auto p = std::make_shared<std::promise<std::string>>();
  auto f = p->get_future();

  submit(std::move(task), [p](const TaskResult& r) {
    if (r.success) {
      p->set_value(r.result);
    } else {
      const ErrorKind kind = r.errorKind.value_or(ErrorKind::TaskExecutionError);
      p->set_exception(std::make_exception_ptr(TaskError(kind, r.error, r.duration)));
    }
  });
  return f;
}

void TaskPool::submit(Task task, CompletionHandler onDone) {
  bool accepted = false;
  {
    std::lock_guard<std::mutex> lk(admissionMx_);
    if (accepting_.load(std::memory_order_acquire)) {
      accepted = true;
      boost::asio::post(ioc_, [this, t = std::move(task), cb = std::move(onDone)]() mutable {
        admit(std::move(t), std::move(cb));
      });
    }
  }
  if (accepted) return;

  // Rejected before any state changed.
  if (onDone) onDone(TaskResult::failure(task.id, ErrorKind::PoolShuttingDown, kShuttingDown));
}

void TaskPool::admit(Task task, CompletionHandler onDone) {
  if (stopped_) {
    if (onDone) onDone(TaskResult::failure(task.id, ErrorKind::PoolShuttingDown, kShuttingDown));
    return;
  }

  if (task.id.empty()) task.id = "task_" + std::to_string(++nextTaskSeq_);

  if (pending_.contains(task.id) || isRunning(task.id)) {
    logger().log(LogLevel::Warn, "duplicate task id rejected", { {"task", task.id} });
    if (onDone) {
      onDone(TaskResult::failure(task.id, ErrorKind::DuplicateTaskId,
                                 "Task id already in flight: " + task.id));
    }
    return;
  }

  const milliseconds timeout = task.timeout.value_or(cfg_.taskTimeout());
  const auto now = Clock::now();

  rt::PendingEntry entry;
  entry.complete  = std::move(onDone);
  entry.startTime = now;
  entry.deadline  = deadlineAfter(now, timeout);
  entry.ticket    = ++nextTicket_;
  entry.timer     = std::make_unique<boost::asio::steady_timer>(ioc_, entry.deadline);

  const std::string id = task.id;
  const std::uint64_t ticket = entry.ticket;
  entry.timer->async_wait([this, id, ticket, timeout](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) return;
    onTimeout(id, ticket, timeout);
  });

  pending_.add(id, std::move(entry));
  CPUPOOL_METRIC_HIT("pool.tasks.submitted");
  logger().log(LogLevel::Trace, "task queued", {
    {"task", id}, {"type", task.type}, {"priority", std::to_string(task.priority)}
  });

  queue_.push(std::move(task));
  metrics_.setQueued(queue_.size());
  dispatch();
}

bool TaskPool::isRunning(const std::string& taskId) const {
  for (auto& kv : workers_) {
    const auto& w = kv.second;
    if (w.isActive && w.currentTask && w.currentTask->id == taskId) return true;
  }
  return false;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

void TaskPool::dispatch() {
  while (!stopped_ && !queue_.empty()) {
    WorkerInfo* w = findIdleWorker();
    if (!w) w = createWorker();
    if (!w) break;   // at capacity; the next completion retries

    auto task = queue_.pop();
    const auto ticket = pending_.ticket(task->id);
    if (!ticket) continue;   // settled while queued

    const std::string workerId = w->worker->id();
    w->isActive    = true;
    w->currentTask = *task;
    w->ticket      = *ticket;
    w->lastUsed    = Clock::now();
    metrics_.taskStarted(workerId);

    logger().log(LogLevel::Debug, "task dispatched", {
      {"task", task->id}, {"worker", workerId}, {"type", task->type}
    });

    if (!w->worker->post(std::move(*task), *ticket)) {
      // The worker's mailbox is closed; give the task back and drop the worker.
      Task back = *w->currentTask;
      w->isActive = false;
      w->currentTask.reset();
      logger().log(LogLevel::Warn, "worker refused task; retiring it",
                   { {"worker", workerId}, {"task", back.id} });
      removeWorker(workerId);
      queue_.push(std::move(back));
    }
  }
  metrics_.setQueued(queue_.size());
}

TaskPool::WorkerInfo* TaskPool::findIdleWorker() {
  for (auto& kv : workers_) {
    if (!kv.second.isActive) return &kv.second;
  }
  return nullptr;
}

TaskPool::WorkerInfo* TaskPool::createWorker() {
  if (workers_.size() >= cfg_.maxWorkers) return nullptr;

  const std::string id = "worker_" + std::to_string(++nextWorkerSeq_);

  std::shared_ptr<rt::Worker> worker;
  try {
    worker = rt::Worker::spawn(id, handlers_, [this](rt::WorkerMessage m) {
      boost::asio::post(ioc_, [this, m = std::move(m)]() mutable {
        onWorkerMessage(std::move(m));
      });
    });
  } catch (const std::system_error& ex) {
    logger().log(LogLevel::Error, "failed to create worker", { {"worker", id}, {"error", ex.what()} });
    return nullptr;
  }

  WorkerInfo info;
  info.worker   = std::move(worker);
  info.lastUsed = Clock::now();
  auto res = workers_.emplace(id, std::move(info));

  metrics_.workerCreated(id);
  logger().log(LogLevel::Info, "worker created", {
    {"worker", id}, {"workers", std::to_string(workers_.size())}
  });
  emit(EventType::WorkerCreated, id, {});
  return &res.first->second;
}

void TaskPool::removeWorker(const std::string& workerId) {
  auto it = workers_.find(workerId);
  if (it == workers_.end()) return;

  auto worker = std::move(it->second.worker);
  workers_.erase(it);
  metrics_.workerRemoved(workerId);

  if (worker) {
    worker->requestStop();
    retired_.push_back(std::move(worker));
  }
}

// ---------------------------------------------------------------------------
// Worker messages
// ---------------------------------------------------------------------------

void TaskPool::onWorkerMessage(rt::WorkerMessage msg) {
  switch (msg.type) {
    case rt::WorkerMessage::Type::TaskCompleted:
    case rt::WorkerMessage::Type::TaskFailed:
      onTaskReport(msg);
      break;
    case rt::WorkerMessage::Type::WorkerError:
      onWorkerError(msg);
      break;
    case rt::WorkerMessage::Type::WorkerExited:
      onWorkerExited(msg);
      break;
  }
  dispatch();
}

void TaskPool::onTaskReport(rt::WorkerMessage& msg) {
  const bool success = msg.type == rt::WorkerMessage::Type::TaskCompleted;

  auto it = workers_.find(msg.workerId);
  if (it != workers_.end()) {
    auto& w = it->second;
    if (w.currentTask && w.currentTask->id == msg.taskId && w.ticket == msg.ticket) {
      metrics_.taskFinished(msg.workerId, msg.duration, success, msg.memoryUsage);
      w.isActive = false;
      w.currentTask.reset();
      w.lastUsed = Clock::now();
    }
  }

  if (success) {
    logger().log(LogLevel::Debug, "task completed", {
      {"task", msg.taskId}, {"worker", msg.workerId}, {"durationMs", std::to_string(msg.duration.count())}
    });
    emit(EventType::TaskCompleted, msg.workerId, msg.taskId, {}, msg.duration);
  } else {
    logger().log(LogLevel::Warn, "task failed", {
      {"task", msg.taskId}, {"worker", msg.workerId}, {"kind", errorKindName(msg.kind)},
      {"error", msg.error}, {"durationMs", std::to_string(msg.duration.count())}
    });
    emit(EventType::TaskFailed, msg.workerId, msg.taskId, msg.error, msg.duration);
  }

  CPUPOOL_METRIC_INC("pool.tasks.exec_ms", static_cast<double>(msg.duration.count()));

  auto entry = pending_.take(msg.taskId, msg.ticket);
  if (!entry) {
    logger().log(LogLevel::Debug, "late result discarded", { {"task", msg.taskId}, {"worker", msg.workerId} });
    return;
  }

  if (success) {
    settle(*entry, TaskResult::ok(msg.taskId, std::move(msg.result), msg.duration, msg.workerId));
  } else {
    settle(*entry, TaskResult::failure(msg.taskId, msg.kind, msg.error, msg.duration, msg.workerId));
  }
}

void TaskPool::onWorkerError(rt::WorkerMessage& msg) {
  logger().log(LogLevel::Error, "worker error", { {"worker", msg.workerId}, {"error", msg.error} });
  emit(EventType::WorkerError, msg.workerId, msg.taskId, msg.error, msg.duration);
  CPUPOOL_METRIC_HIT("pool.workers.crashed");

  auto it = workers_.find(msg.workerId);
  if (it == workers_.end()) return;

  auto& w = it->second;
  if (w.currentTask) {
    const std::string taskId = w.currentTask->id;
    const std::uint64_t ticket = w.ticket;
    metrics_.taskFinished(msg.workerId, msg.duration, false);
    w.currentTask.reset();
    w.isActive = false;

    const std::string error = "Worker " + msg.workerId + " crashed: " + msg.error;
    emit(EventType::TaskFailed, msg.workerId, taskId, error, msg.duration);
    if (auto entry = pending_.take(taskId, ticket)) {
      settle(*entry, TaskResult::failure(taskId, ErrorKind::WorkerCrashed, error, msg.duration, msg.workerId));
    }
  }

  // A crashed worker is never reused.
  removeWorker(msg.workerId);
}

void TaskPool::onWorkerExited(rt::WorkerMessage& msg) {
  logger().log(msg.exitCode == 0 ? LogLevel::Info : LogLevel::Warn, "worker exited", {
    {"worker", msg.workerId}, {"code", std::to_string(msg.exitCode)}
  });
  emit(EventType::WorkerExited, msg.workerId, {}, {}, milliseconds(0), msg.exitCode);

  // Exit without a preceding error: fail whatever it was running.
  auto it = workers_.find(msg.workerId);
  if (it != workers_.end()) {
    auto& w = it->second;
    if (w.currentTask) {
      const std::string taskId = w.currentTask->id;
      const std::uint64_t ticket = w.ticket;
      metrics_.taskFinished(msg.workerId, milliseconds(0), false);
      w.currentTask.reset();
      w.isActive = false;

      const std::string error = "Worker " + msg.workerId + " exited with code " + std::to_string(msg.exitCode);
      emit(EventType::TaskFailed, msg.workerId, taskId, error);
      if (auto entry = pending_.take(taskId, ticket)) {
        settle(*entry, TaskResult::failure(taskId, ErrorKind::WorkerCrashed, error, milliseconds(0), msg.workerId));
      }
    }
    removeWorker(msg.workerId);
  }

  auto rit = std::find_if(retired_.begin(), retired_.end(),
                          [&](const std::shared_ptr<rt::Worker>& w){ return w->id() == msg.workerId; });
  if (rit != retired_.end()) {
    // The exit message is the thread's last act, so this join is short.
    (*rit)->join(cfg_.shutdownGracePeriod());
    retired_.erase(rit);
  }
}

// ---------------------------------------------------------------------------
// Timers
// ---------------------------------------------------------------------------

void TaskPool::onTimeout(const std::string& taskId, std::uint64_t ticket, milliseconds timeout) {
  auto entry = pending_.take(taskId, ticket);
  if (!entry) return;

  // Still waiting for a worker: it will never be needed.
  if (queue_.remove(taskId)) metrics_.setQueued(queue_.size());

  CPUPOOL_METRIC_HIT("pool.tasks.timed_out");
  const std::string error = "Task " + taskId + " timed out after " + std::to_string(timeout.count()) + "ms";
  logger().log(LogLevel::Warn, "task timed out", { {"task", taskId}, {"timeoutMs", std::to_string(timeout.count())} });
  emit(EventType::TaskTimedOut, {}, taskId, error, timeout);

  settle(*entry, TaskResult::failure(taskId, ErrorKind::TaskTimeout, error,
                                     std::chrono::duration_cast<milliseconds>(Clock::now() - entry->startTime)));
}

void TaskPool::scheduleMetrics() {
  metricsTimer_.expires_at(deadlineAfter(Clock::now(), cfg_.metricsInterval()));
  metricsTimer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || stopped_) return;
    const auto s = metrics_.sample();
    logger().log(LogLevel::Debug, "pool metrics", {
      {"active",      std::to_string(s.pool.activeWorkers)},
      {"workers",     std::to_string(s.pool.totalWorkers)},
      {"queued",      std::to_string(s.pool.queuedTasks)},
      {"completed",   std::to_string(s.pool.completedTasks)},
      {"failed",      std::to_string(s.pool.failedTasks)},
      {"avgMs",       std::to_string(s.pool.averageTaskDuration)},
      {"throughput",  std::to_string(s.windowThroughput)}
    });
    scheduleMetrics();
  });
}

void TaskPool::scheduleReaper() {
  const auto period = std::max(milliseconds(10), cfg_.idleTimeout() / 2);
  reaperTimer_.expires_at(deadlineAfter(Clock::now(), period));
  reaperTimer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || stopped_) return;
    reapIdleWorkers();
    scheduleReaper();
  });
}

void TaskPool::reapIdleWorkers() {
  const auto now = Clock::now();
  std::vector<std::string> idle;
  for (auto& kv : workers_) {
    const auto& w = kv.second;
    if (!w.isActive && std::chrono::duration_cast<milliseconds>(now - w.lastUsed) >= cfg_.idleTimeout())
      idle.push_back(kv.first);
  }
  for (auto& id : idle) {
    logger().log(LogLevel::Info, "reclaiming idle worker", { {"worker", id} });
    removeWorker(id);
  }
}

// ---------------------------------------------------------------------------
// Batch helpers
// ---------------------------------------------------------------------------

std::vector<TaskResult> TaskPool::executeBatch(std::vector<Task> tasks) {
  assertNotCoordinator("executeBatch");

  std::vector<std::future<TaskResult>> futures;
  futures.reserve(tasks.size());
  for (auto& t : tasks) {
    auto p = std::make_shared<std::promise<TaskResult>>();
    futures.push_back(p->get_future());
    submit(std::move(t), [p](const TaskResult& r) { p->set_value(r); });
  }

  std::vector<TaskResult> results;
  results.reserve(futures.size());
  for (auto& f : futures) results.push_back(f.get());
  return results;
}

std::vector<std::string> TaskPool::parallelMapPayloads(const std::string& taskType,
                                                       std::vector<std::string> payloads,
                                                       std::size_t concurrency) {
  const std::size_t chunk = concurrency > 0 ? concurrency : cfg_.maxWorkers;
  const std::string prefix = "map_" + std::to_string(nextMapSeq_.fetch_add(1)) + "_";

  std::vector<std::string> out(payloads.size());
  for (std::size_t start = 0; start < payloads.size(); start += chunk) {
    const std::size_t end = std::min(payloads.size(), start + chunk);

    std::vector<Task> tasks;
    tasks.reserve(end - start);
    for (std::size_t i = start; i < end; ++i) {
      Task t;
      t.id   = prefix + std::to_string(i);
      t.type = taskType;
      t.data = std::move(payloads[i]);
      tasks.push_back(std::move(t));
    }

    auto results = executeBatch(std::move(tasks));
    for (std::size_t k = 0; k < results.size(); ++k) {
      auto& r = results[k];
      const std::size_t index = start + k;
      if (!r.success) {
        throw TaskError(r.errorKind.value_or(ErrorKind::TaskExecutionError),
                        "Task failed for item " + std::to_string(index) + ": " + r.error,
                        r.duration);
      }
      out[index] = std::move(r.result);
    }
  }
  return out;
}

// ---------------------------------------------------------------------------
// Shutdown
// ---------------------------------------------------------------------------

std::vector<std::shared_ptr<rt::Worker>> TaskPool::drainForShutdown() {
  stopped_ = true;
  logger().log(LogLevel::Info, "pool shutting down", {
    {"queued", std::to_string(queue_.size())}, {"pending", std::to_string(pending_.size())},
    {"workers", std::to_string(workers_.size())}
  });
  emit(EventType::ShutdownStarted, {}, {});

  metricsTimer_.cancel();
  reaperTimer_.cancel();

  queue_.drain();
  for (auto& kv : pending_.takeAll()) {
    settle(kv.second, TaskResult::failure(kv.first, ErrorKind::PoolShuttingDown, kShuttingDown));
  }
  metrics_.setQueued(0);

  std::vector<std::shared_ptr<rt::Worker>> stopping;
  stopping.reserve(workers_.size() + retired_.size());
  for (auto& kv : workers_) {
    metrics_.workerRemoved(kv.first);
    if (kv.second.worker) stopping.push_back(std::move(kv.second.worker));
  }
  workers_.clear();
  for (auto& w : retired_) stopping.push_back(std::move(w));
  retired_.clear();

  for (auto& w : stopping) {
    w->disconnect();
    w->requestStop();
  }
  return stopping;
}

void TaskPool::shutdown() {
  assertNotCoordinator("shutdown");

  std::lock_guard<std::mutex> once(shutdownMx_);
  if (shutdownComplete_) return;

  {
    std::lock_guard<std::mutex> lk(admissionMx_);
    accepting_.store(false, std::memory_order_release);
  }

  // Everything admitted before the flag flipped is already posted, so it is
  // handled before the drain below.
  std::promise<std::vector<std::shared_ptr<rt::Worker>>> drained;
  auto fut = drained.get_future();
  boost::asio::post(ioc_, [this, &drained] { drained.set_value(drainForShutdown()); });
  auto stopping = fut.get();

  const auto deadline = deadlineAfter(Clock::now(), cfg_.shutdownGracePeriod());
  std::size_t abandoned = 0;
  for (auto& w : stopping) {
    const auto left = std::max(milliseconds(0),
                               std::chrono::duration_cast<milliseconds>(deadline - Clock::now()));
    if (!w->join(left)) ++abandoned;
  }

  work_.reset();
  if (coordinator_.joinable()) coordinator_.join();

  shutdownComplete_ = true;
  logger().log(LogLevel::Info, "pool stopped", { {"abandonedWorkers", std::to_string(abandoned)} });
  emit(EventType::ShutdownCompleted, {}, {});
}

// ---------------------------------------------------------------------------

void TaskPool::settle(rt::PendingEntry& entry, const TaskResult& result) {
  if (!entry.complete) return;
  try {
    entry.complete(result);
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Warn, "completion handler threw", { {"task", result.id}, {"error", ex.what()} });
  } catch (...) {
    logger().log(LogLevel::Warn, "completion handler threw", { {"task", result.id}, {"error", "unknown"} });
  }
  entry.complete = nullptr;
}

void TaskPool::emit(EventType type, const std::string& workerId, const std::string& taskId,
                    const std::string& message, milliseconds duration, int exitCode) {
  PoolEvent ev;
  ev.type     = type;
  ev.workerId = workerId;
  ev.taskId   = taskId;
  ev.message  = message;
  ev.duration = duration;
  ev.exitCode = exitCode;
  events_.publish(ev);
}

} // namespace cpupool
