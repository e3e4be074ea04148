#include "cpupool/rt/Worker.hpp"
#include "cpupool/util/Logger.hpp"
#include "cpupool/util/Metrics.hpp"

#include <exception>
#include <utility>

namespace cpupool::rt {

using util::logger;
using util::LogLevel;

std::shared_ptr<Worker> Worker::spawn(std::string id,
                                      std::shared_ptr<const HandlerRegistry> handlers,
                                      Sink sink) {
  std::shared_ptr<Worker> w(new Worker(std::move(id), std::move(handlers), std::move(sink)));
  w->start();
  return w;
}

Worker::Worker(std::string id, std::shared_ptr<const HandlerRegistry> handlers, Sink sink)
  : id_(std::move(id)),
    handlers_(std::move(handlers)),
    sink_(std::move(sink)),
    exited_(exitedPromise_.get_future().share()) {}

Worker::~Worker() {
  if (!thr_.joinable()) return;
  // The thread holds a reference to us, so the only way to get here with a
  // live thread is from that thread itself.
  if (thr_.get_id() == std::this_thread::get_id()) thr_.detach();
  else thr_.join();
}

void Worker::start() {
  // The thread keeps the object alive, so an abandoned worker stays valid.
  auto self = shared_from_this();
  thr_ = std::thread([self]{ self->loop(); });
}

bool Worker::post(Task task, std::uint64_t ticket) {
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (stopping_ || slot_) return false;
    slot_.emplace(Job{std::move(task), ticket});
  }
  cv_.notify_one();
  return true;
}

void Worker::requestStop() {
  {
    std::lock_guard<std::mutex> lk(mx_);
    stopping_ = true;
  }
  cv_.notify_all();
}

void Worker::closeMailbox() {
  std::lock_guard<std::mutex> lk(mx_);
  stopping_ = true;
}

void Worker::disconnect() {
  std::lock_guard<std::mutex> lk(sinkMx_);
  sink_ = nullptr;
}

bool Worker::join(std::chrono::milliseconds grace) {
  if (!thr_.joinable()) return true;
  if (thr_.get_id() == std::this_thread::get_id()) return false;

  if (exited_.wait_for(grace) == std::future_status::ready) {
    thr_.join();
    return true;
  }

  logger().log(LogLevel::Warn, "worker did not exit within grace period; abandoning",
               { {"worker", id_}, {"graceMs", std::to_string(grace.count())} });
  thr_.detach();
  return false;
}

bool Worker::exited() const {
  return exited_.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
}

void Worker::report(WorkerMessage msg) {
  std::lock_guard<std::mutex> lk(sinkMx_);
  if (sink_) sink_(std::move(msg));
}

void Worker::loop() {
  util::Logger::Scoped ctx(std::vector<util::Field>{ {"worker", id_} });
  int exitCode = 0;

  for (;;) {
    Job job;
    {
      std::unique_lock<std::mutex> lk(mx_);
      cv_.wait(lk, [this]{ return stopping_ || slot_.has_value(); });
      if (!slot_) break;   // stopping with nothing to do
      job = std::move(*slot_);
      slot_.reset();
    }

    WorkerMessage msg;
    msg.workerId = id_;
    msg.taskId   = job.task.id;
    msg.ticket   = job.ticket;

    const Handler h = handlers_ ? handlers_->find(job.task.type) : Handler{};
    if (!h) {
      msg.type  = WorkerMessage::Type::TaskFailed;
      msg.kind  = ErrorKind::UnknownTaskType;
      msg.error = "Unknown task type: " + job.task.type;
      report(std::move(msg));
      continue;
    }

    bool crashed = false;
    const auto t0 = std::chrono::steady_clock::now();
    try {
      msg.result = h(job.task.data);
      msg.type   = WorkerMessage::Type::TaskCompleted;
    } catch (const WorkerFault& e) {
      msg.type  = WorkerMessage::Type::WorkerError;
      msg.kind  = ErrorKind::WorkerCrashed;
      msg.error = e.what();
      crashed   = true;
    } catch (const std::exception& e) {
      msg.type  = WorkerMessage::Type::TaskFailed;
      msg.kind  = ErrorKind::TaskExecutionError;
      msg.error = e.what();
    } catch (...) {
      // Not a std::exception: treat the context as corrupted.
      msg.type  = WorkerMessage::Type::WorkerError;
      msg.kind  = ErrorKind::WorkerCrashed;
      msg.error = "worker terminated by non-standard exception";
      crashed   = true;
    }
    msg.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0);
    msg.memoryUsage = util::residentMemoryBytes();
    // Close the mailbox before anyone hears about the crash.
    if (crashed) closeMailbox();
    report(std::move(msg));

    if (crashed) {
      exitCode = 1;
      break;
    }
  }

  closeMailbox();

  WorkerMessage bye;
  bye.type     = WorkerMessage::Type::WorkerExited;
  bye.workerId = id_;
  bye.exitCode = exitCode;
  report(std::move(bye));

  exitedPromise_.set_value();
}

} // namespace cpupool::rt
