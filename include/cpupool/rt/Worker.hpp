#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "cpupool/HandlerRegistry.hpp"
#include "cpupool/Task.hpp"

namespace cpupool::rt {

// What a worker tells the coordinator. Exactly one TaskCompleted or TaskFailed
// per task; WorkerError precedes WorkerExited when the thread dies mid-task.
struct WorkerMessage {
  enum class Type { TaskCompleted, TaskFailed, WorkerError, WorkerExited };

  Type type = Type::TaskCompleted;
  std::string workerId;
  std::string taskId;
  std::uint64_t ticket = 0;
  std::string result;
  std::string error;
  ErrorKind kind = ErrorKind::TaskExecutionError;
  std::chrono::milliseconds duration{0};
  std::uint64_t memoryUsage = 0;   // process RSS after the task, bytes
  int exitCode = 0;
};

// One OS thread running one task at a time. Tasks arrive through a
// single-slot mailbox; results leave through the sink.
class Worker : public std::enable_shared_from_this<Worker> {
public:
  using Sink = std::function<void(WorkerMessage)>;

  static std::shared_ptr<Worker> spawn(std::string id,
                                       std::shared_ptr<const HandlerRegistry> handlers,
                                       Sink sink);
  ~Worker();

  Worker(const Worker&)            = delete;
  Worker& operator=(const Worker&) = delete;

  const std::string& id() const noexcept { return id_; }

  // Hand one task over. Returns false if a task is already waiting or the
  // worker is stopping.
  bool post(Task task, std::uint64_t ticket);

  // Close the mailbox; the thread exits once its current task (if any) returns.
  void requestStop();

  // Stop delivering messages. Blocks while a message is being delivered.
  void disconnect();

  // Wait up to `grace` for the thread to finish. Joins on success, detaches
  // otherwise. Returns true if the thread was joined.
  bool join(std::chrono::milliseconds grace);

  bool exited() const;

private:
  Worker(std::string id, std::shared_ptr<const HandlerRegistry> handlers, Sink sink);

  void start();
  void closeMailbox();
  void loop();
  void report(WorkerMessage msg);

  struct Job {
    Task task;
    std::uint64_t ticket;
  };

  const std::string                      id_;
  std::shared_ptr<const HandlerRegistry> handlers_;

  std::mutex               sinkMx_;
  Sink                     sink_;

  mutable std::mutex       mx_;
  std::condition_variable  cv_;
  std::optional<Job>       slot_;
  bool                     stopping_{false};

  std::promise<void>       exitedPromise_;
  std::shared_future<void> exited_;
  std::thread              thr_;
};

} // namespace cpupool::rt
