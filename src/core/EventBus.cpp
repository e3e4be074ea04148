#include "cpupool/EventBus.hpp"
#include "cpupool/util/Logger.hpp"

#include <exception>
#include <mutex>
#include <vector>

namespace cpupool {

const char* eventTypeName(EventType t) {
  switch (t) {
    case EventType::WorkerCreated:     return "worker_created";
    case EventType::WorkerError:       return "worker_error";
    case EventType::WorkerExited:      return "worker_exited";
    case EventType::TaskCompleted:     return "task_completed";
    case EventType::TaskFailed:        return "task_failed";
    case EventType::TaskTimedOut:      return "task_timed_out";
    case EventType::ShutdownStarted:   return "shutdown_started";
    case EventType::ShutdownCompleted: return "shutdown_completed";
  }
  return "unknown";
}

EventBus::Token EventBus::subscribe(Listener listener) {
  std::unique_lock<std::shared_mutex> lock(_mutex);
  const Token t = _next++;
  _listeners[t] = Entry{false, EventType::TaskCompleted, std::move(listener)};
  return t;
}

EventBus::Token EventBus::subscribe(EventType type, Listener listener) {
  std::unique_lock<std::shared_mutex> lock(_mutex);
  const Token t = _next++;
  _listeners[t] = Entry{true, type, std::move(listener)};
  return t;
}

bool EventBus::unsubscribe(Token token) {
  std::unique_lock<std::shared_mutex> lock(_mutex);
  return _listeners.erase(token) != 0;
}

std::size_t EventBus::listenerCount() const {
  std::shared_lock<std::shared_mutex> lock(_mutex);
  return _listeners.size();
}

void EventBus::publish(const PoolEvent& ev) const {
  // Collect matching listeners; call them outside the lock
  std::vector<Listener> toNotify;
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    for (auto& kv : _listeners) {
      const Entry& e = kv.second;
      if (!e.fn) continue;
      if (e.filtered && e.type != ev.type) continue;
      toNotify.push_back(e.fn);
    }
  }

  for (auto& fn : toNotify) {
    try {
      fn(ev);
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Warn, "event listener threw",
                         { {"event", eventTypeName(ev.type)}, {"error", ex.what()} });
    } catch (...) {
      util::logger().log(util::LogLevel::Warn, "event listener threw",
                         { {"event", eventTypeName(ev.type)}, {"error", "unknown"} });
    }
  }
}

} // namespace cpupool
