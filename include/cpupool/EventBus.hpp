#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>

namespace cpupool {

enum class EventType {
  WorkerCreated,
  WorkerError,
  WorkerExited,
  TaskCompleted,
  TaskFailed,
  TaskTimedOut,
  ShutdownStarted,
  ShutdownCompleted
};

const char* eventTypeName(EventType t);

struct PoolEvent {
  EventType type = EventType::TaskCompleted;
  std::string workerId;
  std::string taskId;
  std::string message;
  std::chrono::milliseconds duration{0};
  int exitCode = 0;
};

/// Fan-out of pool lifecycle events to subscribers.
class EventBus {
public:
    using Listener = std::function<void(const PoolEvent&)>;
    using Token    = std::uint64_t;

    /// Subscribe to every event. The returned token unsubscribes.
    Token subscribe(Listener listener);

    /// Subscribe to one event type.
    Token subscribe(EventType type, Listener listener);

    /// Returns false for an unknown token.
    bool unsubscribe(Token token);

    /// Deliver to a snapshot of the current listeners, outside the lock.
    /// A throwing listener is logged and skipped.
    void publish(const PoolEvent& ev) const;

    std::size_t listenerCount() const;

private:
    struct Entry {
        bool     filtered = false;
        EventType type    = EventType::TaskCompleted;
        Listener fn;
    };

    std::map<Token, Entry>    _listeners;
    Token                     _next = 1;
    mutable std::shared_mutex _mutex;
};

} // namespace cpupool
