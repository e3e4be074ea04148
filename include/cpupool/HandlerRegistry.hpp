#pragma once
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cpupool {

/// A task body: payload in, result out. Throwing reports a failed task.
using Handler = std::function<std::string(const std::string& data)>;

class HandlerRegistry {
public:
    HandlerRegistry() = default;

    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;

    /// Register a handler under `type`, replacing any previous one.
    /// Throws std::invalid_argument for an empty type or handler.
    void registerHandler(const std::string& type, Handler h);

    /// Lookup by type. Returns an empty Handler if not found.
    Handler find(const std::string& type) const;

    bool contains(const std::string& type) const;

    /// Sorted list of registered types.
    std::vector<std::string> types() const;

private:
    std::unordered_map<std::string, Handler> _map;
    mutable std::shared_mutex _mutex;
};

}
