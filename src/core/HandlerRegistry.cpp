#include "cpupool/HandlerRegistry.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

using namespace cpupool;

void HandlerRegistry::registerHandler(const std::string& type, Handler h) {
    if (type.empty()) throw std::invalid_argument("HandlerRegistry: empty task type");
    if (!h) throw std::invalid_argument("HandlerRegistry: empty handler for '" + type + "'");
    std::unique_lock lock(_mutex);
    _map[type] = std::move(h);
}

Handler HandlerRegistry::find(const std::string& type) const {
    std::shared_lock lock(_mutex);
    auto it = _map.find(type);
    if (it == _map.end()) return {};
    return it->second;
}

bool HandlerRegistry::contains(const std::string& type) const {
    std::shared_lock lock(_mutex);
    return _map.count(type) != 0;
}

std::vector<std::string> HandlerRegistry::types() const {
    std::shared_lock lock(_mutex);
    std::vector<std::string> v;
    v.reserve(_map.size());
    for (const auto& kv : _map) {
        v.push_back(kv.first);
    }
    std::sort(v.begin(), v.end());
    return v;
}
