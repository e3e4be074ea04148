#include "cpupool/rt/PendingRegistry.hpp"

#include <utility>

namespace cpupool::rt {

static void disarm(PendingEntry& e) {
  if (e.timer) e.timer->cancel();
}

bool PendingRegistry::add(const std::string& id, PendingEntry entry) {
  return entries_.emplace(id, std::move(entry)).second;
}

std::optional<PendingEntry> PendingRegistry::take(const std::string& id) {
  auto it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;

  PendingEntry e = std::move(it->second);
  entries_.erase(it);
  disarm(e);
  return e;
}

std::optional<PendingEntry> PendingRegistry::take(const std::string& id, std::uint64_t ticket) {
  auto it = entries_.find(id);
  if (it == entries_.end() || it->second.ticket != ticket) return std::nullopt;
  return take(id);
}

std::vector<std::pair<std::string, PendingEntry>> PendingRegistry::takeAll() {
  std::vector<std::pair<std::string, PendingEntry>> out;
  out.reserve(entries_.size());
  for (auto& kv : entries_) {
    disarm(kv.second);
    out.emplace_back(kv.first, std::move(kv.second));
  }
  entries_.clear();
  return out;
}

bool PendingRegistry::contains(const std::string& id) const {
  return entries_.count(id) != 0;
}

std::optional<std::uint64_t> PendingRegistry::ticket(const std::string& id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;
  return it->second.ticket;
}

} // namespace cpupool::rt
