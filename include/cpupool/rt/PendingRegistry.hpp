#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/steady_timer.hpp>

#include "cpupool/Task.hpp"

namespace cpupool::rt {

struct PendingEntry {
  CompletionHandler complete;
  std::chrono::steady_clock::time_point startTime{};
  std::chrono::steady_clock::time_point deadline{};
  std::uint64_t ticket = 0;   // distinguishes resubmissions of the same id
  std::unique_ptr<boost::asio::steady_timer> timer;
};

// Correlates task ids with their caller's completion handler.
// Owned by the pool coordinator; not synchronized.
class PendingRegistry {
public:
  PendingRegistry() = default;

  PendingRegistry(const PendingRegistry&)            = delete;
  PendingRegistry& operator=(const PendingRegistry&) = delete;

  // Returns false (and leaves the registry untouched) if the id is present.
  bool add(const std::string& id, PendingEntry entry);

  // Removes the entry and cancels its timer. Empty if it was already removed.
  std::optional<PendingEntry> take(const std::string& id);

  // Like take(), but only if the entry still belongs to `ticket`.
  std::optional<PendingEntry> take(const std::string& id, std::uint64_t ticket);

  // Removes everything; used by shutdown.
  std::vector<std::pair<std::string, PendingEntry>> takeAll();

  bool contains(const std::string& id) const;
  std::optional<std::uint64_t> ticket(const std::string& id) const;

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

private:
  std::unordered_map<std::string, PendingEntry> entries_;
};

} // namespace cpupool::rt
