#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cpupool/Task.hpp"

namespace cpupool::rt {

// Priority-ordered holding area. Higher priority first, FIFO among equals.
// Not synchronized: owned and mutated by the pool coordinator only.
class TaskQueue {
public:
  TaskQueue() = default;

  TaskQueue(const TaskQueue&)            = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  void push(Task task);

  // Highest priority, earliest submitted.
  std::optional<Task> pop();

  // Drop a queued task by id. Returns false if it is not queued.
  bool remove(const std::string& id);

  bool contains(const std::string& id) const;

  // Everything still queued, in dispatch order; leaves the queue empty.
  std::vector<Task> drain();

  // Ids in dispatch order.
  std::vector<std::string> ids() const;

  std::size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }

private:
  struct Key {
    int priority;
    std::uint64_t seq;
  };
  struct KeyOrder {
    bool operator()(const Key& a, const Key& b) const {
      if (a.priority != b.priority) return a.priority > b.priority;
      return a.seq < b.seq;
    }
  };

  std::map<Key, Task, KeyOrder>        items_;
  std::unordered_map<std::string, Key> index_;
  std::uint64_t                        nextSeq_{0};
};

} // namespace cpupool::rt
