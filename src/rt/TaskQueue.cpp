#include "cpupool/rt/TaskQueue.hpp"

#include <utility>

namespace cpupool::rt {

void TaskQueue::push(Task task) {
  const Key key{task.priority, nextSeq_++};
  index_[task.id] = key;
  items_.emplace(key, std::move(task));
}

std::optional<Task> TaskQueue::pop() {
  if (items_.empty()) return std::nullopt;
  auto it = items_.begin();
  Task t = std::move(it->second);
  items_.erase(it);
  index_.erase(t.id);
  return t;
}

bool TaskQueue::remove(const std::string& id) {
  auto it = index_.find(id);
  if (it == index_.end()) return false;
  items_.erase(it->second);
  index_.erase(it);
  return true;
}

bool TaskQueue::contains(const std::string& id) const {
  return index_.count(id) != 0;
}

std::vector<Task> TaskQueue::drain() {
  std::vector<Task> out;
  out.reserve(items_.size());
  for (auto& kv : items_) out.push_back(std::move(kv.second));
  items_.clear();
  index_.clear();
  return out;
}

std::vector<std::string> TaskQueue::ids() const {
  std::vector<std::string> out;
  out.reserve(items_.size());
  for (auto& kv : items_) out.push_back(kv.second.id);
  return out;
}

} // namespace cpupool::rt
