#pragma once
#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "cpupool/util/Logger.hpp"

namespace cpupool::rt {

// Ordered, run-once teardown for the process. Steps register with an order;
// stop() runs them ascending. A failing step is logged and the rest still run.
class ShutdownCoordinator {
public:
  // Lower order runs earlier; higher order runs later.
  void registerStep(std::string name, int order, std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mx_);
    steps_.push_back({std::move(name), order, std::move(fn)});
    sorted_ = false;
  }

  // Idempotent: the first caller runs every step, later callers return at once.
  // Returns the number of steps that threw.
  std::size_t stop() {
    bool expected = false;
    if (!stopping_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      return 0;
    }
    std::vector<Step> run;
    {
      std::lock_guard<std::mutex> lk(mx_);
      if (!sorted_) {
        std::stable_sort(steps_.begin(), steps_.end(), [](const Step& a, const Step& b){
          return a.order < b.order;
        });
        sorted_ = true;
      }
      run = steps_;
    }

    std::size_t failed = 0;
    for (auto& s : run) {
      util::logger().log(util::LogLevel::Debug, "shutdown step", { {"step", s.name} });
      try {
        s.fn();
      } catch (const std::exception& ex) {
        ++failed;
        util::logger().log(util::LogLevel::Error, "shutdown step failed",
                           { {"step", s.name}, {"error", ex.what()} });
      }
    }
    return failed;
  }

  bool stopping() const { return stopping_.load(std::memory_order_acquire); }

private:
  struct Step { std::string name; int order; std::function<void()> fn; };
  std::vector<Step> steps_;
  std::atomic<bool> stopping_{false};
  std::mutex mx_;
  bool sorted_{false};
};

} // namespace cpupool::rt
