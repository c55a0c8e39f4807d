#include "pz/sched/ManualScheduler.hpp"

#include <algorithm>
#include <utility>

namespace pz {

TaskHandle ManualScheduler::scheduleRepeating(int intervalMs, std::function<bool()> task) {
  if (!task) return kInvalidTask;
  TaskHandle h = nextHandle_++;
  Entry e;
  e.intervalMs = std::max(intervalMs, 1);
  e.dueMs = nowMs_ + static_cast<double>(e.intervalMs);
  e.task = std::move(task);
  tasks_.emplace(h, std::move(e));
  return h;
}

void ManualScheduler::cancel(TaskHandle handle) {
  tasks_.erase(handle);
}

bool ManualScheduler::isScheduled(TaskHandle handle) const {
  return tasks_.count(handle) != 0;
}

std::size_t ManualScheduler::advance(double ms) {
  double target = nowMs_ + std::max(ms, 0.0);
  std::size_t runs = 0;

  for (;;) {
    // Earliest due task (lowest handle on ties, for a stable order)
    TaskHandle next = kInvalidTask;
    double nextDue = 0;
    for (const auto& kv : tasks_) {
      if (kv.second.dueMs > target) continue;
      if (next == kInvalidTask || kv.second.dueMs < nextDue ||
          (kv.second.dueMs == nextDue && kv.first < next)) {
        next = kv.first;
        nextDue = kv.second.dueMs;
      }
    }
    if (next == kInvalidTask) break;

    nowMs_ = nextDue;
    // Copy: the task may cancel itself or schedule others.
    auto task = tasks_[next].task;
    bool keep = task();
    runs++;

    auto it = tasks_.find(next);
    if (it == tasks_.end()) continue;
    if (keep) {
      it->second.dueMs += static_cast<double>(it->second.intervalMs);
    } else {
      tasks_.erase(it);
    }
  }

  nowMs_ = target;
  return runs;
}

} // namespace pz
