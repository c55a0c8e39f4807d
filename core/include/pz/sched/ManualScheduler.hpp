#pragma once
#include "pz/sched/TaskScheduler.hpp"

#include <cstddef>
#include <unordered_map>

namespace pz {

// Scheduler driven by the host's frame loop (or a test) through advance().
// No threads: tasks run inside advance() on the caller's thread.
class ManualScheduler : public TaskScheduler {
public:
  TaskHandle scheduleRepeating(int intervalMs, std::function<bool()> task) override;
  void cancel(TaskHandle handle) override;
  bool isScheduled(TaskHandle handle) const override;

  // Move the clock forward, running every task that comes due (repeatedly
  // for intervals shorter than `ms`). Returns the number of task runs.
  std::size_t advance(double ms);

  double nowMs() const { return nowMs_; }
  std::size_t pendingCount() const { return tasks_.size(); }

private:
  struct Entry {
    int intervalMs{0};
    double dueMs{0};
    std::function<bool()> task;
  };

  double nowMs_{0};
  TaskHandle nextHandle_{1};
  std::unordered_map<TaskHandle, Entry> tasks_;
};

} // namespace pz
