#pragma once
#include <cstdint>
#include <functional>

namespace pz {

using TaskHandle = std::uint32_t;

inline constexpr TaskHandle kInvalidTask = 0;

// Host timer service. Tasks run on the host's (single) thread.
// A repeating task returns true to keep running, false to stop.
class TaskScheduler {
public:
  virtual ~TaskScheduler() = default;
  virtual TaskHandle scheduleRepeating(int intervalMs, std::function<bool()> task) = 0;
  virtual void cancel(TaskHandle handle) = 0;
  virtual bool isScheduled(TaskHandle handle) const = 0;
};

} // namespace pz
