#pragma once
#include "pz/input/InputEvents.hpp"

#include <cstddef>
#include <vector>

namespace pz {

class InputSink {
public:
  virtual ~InputSink() = default;
  virtual void onPress(const PointerEvent& ev) = 0;
  virtual void onMove(const PointerEvent& ev) = 0;
  virtual void onRelease(const PointerEvent& ev) = 0;
  virtual void onWheel(const WheelEvent& ev) = 0;
};

// Where raw events come from. Sinks register on attach and must
// unregister before they are destroyed.
class InputSource {
public:
  virtual ~InputSource() = default;
  virtual void addSink(InputSink* sink) = 0;
  virtual void removeSink(InputSink* sink) = 0;
};

// Fan-out source the host pushes events into from its own callbacks.
class InputHub : public InputSource {
public:
  void addSink(InputSink* sink) override;
  void removeSink(InputSink* sink) override;
  std::size_t sinkCount() const { return sinks_.size(); }

  void press(const PointerEvent& ev);
  void move(const PointerEvent& ev);
  void release(const PointerEvent& ev);
  void wheel(const WheelEvent& ev);

private:
  bool contains(const InputSink* sink) const;

  std::vector<InputSink*> sinks_;
};

} // namespace pz
