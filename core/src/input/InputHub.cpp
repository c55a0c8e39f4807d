#include "pz/input/InputSource.hpp"

#include <algorithm>

namespace pz {

void InputHub::addSink(InputSink* sink) {
  if (!sink) return;
  if (contains(sink)) return;
  sinks_.push_back(sink);
}

void InputHub::removeSink(InputSink* sink) {
  sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

bool InputHub::contains(const InputSink* sink) const {
  return std::find(sinks_.begin(), sinks_.end(), sink) != sinks_.end();
}

// Dispatch over a copy: a sink may detach itself (or another sink) from inside
// its callback. Sinks removed mid-dispatch are skipped.
void InputHub::press(const PointerEvent& ev) {
  auto sinks = sinks_;
  for (auto* s : sinks) {
    if (contains(s)) s->onPress(ev);
  }
}

void InputHub::move(const PointerEvent& ev) {
  auto sinks = sinks_;
  for (auto* s : sinks) {
    if (contains(s)) s->onMove(ev);
  }
}

void InputHub::release(const PointerEvent& ev) {
  auto sinks = sinks_;
  for (auto* s : sinks) {
    if (contains(s)) s->onRelease(ev);
  }
}

void InputHub::wheel(const WheelEvent& ev) {
  auto sinks = sinks_;
  for (auto* s : sinks) {
    if (contains(s)) s->onWheel(ev);
  }
}

} // namespace pz
