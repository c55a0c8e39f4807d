#include "pz/transform/TransformChannel.hpp"

#include <algorithm>
#include <utility>

namespace pz {

ListenerId TransformChannel::subscribe(TransformListener listener) {
  if (!listener) return 0;
  ListenerId id = nextId_++;
  listeners_.push_back(Slot{id, std::move(listener)});
  return id;
}

void TransformChannel::unsubscribe(ListenerId id) {
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const Slot& s) { return s.id == id; }),
                   listeners_.end());
}

void TransformChannel::clear() {
  listeners_.clear();
}

void TransformChannel::publish(const TransformUpdate& update) {
  published_++;
  // Copy so a listener can unsubscribe from inside its callback.
  auto listeners = listeners_;
  for (const auto& s : listeners) s.fn(update);
}

} // namespace pz
