#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace pz {

enum class UpdateReason : std::uint8_t {
  Pan = 0,
  Pinch,
  Settle,            // gesture end alignment / commit
  Wheel,
  DoubleTap,
  Toggle,
  StepZoom,
  PointZoom,
  Reset,
  Restore,
  MaxScaleResolved,
  Teardown
};

inline const char* toString(UpdateReason r) {
  switch (r) {
    case UpdateReason::Pan: return "pan";
    case UpdateReason::Pinch: return "pinch";
    case UpdateReason::Settle: return "settle";
    case UpdateReason::Wheel: return "wheel";
    case UpdateReason::DoubleTap: return "doubleTap";
    case UpdateReason::Toggle: return "toggle";
    case UpdateReason::StepZoom: return "stepZoom";
    case UpdateReason::PointZoom: return "pointZoom";
    case UpdateReason::Reset: return "reset";
    case UpdateReason::Restore: return "restore";
    case UpdateReason::MaxScaleResolved: return "maxScaleResolved";
    case UpdateReason::Teardown: return "teardown";
    default: return "unknown";
  }
}

// Target transform for the host to render. The core never interpolates:
// `animate` tells the host to ease over durationMs instead of jumping.
struct TransformUpdate {
  double scale{1.0};
  double translateX{0.0};
  double translateY{0.0};
  bool scaleChanged{false};
  bool animate{false};
  int durationMs{0};
  UpdateReason reason{UpdateReason::Pan};
};

using TransformListener = std::function<void(const TransformUpdate&)>;
using ListenerId = std::uint32_t;

class TransformChannel {
public:
  ListenerId subscribe(TransformListener listener);
  void unsubscribe(ListenerId id);
  void clear();

  void publish(const TransformUpdate& update);

  std::size_t listenerCount() const { return listeners_.size(); }
  std::uint64_t publishedCount() const { return published_; }

private:
  struct Slot {
    ListenerId id;
    TransformListener fn;
  };

  std::vector<Slot> listeners_;
  ListenerId nextId_{1};
  std::uint64_t published_{0};
};

} // namespace pz
