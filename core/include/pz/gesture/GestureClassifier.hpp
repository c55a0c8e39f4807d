#pragma once
#include "pz/gesture/GestureEvent.hpp"
#include "pz/input/InputEvents.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pz {

// Touch state machine.
// Idle -> Touched -> Panning | Pinching -> (Settling) -> Idle
enum class GestureState : std::uint8_t {
  Idle = 0,
  Touched,    // contact(s) down, no qualifying movement yet
  Panning,
  Pinching,
  Settling    // session over for input purposes, waiting for remaining contacts to lift
};

struct GestureClassifierConfig {
  double doubleTapWindowMs{300.0};   // second press must start within this of the prior tap
  double doubleTapMaxOffsetPx{0.0};  // 0 = no spatial limit
  double moveThresholdPx{0.0};       // Touched -> Panning once moved further than this
};

class GestureClassifier {
public:
  void setConfig(const GestureClassifierConfig& cfg) { config_ = cfg; }
  const GestureClassifierConfig& config() const { return config_; }

  // Each returns the gestures the sample produced (usually zero or one).
  std::vector<GestureEvent> onPress(const PointerEvent& ev);
  std::vector<GestureEvent> onMove(const PointerEvent& ev);
  std::vector<GestureEvent> onRelease(const PointerEvent& ev);

  // Wheel ticks are independent of touch tracking.
  GestureEvent onWheel(const WheelEvent& ev) const;

  // Drop all tracking, including the pending double-tap window.
  void reset();

  GestureState state() const { return state_; }
  GestureKind activeKind() const;
  std::size_t contactCount() const { return downIds_.size(); }

  static double distance(const Contact& a, const Contact& b);

private:
  bool isDown(int id) const;
  static const Contact* findContact(const std::vector<Contact>& contacts, int id);
  void syncDown(const std::vector<Contact>& contacts);
  GestureEvent endEvent(GestureKind kind, const PointerEvent& ev) const;
  GestureEvent tapEvent(const PointerEvent& ev);

  GestureClassifierConfig config_;
  GestureState state_{GestureState::Idle};
  std::vector<int> downIds_;
  std::size_t maxContacts_{0};

  int pressId_{0};
  double pressX_{0}, pressY_{0};

  int panId_{0};
  int pinchIdA_{0}, pinchIdB_{0};
  GestureKind settlingKind_{GestureKind::None};

  bool hasLastTap_{false};
  double lastTapTimeMs_{0};
  double lastTapX_{0}, lastTapY_{0};
  bool doubleTapArmed_{false};
};

} // namespace pz
