#pragma once
#include "pz/core/Result.hpp"
#include "pz/gesture/GestureClassifier.hpp"
#include "pz/input/InputSource.hpp"
#include "pz/transform/TransformEngine.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pz {

// One zoomable element: routes raw input through the classifier into the
// engine. Registers itself with the input source on init and unregisters on
// teardown (or destruction).
class PinchZoom : public InputSink {
public:
  PinchZoom() = default;
  ~PinchZoom() override;

  PinchZoom(const PinchZoom&) = delete;
  PinchZoom& operator=(const PinchZoom&) = delete;

  ZoomResult init(const ZoomConfig& cfg, GeometryProvider* geometry,
                  TaskScheduler* scheduler = nullptr, InputSource* input = nullptr);
  void teardown();
  bool isInitialized() const { return engine_.isInitialized(); }

  // While disabled, raw input is dropped; programmatic calls still work.
  void setEnabled(bool enabled);
  bool isEnabled() const { return enabled_; }

  // InputSink
  void onPress(const PointerEvent& ev) override;
  void onMove(const PointerEvent& ev) override;
  void onRelease(const PointerEvent& ev) override;
  void onWheel(const WheelEvent& ev) override;

  // Programmatic control (zoom buttons, host shortcuts).
  ZoomResult zoomIn(double step) { return engine_.zoomIn(step); }
  ZoomResult zoomOut(double step) { return engine_.zoomOut(step); }
  ZoomResult toggleZoom() { return engine_.toggleZoom(); }
  ZoomResult zoomToPoint(double clientX, double clientY, double targetScale) {
    return engine_.zoomToPoint(clientX, clientY, targetScale);
  }
  ZoomResult resetZoom() { return engine_.resetZoom(); }
  ZoomResult redetectMaxScale() { return engine_.redetectMaxScale(); }

  // Click-to-zoom at a point with the configured scale. DISABLED when the
  // option is off.
  ZoomResult clickAt(double clientX, double clientY);

  std::string snapshotJson() const;
  ZoomResult restoreJson(const std::string& json);

  TransformEngine& engine() { return engine_; }
  const TransformEngine& engine() const { return engine_; }
  const GestureClassifier& classifier() const { return classifier_; }
  TransformChannel& channel() { return engine_.channel(); }

  // Every gesture the classifier produced since init (for hosts that mirror
  // gesture state in their UI, and for tests).
  std::uint64_t gestureCount() const { return gestureCount_; }
  const GestureEvent& lastGesture() const { return lastGesture_; }

private:
  void dispatch(const std::vector<GestureEvent>& events, PointerDevice device);

  GestureClassifier classifier_;
  TransformEngine engine_;
  InputSource* input_{nullptr};
  bool enabled_{true};
  std::uint64_t gestureCount_{0};
  GestureEvent lastGesture_{};
};

} // namespace pz
