#pragma once
#include "pz/core/Result.hpp"
#include "pz/geometry/GeometryProvider.hpp"
#include "pz/gesture/GestureEvent.hpp"
#include "pz/sched/TaskScheduler.hpp"
#include "pz/transform/TransformChannel.hpp"
#include "pz/transform/TransformMath.hpp"
#include "pz/transform/TransformState.hpp"
#include "pz/transform/ZoomConfig.hpp"

namespace pz {

// Owns the authoritative transform of one zoomable element.
//
// Gesture events come from GestureClassifier (client coordinates); geometry is
// re-read from the provider on every step. Every change is published on
// channel(). The baseline for the next gesture is committed only at gesture
// end and after programmatic operations.
class TransformEngine {
public:
  TransformEngine() = default;
  ~TransformEngine();

  TransformEngine(const TransformEngine&) = delete;
  TransformEngine& operator=(const TransformEngine&) = delete;

  // geometry is required and must outlive the engine (or teardown()).
  // scheduler is optional; without one a "fit-natural" max scale is only
  // resolved when the natural size is already known or on redetectMaxScale().
  ZoomResult init(const ZoomConfig& cfg, GeometryProvider* geometry,
                  TaskScheduler* scheduler = nullptr);

  // Cancels pending work and resets the transform. Safe to call twice.
  void teardown();
  bool isInitialized() const { return initialized_; }

  ZoomResult handleGesture(const GestureEvent& ev);

  // Programmatic control. Each commits its result.
  ZoomResult zoomIn(double step);
  ZoomResult zoomOut(double step);
  ZoomResult toggleZoom();                                  // anchored at element center
  ZoomResult toggleZoomAt(double clientX, double clientY);  // anchored at a point
  ZoomResult zoomToPoint(double clientX, double clientY, double targetScale);
  ZoomResult resetZoom();
  ZoomResult restoreTransform(double scale, double translateX, double translateY);

  // Re-run natural-size detection (e.g. after the content source changed).
  ZoomResult redetectMaxScale();

  const TransformState& state() const { return state_; }
  ExtendedTransformState extendedState() const;
  double scale() const { return state_.scale; }
  double maxScale() const { return constraints_.maxScale; }
  bool maxScaleResolved() const { return maxScaleResolved_; }
  bool isPollingMaxScale() const { return pollHandle_ != kInvalidTask; }
  const Constraints& constraints() const { return constraints_; }
  const ZoomConfig& config() const { return config_; }
  const GestureSession& session() const { return session_; }

  bool isDragging() const;

  TransformChannel& channel() { return channel_; }

private:
  ZoomResult notInitialized(const char* op) const;

  void beginPan(const GestureEvent& ev, const GeometrySnapshot& g);
  void beginPinch(const GestureEvent& ev, const GeometrySnapshot& g);
  void movePan(const GestureEvent& ev, const GeometrySnapshot& g);
  void movePinch(const GestureEvent& ev, const GeometrySnapshot& g);
  void settle(const GeometrySnapshot& g);
  void wheel(const GestureEvent& ev, const GeometrySnapshot& g);

  // Zoom to `target` anchored at an offset from the committed translate,
  // align to the container, commit and publish.
  void zoomCommitted(double target, double anchorX, double anchorY,
                     const GeometrySnapshot& g, UpdateReason reason);
  void resetCommitted(UpdateReason reason);

  bool tryResolveMaxScale();
  void startMaxScalePoll();
  void cancelMaxScalePoll();

  void publish(UpdateReason reason, bool animate, double previousScale);

  ZoomConfig config_;
  Constraints constraints_;
  TransformState state_;
  GestureSession session_;
  TransformChannel channel_;

  GeometryProvider* geometry_{nullptr};
  TaskScheduler* scheduler_{nullptr};
  TaskHandle pollHandle_{kInvalidTask};
  bool maxScaleResolved_{false};
  bool initialized_{false};
};

} // namespace pz
