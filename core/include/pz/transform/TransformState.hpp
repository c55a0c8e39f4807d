#pragma once

namespace pz {

// Authoritative transform. translate is in the container's pixel space,
// applied as translate(x, y) scale(s) with origin at the element's top-left.
struct TransformState {
  double scale{1.0};
  double translateX{0.0};
  double translateY{0.0};

  // Baseline committed at the end of the previous gesture.
  double initialScale{1.0};
  double initialTranslateX{0.0};
  double initialTranslateY{0.0};

  void commit() {
    initialScale = scale;
    initialTranslateX = translateX;
    initialTranslateY = translateY;
  }

  void reset() {
    scale = 1.0;
    translateX = 0.0;
    translateY = 0.0;
    commit();
  }
};

// Transform plus the flags hosts use for zoom button state.
struct ExtendedTransformState {
  double scale{1.0};
  double translateX{0.0};
  double translateY{0.0};
  bool isZoomedIn{false};
  bool atMaxScale{false};
  bool atMinScale{false};
  bool canZoomIn{true};
  bool canZoomOut{false};
};

} // namespace pz
