#pragma once
#include "pz/core/Result.hpp"

#include <cstdint>
#include <string>

namespace pz {

enum class MaxScaleMode : std::uint8_t {
  Fixed = 0,     // maxScale is used as given
  FitNatural     // resolved to naturalWidth / renderedWidth once the content has loaded
};

struct ZoomConfig {
  double minScale{0.0};
  MaxScaleMode maxScaleMode{MaxScaleMode::FitNatural};
  double maxScale{3.0};            // Fixed mode value
  double defaultMaxScale{3.0};     // used until FitNatural resolves

  bool panEnabled{true};
  bool panClampEnabled{false};
  double minScaleForPan{1.0001};

  bool doubleTapEnabled{true};
  double doubleTapScale{2.0};
  double doubleTapWindowMs{300.0};
  double doubleTapMaxOffsetPx{0.0};
  double moveThresholdPx{0.0};

  bool wheelEnabled{true};
  double wheelStep{0.2};

  bool draggableOnPinch{false};    // pan with the pinch midpoint while pinching

  double stepZoomScale{1.0};       // toggle without a point zooms to 1 + this
  bool autoZoomOut{false};         // snap back to rest after every pinch

  bool clickToZoomEnabled{false};
  double clickToZoomScale{2.5};

  int transitionDurationMs{200};
  int naturalPollIntervalMs{10};
};

// Checks ranges and cross-field constraints. Returns INVALID_CONFIG on error.
ZoomResult validateZoomConfig(const ZoomConfig& cfg);

// Parse a JSON object of options over the defaults already in `out`.
// Unknown keys are ignored; a known key with the wrong type is CONFIG_PARSE.
// "maxScale" accepts a number or the string "fit-natural".
ZoomResult parseZoomConfig(const std::string& json, ZoomConfig& out);

std::string serializeZoomConfig(const ZoomConfig& cfg);

} // namespace pz
