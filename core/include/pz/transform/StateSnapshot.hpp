#pragma once
#include "pz/core/Result.hpp"
#include "pz/transform/TransformState.hpp"

#include <string>

namespace pz {

// Serialize the transform (and its derived flags) to a JSON string.
std::string serializeTransformState(const ExtendedTransformState& state);

// Read scale/translateX/translateY back. Derived flags are recomputed by the
// engine on restore, so they are ignored here. STATE_PARSE on error.
ZoomResult deserializeTransformState(const std::string& json, ExtendedTransformState& out);

} // namespace pz
