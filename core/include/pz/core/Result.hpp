#pragma once
#include <string>

namespace pz {

struct ZoomError {
  std::string code;     // e.g. "NOT_INITIALIZED"
  std::string message;  // human text
};

struct ZoomResult {
  bool ok{true};
  ZoomError err{};
  double scale{1.0};    // engine scale after the operation
};

inline ZoomResult makeError(const std::string& code, const std::string& message) {
  ZoomResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  return r;
}

inline ZoomResult makeOk(double scale) {
  ZoomResult r;
  r.scale = scale;
  return r;
}

} // namespace pz
