#pragma once
#include "pz/geometry/Geometry.hpp"

namespace pz {

// Host-side view of the element being zoomed. Values may change between
// calls (resize, image load); the engine reads them on every step.
class GeometryProvider {
public:
  virtual ~GeometryProvider() = default;
  virtual Rect containerRect() const = 0;
  virtual Size2 elementSize() const = 0;
  virtual Size2 contentSize() const = 0;
  virtual Size2 naturalSize() const = 0;

  GeometrySnapshot snapshot() const {
    GeometrySnapshot g;
    g.container = containerRect();
    g.element = elementSize();
    g.content = contentSize();
    g.natural = naturalSize();
    return g;
  }
};

} // namespace pz
