#pragma once
#include "pz/geometry/GeometryProvider.hpp"

namespace pz {

// Settable geometry for hosts that push layout changes, and for tests.
class StaticGeometry : public GeometryProvider {
public:
  StaticGeometry() = default;

  // Convenience: container, element and content all the same size at (left, top).
  StaticGeometry(double left, double top, double width, double height);

  void setContainerRect(const Rect& r);
  void setElementSize(double width, double height);
  void setContentSize(double width, double height);
  void setNaturalSize(double width, double height);

  Rect containerRect() const override { return container_; }
  Size2 elementSize() const override { return element_; }
  Size2 contentSize() const override { return content_; }
  Size2 naturalSize() const override { return natural_; }

private:
  Rect container_;
  Size2 element_;
  Size2 content_;
  Size2 natural_;
};

} // namespace pz
