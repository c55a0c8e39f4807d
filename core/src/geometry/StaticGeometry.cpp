#include "pz/geometry/StaticGeometry.hpp"

namespace pz {

StaticGeometry::StaticGeometry(double left, double top, double width, double height)
    : container_{left, top, width, height},
      element_{width, height},
      content_{width, height} {}

void StaticGeometry::setContainerRect(const Rect& r) {
  container_ = r;
}

void StaticGeometry::setElementSize(double width, double height) {
  element_.width = width;
  element_.height = height;
}

void StaticGeometry::setContentSize(double width, double height) {
  content_.width = width;
  content_.height = height;
}

void StaticGeometry::setNaturalSize(double width, double height) {
  natural_.width = width;
  natural_.height = height;
}

} // namespace pz
