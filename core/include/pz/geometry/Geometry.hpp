#pragma once

namespace pz {

struct Size2 {
  double width{0}, height{0};

  bool isEmpty() const { return width <= 0.0 || height <= 0.0; }
};

// Client-space box, 0=left/top
struct Rect {
  double left{0}, top{0}, width{0}, height{0};

  double right() const { return left + width; }
  double bottom() const { return top + height; }
  Size2 size() const { return Size2{width, height}; }
};

enum class Axis { X, Y };

// Geometry read from the provider for one update step.
struct GeometrySnapshot {
  Rect container;       // bounding box of the container (parent of the surface)
  Size2 element;        // unscaled layout size of the transformed surface
  Size2 content;        // unscaled rendered size of the content inside it
  Size2 natural;        // intrinsic pixel size of the content, zero until known

  double containerSize(Axis a) const { return a == Axis::X ? container.width : container.height; }
  double elementSize(Axis a) const { return a == Axis::X ? element.width : element.height; }
  double contentSize(Axis a) const { return a == Axis::X ? content.width : content.height; }
};

} // namespace pz
