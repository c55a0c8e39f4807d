// D1.1 — TransformMath: clamps, fixed-point compensation, pan limits, wheel snap

#include "pz/transform/TransformMath.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double tol, const char* msg) {
  if (std::fabs(a - b) > tol) {
    std::fprintf(stderr, "ASSERT FAIL: %s (%.6f vs %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static pz::GeometrySnapshot geometry(double cw, double ch, double ew, double eh) {
  pz::GeometrySnapshot g;
  g.container = pz::Rect{0, 0, cw, ch};
  g.element = pz::Size2{ew, eh};
  g.content = pz::Size2{ew, eh};
  return g;
}

int main() {
  // ---- Test 1: Scale clamp ----
  {
    pz::Constraints c;
    c.minScale = 0.0;
    c.maxScale = 3.0;
    requireClose(pz::clampScale(5.0, c), 3.0, 1e-12, "clamped to max");
    requireClose(pz::clampScale(2.0, c), 2.0, 1e-12, "in range untouched");
    requireClose(pz::clampScale(0.0, c), pz::kMinimumScale, 1e-12, "zero min keeps scale > 0");

    c.minScale = 0.5;
    requireClose(pz::clampScale(0.1, c), 0.5, 1e-12, "clamped to min");
    requireTrue(pz::isRestScale(1.0), "1 is rest");
    requireTrue(!pz::isRestScale(1.01), "1.01 is not rest");
    std::printf("  Test 1 (scale clamp): PASS\n");
  }

  // ---- Test 2: Anchor fixation on pinch ----
  {
    pz::Constraints c;
    c.maxScale = 3.0;
    auto g = geometry(800, 600, 800, 600);

    pz::GestureSession session;
    session.kind = pz::GestureKind::Pinch;
    session.initialDistance = 100.0;
    session.anchorOffsetX = 40.0;
    session.anchorOffsetY = 30.0;

    pz::TransformState s;
    pz::TransformState out = pz::applyPinch(s, session, 200.0, 40.0, 30.0, c, g);
    requireClose(out.scale, 2.0, 1e-12, "pinch 100->200 doubles scale");
    requireClose(out.translateX, -40.0, 1e-12, "anchor x fixed");
    requireClose(out.translateY, -30.0, 1e-12, "anchor y fixed");

    // Relative to a non-zero committed translate
    s.translateX = -10.0;
    s.translateY = -20.0;
    s.commit();
    out = pz::applyPinch(s, session, 200.0, 40.0, 30.0, c, g);
    requireClose(out.translateX, -50.0, 1e-12, "committed x - 40");
    requireClose(out.translateY, -50.0, 1e-12, "committed y - 30");

    // Midpoint drift is ignored unless pinch dragging is on
    pz::TransformState rest;
    out = pz::applyPinch(rest, session, 200.0, 60.0, 20.0, c, g);
    requireClose(out.translateX, -40.0, 1e-12, "fixed pinch ignores drift x");
    requireClose(out.translateY, -30.0, 1e-12, "fixed pinch ignores drift y");

    c.pinchDragEnabled = true;
    session.centerX = 40.0;
    session.centerY = 30.0;
    out = pz::applyPinch(rest, session, 200.0, 60.0, 20.0, c, g);
    requireClose(out.scale, 2.0, 1e-12, "drag does not change scale");
    requireClose(out.translateX, -20.0, 1e-12, "anchor x plus drift +20");
    requireClose(out.translateY, -40.0, 1e-12, "anchor y plus drift -10");

    requireClose(pz::compensate(0.0, 40.0, 2.0), -40.0, 1e-12, "compensate formula");
    std::printf("  Test 2 (anchor fixation): PASS\n");
  }

  // ---- Test 3: Pan limit centers small content ----
  {
    // 200x150 content at scale 2 is 400x300 inside 800x600
    requireClose(pz::limitPanAxis(37.0, 2.0, 800, 200, 200), 200.0, 1e-12, "centered x");
    requireClose(pz::limitPanAxis(-900.0, 2.0, 600, 150, 150), 150.0, 1e-12, "centered y");

    pz::TransformState s;
    s.scale = 2.0;
    s.translateX = 5.0;
    s.translateY = 5.0;
    pz::limitPan(s, geometry(800, 600, 200, 150));
    requireClose(s.translateX, 200.0, 1e-12, "limitPan x");
    requireClose(s.translateY, 150.0, 1e-12, "limitPan y");
    std::printf("  Test 3 (centering): PASS\n");
  }

  // ---- Test 4: Pan limit at the flush edges ----
  {
    // 800 content at scale 2 inside 800: valid range is [-800, 0]
    requireClose(pz::limitPanAxis(0.0, 2.0, 800, 800, 800), 0.0, 1e-12, "flush leading edge kept");
    requireClose(pz::limitPanAxis(-800.0, 2.0, 800, 800, 800), -800.0, 1e-12, "flush trailing edge kept");
    requireClose(pz::limitPanAxis(5.0, 2.0, 800, 800, 800), 0.0, 1e-12, "past leading edge");
    requireClose(pz::limitPanAxis(-801.0, 2.0, 800, 800, 800), -800.0, 1e-12, "past trailing edge");

    // Same on the vertical axis
    requireClose(pz::limitPanAxis(-600.0, 2.0, 600, 600, 600), -600.0, 1e-12, "flush bottom kept");
    requireClose(pz::limitPanAxis(-601.0, 2.0, 600, 600, 600), -600.0, 1e-12, "past bottom");

    // Content exactly the container size at rest: only 0 is valid
    requireClose(pz::limitPanAxis(-1.0, 1.0, 800, 800, 800), 0.0, 1e-12, "rest pinned left");
    requireClose(pz::limitPanAxis(1.0, 1.0, 800, 800, 800), 0.0, 1e-12, "rest pinned right");

    // Letterboxed content: 400 wide inside an 800 element, scale 4 -> 1600 wide.
    // Leading edge sits at 200*4 = 800 inside the element.
    requireClose(pz::limitPanAxis(0.0, 4.0, 800, 800, 400), -800.0, 1e-12, "letterbox leading");
    requireClose(pz::limitPanAxis(-1600.0, 4.0, 800, 800, 400), -1600.0, 1e-12, "letterbox trailing");
    std::printf("  Test 4 (flush edges): PASS\n");
  }

  // ---- Test 5: limitZoom keeps the position ratio ----
  {
    pz::Constraints c;
    c.maxScale = 3.0;
    auto g = geometry(100, 100, 100, 100);

    pz::TransformState s;
    s.scale = 4.0;
    s.translateX = -300.0;
    s.translateY = -150.0;
    requireTrue(pz::limitZoom(s, c, g), "over max is clamped");
    requireClose(s.scale, 3.0, 1e-12, "scale at max");
    requireClose(s.translateX, -200.0, 1e-9, "x ratio kept");
    requireClose(s.translateY, -100.0, 1e-9, "y ratio kept");

    pz::TransformState inRange;
    inRange.scale = 2.0;
    inRange.translateX = -30.0;
    requireTrue(!pz::limitZoom(inRange, c, g), "in range untouched");
    requireClose(inRange.translateX, -30.0, 1e-12, "translate untouched");

    // Zero-size geometry: scale still clamps, translate left alone
    pz::TransformState z;
    z.scale = 5.0;
    z.translateX = -42.0;
    pz::limitZoom(z, c, geometry(0, 0, 0, 0));
    requireClose(z.scale, 3.0, 1e-12, "zero geometry scale clamp");
    requireClose(z.translateX, -42.0, 1e-12, "zero geometry translate kept");
    requireTrue(std::isfinite(z.translateY), "no NaN");
    std::printf("  Test 5 (limitZoom): PASS\n");
  }

  // ---- Test 6: Wheel target snapping ----
  {
    requireTrue(pz::wheelTargetScale(2.9, -1.0, 0.2, 3.0) == 3.0, "2.9 snaps to exactly 3");
    requireClose(pz::wheelTargetScale(1.0, -1.0, 0.2, 3.0), 1.2, 1e-12, "step in from rest");
    requireTrue(pz::wheelTargetScale(1.2, 1.0, 0.2, 3.0) == 1.0, "step out to rest");
    requireTrue(pz::wheelTargetScale(1.1, 1.0, 0.2, 3.0) == 1.0, "near rest snaps to 1");
    requireTrue(pz::wheelTargetScale(3.0, -1.0, 0.2, 3.0) == 3.0, "stays at max");
    requireClose(pz::wheelTargetScale(2.0, 0.0, 0.2, 3.0), 2.0, 1e-12, "zero delta no-op");
    std::printf("  Test 6 (wheel snap): PASS\n");
  }

  // ---- Test 7: Pan update rule ----
  {
    pz::Constraints c;
    c.maxScale = 3.0;
    auto g = geometry(800, 600, 800, 600);

    pz::GestureSession session;
    session.kind = pz::GestureKind::Pan;
    session.startX = 100.0;
    session.startY = 100.0;

    pz::TransformState s;
    s.scale = 2.0;
    s.commit();
    pz::TransformState out = pz::applyPan(s, session, 150.0, 80.0, c, g);
    requireClose(out.translateX, 50.0, 1e-12, "pan dx");
    requireClose(out.translateY, -20.0, 1e-12, "pan dy");

    c.panEnabled = false;
    out = pz::applyPan(s, session, 150.0, 80.0, c, g);
    requireClose(out.translateX, 0.0, 1e-12, "pan disabled x");
    requireClose(out.translateY, 0.0, 1e-12, "pan disabled y");

    c.panEnabled = true;
    pz::TransformState rest;
    out = pz::applyPan(rest, session, 150.0, 80.0, c, g);
    requireClose(out.translateX, 0.0, 1e-12, "no pan at rest");
    std::printf("  Test 7 (applyPan): PASS\n");
  }

  // ---- Test 8: Post-gesture alignment ----
  {
    auto g = geometry(800, 600, 800, 600);
    pz::TransformState s;
    s.scale = 2.0;
    s.translateX = 50.0;
    s.translateY = 20.0;
    requireTrue(pz::alignToBounds(s, g), "positive offsets move");
    requireClose(s.translateX, 0.0, 1e-12, "x pulled to 0");
    requireClose(s.translateY, 0.0, 1e-12, "y pulled to 0");

    s.translateX = -100.0;
    s.translateY = -100.0;
    requireTrue(!pz::alignToBounds(s, g), "in bounds unchanged");

    pz::Constraints c;
    requireTrue(pz::isDragging(s, c, g), "scaled content overflows");
    s.scale = 1.0;
    requireTrue(!pz::isDragging(s, c, g), "rest does not overflow");
    std::printf("  Test 8 (alignToBounds): PASS\n");
  }

  std::printf("D1.1 transform_math: ALL PASS\n");
  return 0;
}
