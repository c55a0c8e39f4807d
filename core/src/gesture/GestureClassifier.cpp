#include "pz/gesture/GestureClassifier.hpp"

#include <algorithm>
#include <cmath>

namespace pz {

double GestureClassifier::distance(const Contact& a, const Contact& b) {
  double dx = a.x - b.x;
  double dy = a.y - b.y;
  return std::sqrt(dx * dx + dy * dy);
}

GestureKind GestureClassifier::activeKind() const {
  switch (state_) {
    case GestureState::Panning: return GestureKind::Pan;
    case GestureState::Pinching: return GestureKind::Pinch;
    case GestureState::Settling: return settlingKind_;
    default: return GestureKind::None;
  }
}

void GestureClassifier::reset() {
  state_ = GestureState::Idle;
  downIds_.clear();
  maxContacts_ = 0;
  settlingKind_ = GestureKind::None;
  hasLastTap_ = false;
  doubleTapArmed_ = false;
}

bool GestureClassifier::isDown(int id) const {
  return std::find(downIds_.begin(), downIds_.end(), id) != downIds_.end();
}

const Contact* GestureClassifier::findContact(const std::vector<Contact>& contacts, int id) {
  for (const auto& c : contacts) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

void GestureClassifier::syncDown(const std::vector<Contact>& contacts) {
  downIds_.clear();
  for (const auto& c : contacts) downIds_.push_back(c.id);
  maxContacts_ = std::max(maxContacts_, downIds_.size());
}

std::vector<GestureEvent> GestureClassifier::onPress(const PointerEvent& ev) {
  std::vector<Contact> contacts = ev.contacts;
  if (contacts.empty()) contacts.push_back(ev.changed);

  switch (state_) {
    case GestureState::Idle: {
      maxContacts_ = 0;
      syncDown(contacts);
      state_ = GestureState::Touched;
      pressId_ = ev.changed.id;
      pressX_ = ev.changed.x;
      pressY_ = ev.changed.y;

      // Double-tap window: the second press has to start soon enough and
      // close enough to the previous tap, otherwise the window restarts.
      doubleTapArmed_ = false;
      if (hasLastTap_) {
        bool inTime = (ev.timeMs - lastTapTimeMs_) <= config_.doubleTapWindowMs;
        bool inRange = true;
        if (config_.doubleTapMaxOffsetPx > 0.0) {
          Contact last{0, lastTapX_, lastTapY_};
          inRange = distance(last, ev.changed) <= config_.doubleTapMaxOffsetPx;
        }
        if (inTime && inRange) {
          doubleTapArmed_ = true;
        } else {
          hasLastTap_ = false;
        }
      }
      break;
    }

    case GestureState::Touched:
      // Second finger before any movement: still undecided.
      syncDown(contacts);
      break;

    case GestureState::Panning:
    case GestureState::Pinching:
    case GestureState::Settling:
      // Extra contacts never start a second session.
      syncDown(contacts);
      break;
  }
  return {};
}

std::vector<GestureEvent> GestureClassifier::onMove(const PointerEvent& ev) {
  std::vector<GestureEvent> out;

  switch (state_) {
    case GestureState::Idle:
    case GestureState::Settling:
      return out;

    case GestureState::Touched: {
      if (ev.contacts.size() == 1 && maxContacts_ == 1) {
        const Contact& c = ev.contacts[0];
        double moved = distance(Contact{0, pressX_, pressY_}, c);
        if (moved <= config_.moveThresholdPx) return out;

        state_ = GestureState::Panning;
        panId_ = c.id;
        hasLastTap_ = false;
        doubleTapArmed_ = false;

        GestureEvent start;
        start.type = GestureEventType::PanStart;
        start.x0 = pressX_;
        start.y0 = pressY_;
        start.timeMs = ev.timeMs;
        out.push_back(start);

        GestureEvent mv;
        mv.type = GestureEventType::PanMove;
        mv.x0 = c.x;
        mv.y0 = c.y;
        mv.timeMs = ev.timeMs;
        out.push_back(mv);
      } else if (ev.contacts.size() == 2) {
        const Contact& a = ev.contacts[0];
        const Contact& b = ev.contacts[1];
        double d = distance(a, b);
        if (d <= 0.0) return out; // coincident contacts, no usable baseline

        state_ = GestureState::Pinching;
        pinchIdA_ = a.id;
        pinchIdB_ = b.id;
        hasLastTap_ = false;
        doubleTapArmed_ = false;

        GestureEvent start;
        start.type = GestureEventType::PinchStart;
        start.x0 = a.x;
        start.y0 = a.y;
        start.x1 = b.x;
        start.y1 = b.y;
        start.distance = d;
        start.timeMs = ev.timeMs;
        out.push_back(start);
      }
      return out;
    }

    case GestureState::Panning: {
      if (ev.contacts.size() != 1) return out;
      const Contact* c = findContact(ev.contacts, panId_);
      if (!c) return out;

      GestureEvent mv;
      mv.type = GestureEventType::PanMove;
      mv.x0 = c->x;
      mv.y0 = c->y;
      mv.timeMs = ev.timeMs;
      out.push_back(mv);
      return out;
    }

    case GestureState::Pinching: {
      if (ev.contacts.size() != 2) return out;
      const Contact* a = findContact(ev.contacts, pinchIdA_);
      const Contact* b = findContact(ev.contacts, pinchIdB_);
      if (!a || !b) return out;

      GestureEvent mv;
      mv.type = GestureEventType::PinchMove;
      mv.x0 = a->x;
      mv.y0 = a->y;
      mv.x1 = b->x;
      mv.y1 = b->y;
      mv.distance = distance(*a, *b);
      mv.timeMs = ev.timeMs;
      out.push_back(mv);
      return out;
    }
  }
  return out;
}

std::vector<GestureEvent> GestureClassifier::onRelease(const PointerEvent& ev) {
  std::vector<GestureEvent> out;
  if (state_ == GestureState::Idle) return out;
  if (!isDown(ev.changed.id)) return out;

  bool allUp = ev.contacts.empty();

  switch (state_) {
    case GestureState::Idle:
      break;

    case GestureState::Touched:
      if (allUp) {
        if (maxContacts_ == 1) out.push_back(tapEvent(ev));
        state_ = GestureState::Idle;
      } else {
        settlingKind_ = GestureKind::None;
        state_ = GestureState::Settling;
      }
      break;

    case GestureState::Panning:
      if (allUp) {
        out.push_back(endEvent(GestureKind::Pan, ev));
        state_ = GestureState::Idle;
      } else if (ev.changed.id == panId_) {
        settlingKind_ = GestureKind::Pan;
        state_ = GestureState::Settling;
      }
      break;

    case GestureState::Pinching:
      if (allUp) {
        out.push_back(endEvent(GestureKind::Pinch, ev));
        state_ = GestureState::Idle;
      } else if (ev.changed.id == pinchIdA_ || ev.changed.id == pinchIdB_) {
        settlingKind_ = GestureKind::Pinch;
        state_ = GestureState::Settling;
      }
      break;

    case GestureState::Settling:
      if (allUp) {
        if (settlingKind_ != GestureKind::None) out.push_back(endEvent(settlingKind_, ev));
        settlingKind_ = GestureKind::None;
        state_ = GestureState::Idle;
      }
      break;
  }

  syncDown(ev.contacts);
  if (state_ == GestureState::Idle) maxContacts_ = 0;
  return out;
}

GestureEvent GestureClassifier::onWheel(const WheelEvent& ev) const {
  GestureEvent g;
  g.type = GestureEventType::Wheel;
  g.x0 = ev.x;
  g.y0 = ev.y;
  g.wheelDelta = ev.deltaY;
  g.timeMs = ev.timeMs;
  return g;
}

GestureEvent GestureClassifier::endEvent(GestureKind kind, const PointerEvent& ev) const {
  GestureEvent g;
  g.type = (kind == GestureKind::Pinch) ? GestureEventType::PinchEnd
                                        : GestureEventType::PanEnd;
  g.x0 = ev.changed.x;
  g.y0 = ev.changed.y;
  g.timeMs = ev.timeMs;
  return g;
}

GestureEvent GestureClassifier::tapEvent(const PointerEvent& ev) {
  GestureEvent g;
  g.x0 = ev.changed.x;
  g.y0 = ev.changed.y;
  g.timeMs = ev.timeMs;

  if (doubleTapArmed_) {
    g.type = GestureEventType::DoubleTap;
    hasLastTap_ = false;
  } else {
    g.type = GestureEventType::Tap;
    hasLastTap_ = true;
    lastTapTimeMs_ = ev.timeMs;
    lastTapX_ = ev.changed.x;
    lastTapY_ = ev.changed.y;
  }
  doubleTapArmed_ = false;
  return g;
}

} // namespace pz
