// D2.2 — Plumbing: InputHub fan-out, ManualScheduler ordering, TransformChannel listeners

#include "pz/input/InputSource.hpp"
#include "pz/sched/ManualScheduler.hpp"
#include "pz/transform/TransformChannel.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

struct CountingSink : pz::InputSink {
  int presses{0}, moves{0}, releases{0}, wheels{0};
  pz::InputHub* detachFrom{nullptr};

  void onPress(const pz::PointerEvent&) override {
    presses++;
    if (detachFrom) detachFrom->removeSink(this);
  }
  void onMove(const pz::PointerEvent&) override { moves++; }
  void onRelease(const pz::PointerEvent&) override { releases++; }
  void onWheel(const pz::WheelEvent&) override { wheels++; }
};

// Owns another sink and destroys it on the first press.
struct OwningSink : pz::InputSink {
  pz::InputHub* hub{nullptr};
  std::unique_ptr<CountingSink> owned;

  void onPress(const pz::PointerEvent&) override {
    if (!owned) return;
    hub->removeSink(owned.get());
    owned.reset();
  }
  void onMove(const pz::PointerEvent&) override {}
  void onRelease(const pz::PointerEvent&) override {}
  void onWheel(const pz::WheelEvent&) override {}
};

int main() {
  // ---- Test 1: Hub fan-out and dedupe ----
  {
    pz::InputHub hub;
    CountingSink a, b;
    hub.addSink(&a);
    hub.addSink(&a);
    hub.addSink(&b);
    hub.addSink(nullptr);
    requireTrue(hub.sinkCount() == 2, "dedupe + null ignored");

    hub.press(pz::PointerEvent{});
    hub.move(pz::PointerEvent{});
    hub.release(pz::PointerEvent{});
    hub.wheel(pz::WheelEvent{});
    requireTrue(a.presses == 1 && b.presses == 1, "each sink once");
    requireTrue(a.moves == 1 && a.releases == 1 && a.wheels == 1, "all channels");

    hub.removeSink(&a);
    hub.removeSink(&a);
    hub.press(pz::PointerEvent{});
    requireTrue(a.presses == 1 && b.presses == 2, "removed sink silent");
    std::printf("  Test 1 (hub fan-out): PASS\n");
  }

  // ---- Test 2: Sink detaching inside its callback ----
  {
    pz::InputHub hub;
    CountingSink a, b;
    a.detachFrom = &hub;
    hub.addSink(&a);
    hub.addSink(&b);

    hub.press(pz::PointerEvent{});
    requireTrue(a.presses == 1 && b.presses == 1, "dispatch completes");
    requireTrue(hub.sinkCount() == 1, "self-detached");
    std::printf("  Test 2 (self detach): PASS\n");
  }

  // ---- Test 3: Scheduler order and cancellation ----
  {
    pz::ManualScheduler sched;
    std::vector<int> order;
    int fastRuns = 0;

    pz::TaskHandle slow = sched.scheduleRepeating(30, [&]() { order.push_back(30); return true; });
    pz::TaskHandle fast = sched.scheduleRepeating(10, [&]() {
      order.push_back(10);
      return ++fastRuns < 2;
    });
    requireTrue(slow != pz::kInvalidTask && fast != pz::kInvalidTask, "valid handles");
    requireTrue(sched.scheduleRepeating(10, nullptr) == pz::kInvalidTask, "empty task rejected");

    requireTrue(sched.advance(30) == 3, "three runs in 30ms");
    requireTrue(order.size() == 3 && order[0] == 10 && order[1] == 10 && order[2] == 30,
                "due-time order");
    requireTrue(!sched.isScheduled(fast), "fast stopped itself");
    requireTrue(sched.isScheduled(slow), "slow still scheduled");

    sched.cancel(slow);
    requireTrue(sched.pendingCount() == 0, "cancelled");
    requireTrue(sched.advance(100) == 0, "nothing left");
    requireTrue(sched.nowMs() == 130.0, "clock advanced");
    std::printf("  Test 3 (scheduler): PASS\n");
  }

  // ---- Test 4: Channel subscribe / unsubscribe ----
  {
    pz::TransformChannel ch;
    int a = 0, b = 0;
    pz::ListenerId idA = ch.subscribe([&](const pz::TransformUpdate&) { a++; });
    pz::ListenerId idB = 0;
    idB = ch.subscribe([&](const pz::TransformUpdate&) {
      b++;
      ch.unsubscribe(idB);
    });
    requireTrue(ch.subscribe(nullptr) == 0, "empty listener rejected");
    requireTrue(idA != idB, "distinct ids");

    ch.publish(pz::TransformUpdate{});
    ch.publish(pz::TransformUpdate{});
    requireTrue(a == 2 && b == 1, "one-shot listener removed itself");
    requireTrue(ch.listenerCount() == 1, "one left");
    requireTrue(ch.publishedCount() == 2, "publish count");

    ch.clear();
    ch.publish(pz::TransformUpdate{});
    requireTrue(a == 2, "cleared");
    std::printf("  Test 4 (channel): PASS\n");
  }

  // ---- Test 5: Sink removed by an earlier sink is skipped ----
  {
    pz::InputHub hub;
    OwningSink owner;
    owner.hub = &hub;
    owner.owned = std::make_unique<CountingSink>();
    CountingSink after;
    hub.addSink(&owner);
    hub.addSink(owner.owned.get());
    hub.addSink(&after);

    hub.press(pz::PointerEvent{});
    requireTrue(!owner.owned, "owned sink destroyed mid-dispatch");
    requireTrue(after.presses == 1, "later sinks still run");
    requireTrue(hub.sinkCount() == 2, "two sinks left");

    hub.press(pz::PointerEvent{});
    requireTrue(after.presses == 2, "next dispatch normal");
    std::printf("  Test 5 (removed mid-dispatch): PASS\n");
  }

  std::printf("D2.2 input_plumbing: ALL PASS\n");
  return 0;
}
