// D4.1 — DrawingManager: tool selection, gesture state machine, navigation lock

#include "TestSurface.hpp"
#include "cs/events/EventBus.hpp"
#include "cs/interaction/DrawingManager.hpp"
#include "cs/render/PrimitiveRenderBridge.hpp"
#include "cs/tools/ToolRegistry.hpp"

#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

namespace {

struct Recorder {
  std::vector<cs::Event> events;

  explicit Recorder(cs::EventBus& bus) {
    bus.subscribeAll([this](const cs::Event& e) { events.push_back(e); });
  }
  std::size_t countOf(cs::EventType t) const {
    std::size_t n = 0;
    for (const auto& e : events) if (e.type == t) n++;
    return n;
  }
  const cs::Event* last(cs::EventType t) const {
    for (auto it = events.rbegin(); it != events.rend(); ++it)
      if (it->type == t) return &*it;
    return nullptr;
  }
};

// Bridge whose repaint fails, for the manager's own error path.
class ThrowingBridge : public cs::PrimitiveRenderBridge {
public:
  using cs::PrimitiveRenderBridge::PrimitiveRenderBridge;
  void requestRepaint() override { throw std::runtime_error("bridge repaint failed"); }
};

} // namespace

int main() {
  cs::ToolRegistry registry;
  cs::registerBuiltinTools(registry);

  // ---- Test 1: full trend-line gesture ----
  {
    cstest::FakeSurface surface;
    cs::PrimitiveRenderBridge bridge(surface);
    cs::EventBus bus;
    Recorder rec(bus);
    cs::DrawingManager mgr(surface, bridge, registry, bus);
    mgr.setClock([] { return std::int64_t(1234); });

    requireTrue(mgr.state() == cs::InteractionState::Idle, "starts idle");
    requireTrue(mgr.selectTool(cs::DrawingKind::TrendLine), "select trend line");
    requireTrue(mgr.state() == cs::InteractionState::Armed, "armed");
    requireTrue(rec.last(cs::EventType::ToolActivated)->tool == "TrendLine", "activation event");

    mgr.onPointerDown({10, 100});
    requireTrue(mgr.state() == cs::InteractionState::Drawing, "drawing");
    requireTrue(!surface.navEnabled && surface.locks == 1, "navigation locked");
    const cs::Event* started = rec.last(cs::EventType::GestureStarted);
    requireTrue(started && started->hasPoint && started->point.price == 100, "start event");

    mgr.onPointerMove({110, 150});
    requireTrue(mgr.inProgress()->end().time == 110, "in-progress follows pointer");
    requireTrue(mgr.inProgress()->derived.priceDelta == 50, "preview has live derived values");
    cs::OverlayFrame preview = surface.paint();
    requireTrue(preview.segmentsOf(cs::kInvalidDrawingId) == 1, "preview painted");

    mgr.onPointerUp({110, 150});
    requireTrue(mgr.state() == cs::InteractionState::Armed, "back to armed");
    requireTrue(surface.navEnabled && surface.unlocks == 1, "navigation released once");
    requireTrue(mgr.drawingCount() == 1, "committed");

    const cs::Event* done = rec.last(cs::EventType::GestureCompleted);
    requireTrue(done && done->drawingId != cs::kInvalidDrawingId && done->count == 1,
                "completion event");
    const cs::Drawing* d = mgr.get(done->drawingId);
    requireTrue(d && d->createdAt == 1234, "createdAt from clock");
    requireTrue(d->derived.percentChange == 50, "derived on commit");

    cs::OverlayFrame after = surface.paint();
    requireTrue(after.segmentsOf(d->id) == 1, "committed drawing painted");
    requireTrue(after.segmentsOf(cs::kInvalidDrawingId) == 0, "preview gone");
    std::printf("  Test 1 (gesture): PASS\n");
  }

  // ---- Test 2: selection rules ----
  {
    cstest::FakeSurface surface;
    cs::PrimitiveRenderBridge bridge(surface);
    cs::EventBus bus;
    Recorder rec(bus);
    cs::DrawingManager mgr(surface, bridge, registry, bus);

    requireTrue(!mgr.selectTool(static_cast<cs::DrawingKind>(9)), "unknown kind rejected");
    requireTrue(!mgr.selectTool(std::string("Pitchfork")), "unknown name rejected");
    requireTrue(mgr.state() == cs::InteractionState::Idle, "still idle");

    requireTrue(mgr.selectTool(std::string("horizontalline")), "select by name");
    requireTrue(mgr.selectTool(cs::DrawingKind::HorizontalLine), "reselect toggles");
    requireTrue(mgr.state() == cs::InteractionState::Idle, "toggled off");
    requireTrue(rec.countOf(cs::EventType::ToolDeactivated) == 1, "deactivation event");

    mgr.selectTool(cs::DrawingKind::TrendLine);
    mgr.onPointerDown({5, 5});
    requireTrue(!mgr.selectTool(cs::DrawingKind::FibRetracement), "no switch mid-gesture");
    requireTrue(mgr.activeTool()->kind() == cs::DrawingKind::TrendLine, "tool unchanged");
    requireTrue(mgr.isDrawing(), "gesture unchanged");
    mgr.cancelDrawing();

    requireTrue(mgr.selectTool(cs::DrawingKind::FibRetracement), "switch when armed");
    requireTrue(mgr.activeTool()->kind() == cs::DrawingKind::FibRetracement, "switched");
    std::printf("  Test 2 (selection): PASS\n");
  }

  // ---- Test 3: every exit releases the navigation lock exactly once ----
  {
    cstest::FakeSurface surface;
    cs::PrimitiveRenderBridge bridge(surface);
    cs::EventBus bus;
    Recorder rec(bus);
    {
      cs::DrawingManager mgr(surface, bridge, registry, bus);
      mgr.selectTool(cs::DrawingKind::TrendLine);

      mgr.onPointerDown({0, 0});
      mgr.onPointerLeave();
      requireTrue(surface.locks == 1 && surface.unlocks == 1, "leave cancels");
      requireTrue(mgr.drawingCount() == 0, "nothing stored");
      requireTrue(rec.countOf(cs::EventType::GestureCancelled) == 1, "cancel event");

      mgr.onPointerDown({0, 0});
      mgr.deselectTool();
      requireTrue(surface.locks == 2 && surface.unlocks == 2, "deselect cancels");
      requireTrue(mgr.state() == cs::InteractionState::Idle, "idle after deselect");

      mgr.selectTool(cs::DrawingKind::TrendLine);
      mgr.onPointerDown({0, 0});
      mgr.clearAll();
      requireTrue(surface.locks == 3 && surface.unlocks == 3, "clear cancels");

      mgr.onPointerDown({0, 0});
      requireTrue(!surface.navEnabled, "locked before destruction");
    }
    requireTrue(surface.navEnabled && surface.unlocks == 4, "destruction releases");
    requireTrue(surface.primitives.empty(), "destruction detaches everything");
    std::printf("  Test 3 (lock release): PASS\n");
  }

  // ---- Test 4: invalid gestures ----
  {
    cstest::FakeSurface surface;
    surface.identity.lo = 0;
    cs::PrimitiveRenderBridge bridge(surface);
    cs::EventBus bus;
    cs::DrawingManager mgr(surface, bridge, registry, bus);

    mgr.onPointerDown({10, 10});
    requireTrue(mgr.state() == cs::InteractionState::Idle, "down while idle ignored");

    mgr.selectTool(cs::DrawingKind::TrendLine);
    mgr.onPointerDown({-5, 10});
    requireTrue(mgr.state() == cs::InteractionState::Armed, "unmappable start ignored");
    requireTrue(surface.locks == 0, "no lock for invalid start");

    mgr.onPointerDown({10, 10});
    mgr.onPointerMove({-40, 60});
    requireTrue(mgr.inProgress()->end().time == 10, "unresolved time kept");
    requireTrue(mgr.inProgress()->end().price == 60, "resolved price applied");
    mgr.onPointerUp({-40, 60});
    requireTrue(mgr.drawingCount() == 1, "committed with last resolved values");

    requireTrue(!mgr.removeDrawing(999), "unknown id");
    requireTrue(mgr.drawingCount() == 1, "store untouched");
    std::printf("  Test 4 (invalid input): PASS\n");
  }

  // ---- Test 5: capacity ----
  {
    cstest::FakeSurface surface;
    cs::PrimitiveRenderBridge bridge(surface);
    cs::EventBus bus;
    Recorder rec(bus);
    cs::DrawingManagerConfig cfg;
    cfg.maxDrawings = 1;
    cs::DrawingManager mgr(surface, bridge, registry, bus, cfg);

    mgr.selectTool(cs::DrawingKind::HorizontalLine);
    mgr.onPointerDown({0, 100});
    mgr.onPointerUp({0, 100});
    requireTrue(mgr.drawingCount() == 1, "first fits");

    mgr.onPointerDown({0, 200});
    mgr.onPointerUp({0, 200});
    requireTrue(mgr.drawingCount() == 1, "second rejected");
    requireTrue(rec.countOf(cs::EventType::GestureCancelled) == 1, "rejection reported");
    requireTrue(surface.navEnabled && surface.locks == surface.unlocks, "lock released");
    requireTrue(bridge.attachedCount() == 1, "bridge unchanged");
    std::printf("  Test 5 (capacity): PASS\n");
  }

  // ---- Test 6: hover, hit order, removal, clear ----
  {
    cstest::FakeSurface surface;
    cs::PrimitiveRenderBridge bridge(surface);
    cs::EventBus bus;
    Recorder rec(bus);
    cs::DrawingManager mgr(surface, bridge, registry, bus);

    mgr.selectTool(cs::DrawingKind::HorizontalLine);
    mgr.onPointerDown({0, 100});
    mgr.onPointerUp({0, 100});
    mgr.onPointerDown({0, 102});
    mgr.onPointerUp({0, 102});
    mgr.deselectTool();
    requireTrue(mgr.drawingCount() == 2, "two lines");
    cs::DrawingId lower = mgr.store().drawings()[0].id;
    cs::DrawingId upper = mgr.store().drawings()[1].id;

    requireTrue(mgr.hitTest({400, 101}) == upper, "most recent wins");
    mgr.onPointerMove({400, 101});
    requireTrue(mgr.hoveredDrawing() == upper, "hovered");
    requireTrue(rec.last(cs::EventType::HoverChanged)->drawingId == upper, "hover event");
    mgr.onPointerMove({400, 101});
    requireTrue(rec.countOf(cs::EventType::HoverChanged) == 1, "no duplicate hover events");
    mgr.onPointerLeave();
    requireTrue(mgr.hoveredDrawing() == cs::kInvalidDrawingId, "leave clears hover");

    requireTrue(mgr.removeDrawing(upper), "remove");
    requireTrue(mgr.hitTest({400, 101}) == lower, "lower now hit");
    requireTrue(rec.last(cs::EventType::DrawingRemoved)->count == 1, "remaining count");
    requireTrue(bridge.attachedCount() == 1, "bridge detached");

    mgr.clearAll();
    requireTrue(mgr.drawingCount() == 0 && bridge.attachedCount() == 0, "cleared");
    requireTrue(rec.last(cs::EventType::DrawingsCleared)->count == 1, "cleared count");
    std::printf("  Test 6 (collection): PASS\n");
  }

  // ---- Test 7: failing host repaint never escapes a gesture ----
  {
    cstest::FakeSurface surface;
    surface.throwOnRepaint = true;
    cs::PrimitiveRenderBridge bridge(surface);
    cs::EventBus bus;
    Recorder rec(bus);
    {
      cs::DrawingManager mgr(surface, bridge, registry, bus);
      mgr.selectTool(cs::DrawingKind::TrendLine);

      mgr.onPointerDown({10, 100});
      mgr.onPointerMove({110, 150});
      requireTrue(mgr.isDrawing(), "move keeps the gesture alive");
      mgr.onPointerUp({110, 150});
      requireTrue(mgr.drawingCount() == 1, "committed despite repaint failure");
      requireTrue(mgr.history().undoCount() == 1, "commit recorded");
      requireTrue(rec.countOf(cs::EventType::GestureCompleted) == 1, "completion reported");
      requireTrue(bridge.attachedCount() == 1, "bridge matches store");

      mgr.onPointerDown({20, 100});
      mgr.onPointerMove({30, 120});
      mgr.onPointerLeave();
      requireTrue(rec.countOf(cs::EventType::GestureCancelled) == 1, "cancel reported");
      requireTrue(mgr.drawingCount() == 1, "cancel stores nothing");
      requireTrue(surface.locks == 2 && surface.unlocks == 2, "lock released each time");

      requireTrue(mgr.undo() && mgr.drawingCount() == 0, "undo");
      requireTrue(mgr.redo() && mgr.drawingCount() == 1, "redo");
      requireTrue(bridge.attachedCount() == mgr.drawingCount(), "bridge follows history");
      requireTrue(surface.repaints > 0, "repaints were attempted");
    }
    requireTrue(surface.primitives.empty(), "teardown detaches despite repaint failure");
  }
  {
    cstest::FakeSurface surface;
    ThrowingBridge bridge(surface);
    cs::EventBus bus;
    Recorder rec(bus);
    cs::DrawingManager mgr(surface, bridge, registry, bus);
    mgr.selectTool(cs::DrawingKind::HorizontalLine);

    mgr.onPointerDown({0, 100});
    mgr.onPointerMove({0, 120});
    mgr.onPointerUp({0, 120});
    requireTrue(mgr.drawingCount() == 1 && mgr.history().undoCount() == 1,
                "store and history agree");
    requireTrue(rec.countOf(cs::EventType::GestureCompleted) == 1, "completion reported");

    mgr.onPointerDown({0, 200});
    mgr.onPointerLeave();
    requireTrue(rec.countOf(cs::EventType::GestureCancelled) == 1, "cancel reported");
    requireTrue(mgr.state() == cs::InteractionState::Armed, "armed after cancel");
    requireTrue(surface.locks == surface.unlocks && surface.navEnabled, "navigation restored");
    std::printf("  Test 7 (repaint failure): PASS\n");
  }

  std::printf("D4.1 drawing_manager: ALL PASS\n");
  return 0;
}
