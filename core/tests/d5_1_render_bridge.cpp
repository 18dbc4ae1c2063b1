// D5.1 — Render bridges: primitive and canvas paths produce the same overlay

#include "TestSurface.hpp"
#include "cs/events/EventBus.hpp"
#include "cs/interaction/DrawingManager.hpp"
#include "cs/render/CanvasOverlayBridge.hpp"
#include "cs/render/PrimitiveRenderBridge.hpp"
#include "cs/tools/ToolRegistry.hpp"

#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void drawScene(cs::DrawingManager& mgr) {
  mgr.selectTool(cs::DrawingKind::TrendLine);
  mgr.onPointerDown({10, 100});
  mgr.onPointerMove({200, 180});
  mgr.onPointerUp({200, 180});

  mgr.selectTool(cs::DrawingKind::HorizontalLine);
  mgr.onPointerDown({0, 300});
  mgr.onPointerUp({0, 300});

  mgr.selectTool(cs::DrawingKind::FibRetracement);
  mgr.onPointerDown({300, 400});
  mgr.onPointerUp({450, 250});
}

int main() {
  cs::ToolRegistry registry;
  cs::registerBuiltinTools(registry);

  // ---- Test 1: both bridges paint the same geometry ----
  {
    cstest::FakeSurface primHost;
    cs::PrimitiveRenderBridge primBridge(primHost);
    cs::EventBus bus1;
    cs::DrawingManager primMgr(primHost, primBridge, registry, bus1);

    cstest::FakeSurface canvasHost;
    cs::CanvasOverlayBridge canvas(canvasHost);
    cs::EventBus bus2;
    cs::DrawingManager canvasMgr(canvasHost, canvas, registry, bus2);

    drawScene(primMgr);
    drawScene(canvasMgr);
    requireTrue(canvasHost.primitives.empty(), "canvas path attaches no host primitives");

    requireTrue(canvas.frameTick(), "canvas paints");
    cs::OverlayFrame fromPrimitives = primHost.paint();
    requireTrue(fromPrimitives.segments().size() > 3, "scene has content");
    requireTrue(fromPrimitives.sameContent(canvas.frame()), "identical overlays");

    // A live preview is painted on top by both.
    primMgr.selectTool(cs::DrawingKind::TrendLine);
    canvasMgr.selectTool(cs::DrawingKind::TrendLine);
    primMgr.onPointerDown({50, 50});
    canvasMgr.onPointerDown({50, 50});
    primMgr.onPointerMove({150, 60});
    canvasMgr.onPointerMove({150, 60});
    canvas.frameTick();
    cs::OverlayFrame withPreview = primHost.paint();
    requireTrue(withPreview.sameContent(canvas.frame()), "identical with preview");
    requireTrue(withPreview.segments().back().owner == cs::kInvalidDrawingId, "preview last");
    std::printf("  Test 1 (equivalence): PASS\n");
  }

  // ---- Test 2: canvas repaint throttle ----
  {
    cstest::FakeSurface host;
    cs::CanvasOverlayBridge canvas(host);
    cs::CanvasOverlayConfig cfg;
    cfg.minFramesBetweenPaints = 3;
    canvas.setConfig(cfg);

    requireTrue(!canvas.frameTick() && !canvas.frameTick(), "throttled");
    requireTrue(canvas.frameTick(), "third frame paints");
    requireTrue(!canvas.frameTick(), "clean frame idle");

    canvas.requestRepaint();
    canvas.requestRepaint();
    requireTrue(!canvas.frameTick(), "too soon after the last paint");
    requireTrue(canvas.dirty(), "still pending");
    requireTrue(canvas.frameTick(), "paints once allowed");
    requireTrue(canvas.paintCount() == 2, "requests coalesced");
    requireTrue(!canvas.frameTick(), "idle again");
    std::printf("  Test 2 (throttle): PASS\n");
  }

  // ---- Test 3: canvas sizing ----
  {
    cstest::FakeSurface host;
    host.w = 640;
    host.h = 480;
    cs::CanvasOverlayBridge canvas(host);
    requireTrue(canvas.backingWidth() == 640 && canvas.backingHeight() == 480, "host size");

    canvas.resize(800, 600, 2.0);
    requireTrue(canvas.backingWidth() == 1600 && canvas.backingHeight() == 1200, "hi-dpi backing");
    requireTrue(canvas.frame().width() == 800, "logical size");
    requireTrue(canvas.dirty(), "resize repaints");

    canvas.resize(800, 600, 0.0);
    requireTrue(canvas.backingWidth() == 800, "invalid ratio treated as 1");
    std::printf("  Test 3 (sizing): PASS\n");
  }

  // ---- Test 4: primitive bridge attach/detach ----
  {
    cstest::FakeSurface host;
    cs::PrimitiveRenderBridge bridge(host);
    const cs::Tool& tool = *registry.find(cs::DrawingKind::HorizontalLine);
    cs::Drawing d = tool.createDrawing({0, 100}, nullptr, 0);
    d.id = 5;

    bridge.attach(d, tool);
    d.anchors[0].price = 250;
    bridge.attach(d, tool);
    requireTrue(bridge.attachedCount() == 1 && host.primitives.size() == 1, "re-attach replaces");
    requireTrue(host.paint().segments()[0].a.y == 250, "replacement painted");

    requireTrue(bridge.detach(5), "detach");
    requireTrue(!bridge.detach(5), "detach twice");
    requireTrue(host.primitives.empty(), "host primitive removed");
    std::printf("  Test 4 (attach/detach): PASS\n");
  }

  std::printf("D5.1 render_bridge: ALL PASS\n");
  return 0;
}
