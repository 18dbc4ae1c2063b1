// Interactive annotation demo.
// T/H/F select a tool (again to toggle off), Esc deselects, left-drag draws,
// Delete removes the hovered drawing, Z/Y undo/redo, C clears,
// S/L save/load chartscribe_state.json. Right-drag pans, scroll zooms.
// Optional argv[1]: engine config JSON.

#include "cs/config/EngineConfig.hpp"
#include "cs/events/EventBus.hpp"
#include "cs/gl/GlfwContext.hpp"
#include "cs/gl/OverlayRenderer.hpp"
#include "cs/interaction/DrawingManager.hpp"
#include "cs/render/PrimitiveRenderBridge.hpp"
#include "cs/session/ChartState.hpp"
#include "cs/surface/ViewportSurface.hpp"
#include "cs/tools/ToolRegistry.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

static const char* kStateFile = "chartscribe_state.json";

static bool readFile(const char* path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

static bool writeFile(const char* path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out << text;
  return static_cast<bool>(out);
}

static void saveState(const cs::DrawingManager& mgr, const cs::Viewport& vp) {
  cs::ChartState state;
  const cs::DataRange& r = vp.dataRange();
  state.viewport = {r.xMin, r.xMax, r.yMin, r.yMax};
  state.drawingsJSON = mgr.exportAll();
  if (writeFile(kStateFile, cs::serializeChartState(state)))
    std::printf("Saved %zu drawings to %s\n", mgr.drawingCount(), kStateFile);
  else
    std::fprintf(stderr, "annotate_demo: cannot write %s\n", kStateFile);
}

static void loadState(cs::DrawingManager& mgr, cs::ViewportSurface& surface) {
  std::string text;
  cs::ChartState state;
  if (!readFile(kStateFile, text) || !cs::deserializeChartState(text, state)) {
    std::fprintf(stderr, "annotate_demo: cannot load %s\n", kStateFile);
    return;
  }
  surface.viewport().setDataRange(state.viewport.xMin, state.viewport.xMax,
                                  state.viewport.yMin, state.viewport.yMax);
  mgr.clearAll();
  cs::ImportReport rep = mgr.importAll(state.drawingsJSON);
  std::printf("Loaded %zu drawings (%zu skipped)\n", rep.imported, rep.skipped);
  surface.requestRepaint();
}

int main(int argc, char** argv) {
#ifndef CS_HAS_GLFW
  (void)argc;
  (void)argv;
  std::fprintf(stderr, "annotate_demo: built without GLFW\n");
  return 1;
#else
  constexpr int W = 1280, H = 720;

  cs::EngineConfig config;
  if (argc > 1) {
    std::string text;
    if (!readFile(argv[1], text) || !cs::loadEngineConfigJSON(text, config))
      std::fprintf(stderr, "annotate_demo: using default config\n");
  }

  cs::GlfwContext window;
  if (!window.init(W, H, "ChartScribe")) return 1;

  cs::OverlayRenderer renderer;
  if (!renderer.init()) return 1;

  // Thirty daily bars' worth of time, prices around 150.
  cs::ViewportSurface surface(window.width(), window.height());
  surface.viewport().setDataRange(1700000000.0, 1700000000.0 + 30 * 86400.0, 90.0, 210.0);
  surface.setMapperConfig(config.mapper);
  surface.setNavigationConfig(config.navigation);

  cs::ToolRegistry registry;
  cs::registerBuiltinTools(registry);
  cs::applyEngineConfig(config, registry);

  cs::EventBus bus;
  bus.subscribeAll([](const cs::Event& e) {
    if (e.type == cs::EventType::HoverChanged) return;
    std::printf("[%s] tool=%s id=%llu count=%zu\n", cs::toString(e.type),
                e.tool.c_str(), static_cast<unsigned long long>(e.drawingId), e.count);
  });

  cs::PrimitiveRenderBridge bridge(surface);
  cs::DrawingManager manager(surface, bridge, registry, bus, config.manager);

  const cs::Rgba background{0.08f, 0.09f, 0.11f, 1.0f};
  int lastW = window.width(), lastH = window.height();

  while (!window.shouldClose()) {
    cs::WindowInput in = window.pollInput();
    if (in.shouldClose) break;

    if (window.width() != lastW || window.height() != lastH) {
      lastW = window.width();
      lastH = window.height();
      surface.resize(lastW, lastH);
    }

    for (const auto& ev : in.pointer) {
      cs::ScreenPoint p{ev.x, ev.y};
      switch (ev.action) {
        case cs::PointerAction::Down:  manager.onPointerDown(p); break;
        case cs::PointerAction::Move:  manager.onPointerMove(p); break;
        case cs::PointerAction::Up:    manager.onPointerUp(p); break;
        case cs::PointerAction::Leave: manager.onPointerLeave(); break;
      }
    }

    for (cs::KeyCode key : in.keys) {
      switch (key) {
        case cs::KeyCode::T: manager.selectTool(cs::DrawingKind::TrendLine); break;
        case cs::KeyCode::H: manager.selectTool(cs::DrawingKind::HorizontalLine); break;
        case cs::KeyCode::F: manager.selectTool(cs::DrawingKind::FibRetracement); break;
        case cs::KeyCode::Escape: manager.deselectTool(); break;
        case cs::KeyCode::Delete:
          if (manager.hoveredDrawing() != cs::kInvalidDrawingId)
            manager.removeDrawing(manager.hoveredDrawing());
          break;
        case cs::KeyCode::Z: manager.undo(); break;
        case cs::KeyCode::Y: manager.redo(); break;
        case cs::KeyCode::C: manager.clearAll(); break;
        case cs::KeyCode::S: saveState(manager, surface.viewport()); break;
        case cs::KeyCode::L: loadState(manager, surface); break;
        default: break;
      }
    }

    surface.applyInput(in.navigation);

    // Re-record only when something asked for a repaint; always present.
    surface.frameTick();
    renderer.render(surface.frame(), window.width(), window.height(), background);
    window.swapBuffers();
  }

  return 0;
#endif
}
