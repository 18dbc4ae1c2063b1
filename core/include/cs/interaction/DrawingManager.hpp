#pragma once
#include "cs/commands/CommandHistory.hpp"
#include "cs/drawing/DrawingStore.hpp"
#include "cs/events/EventBus.hpp"
#include "cs/render/RenderBridge.hpp"
#include "cs/session/DrawingCodec.hpp"
#include "cs/surface/ChartSurface.hpp"
#include "cs/tools/ToolRegistry.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cs {

// Idle -> Armed (tool selected) -> Drawing (pointer held) -> Armed
enum class InteractionState : std::uint8_t {
  Idle = 0,
  Armed,
  Drawing
};

struct DrawingManagerConfig {
  double hitTolerancePx{5};
  std::size_t maxDrawings{100};
  std::size_t historyDepth{100};
};

// Milliseconds since epoch, stamped into createdAt.
using Clock = std::function<std::int64_t()>;

// Owns the committed drawings, the active tool, the in-progress drawing
// and the pointer state machine. Nothing here throws to the caller.
// The surface, bridge, registry and bus must outlive the manager.
class DrawingManager {
public:
  DrawingManager(ChartSurface& surface, RenderBridge& bridge,
                 const ToolRegistry& registry, EventBus& bus,
                 const DrawingManagerConfig& cfg = DrawingManagerConfig{});
  ~DrawingManager();

  DrawingManager(const DrawingManager&) = delete;
  DrawingManager& operator=(const DrawingManager&) = delete;

  void setConfig(const DrawingManagerConfig& cfg);
  const DrawingManagerConfig& config() const { return config_; }
  void setClock(Clock clock);

  // Tool selection. Unknown kinds are rejected (false, state unchanged);
  // mid-gesture selection is ignored (false); re-selecting the active
  // tool toggles back to Idle.
  bool selectTool(DrawingKind kind);
  bool selectTool(const std::string& name);
  void deselectTool();

  // Pointer API in surface pixels.
  void onPointerDown(const ScreenPoint& p);
  void onPointerMove(const ScreenPoint& p);
  void onPointerUp(const ScreenPoint& p);
  void onPointerLeave();

  // Gesture operations in domain space.
  bool beginDrawing(const DomainPoint& start);
  void updateDrawing(const DomainSample& sample);
  // Returns the committed id, or kInvalidDrawingId if nothing was stored.
  DrawingId commitDrawing(const DomainSample& sample);
  void cancelDrawing();

  bool removeDrawing(DrawingId id);
  void clearAll();

  // Topmost drawing within hitTolerancePx, or kInvalidDrawingId.
  DrawingId hitTest(const ScreenPoint& p) const;
  DrawingId hoveredDrawing() const { return hovered_; }

  std::string exportAll() const;
  ImportReport importAll(const std::string& json);

  // Blocked mid-gesture.
  bool undo();
  bool redo();
  bool canUndo() const { return !isDrawing() && history_.canUndo(); }
  bool canRedo() const { return !isDrawing() && history_.canRedo(); }
  const CommandHistory& history() const { return history_; }

  InteractionState state() const;
  bool isDrawing() const { return inProgress_ != nullptr; }
  const Tool* activeTool() const { return activeTool_; }
  const Drawing* inProgress() const { return inProgress_.get(); }

  const DrawingStore& store() const { return store_; }
  const Drawing* get(DrawingId id) const { return store_.get(id); }
  std::size_t drawingCount() const { return store_.count(); }

private:
  DomainSample sampleAt(const ScreenPoint& p) const;

  // Drop the in-progress drawing, its preview and the navigation lock.
  void endGesture();

  // Best-effort bridge repaint; never throws.
  void repaint();

  // Re-attach every stored drawing in z-order.
  void resyncBridge();

  void eraseDrawing(DrawingId id);
  void restoreDrawing(const Drawing& d, std::size_t index);

  void setHovered(DrawingId id);
  void emitEvent(EventType type, DrawingId id = kInvalidDrawingId, std::size_t count = 0);

  ChartSurface& surface_;
  RenderBridge& bridge_;
  const ToolRegistry& registry_;
  EventBus& bus_;
  DrawingManagerConfig config_;
  Clock clock_;

  DrawingStore store_;
  CommandHistory history_;

  const Tool* activeTool_{nullptr};
  std::unique_ptr<Drawing> inProgress_;
  std::unique_ptr<NavigationLock> navLock_;
  DrawingId hovered_{kInvalidDrawingId};
};

} // namespace cs
