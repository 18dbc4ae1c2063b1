#include "cs/interaction/DrawingManager.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <exception>

namespace cs {

namespace {

std::int64_t systemClockMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

DrawingManager::DrawingManager(ChartSurface& surface, RenderBridge& bridge,
                               const ToolRegistry& registry, EventBus& bus,
                               const DrawingManagerConfig& cfg)
  : surface_(surface), bridge_(bridge), registry_(registry), bus_(bus),
    config_(cfg), clock_(systemClockMs) {
  history_.setConfig({config_.historyDepth});
  history_.setOnChange([this] {
    emitEvent(EventType::HistoryChanged, kInvalidDrawingId, history_.undoCount());
  });
}

DrawingManager::~DrawingManager() {
  history_.setOnChange(nullptr);
  endGesture();
  try {
    bridge_.detachAll();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "DrawingManager::~DrawingManager: %s\n", e.what());
  }
}

void DrawingManager::setConfig(const DrawingManagerConfig& cfg) {
  config_ = cfg;
  history_.setConfig({config_.historyDepth});
}

void DrawingManager::setClock(Clock clock) {
  clock_ = clock ? std::move(clock) : Clock(systemClockMs);
}

InteractionState DrawingManager::state() const {
  if (inProgress_) return InteractionState::Drawing;
  if (activeTool_) return InteractionState::Armed;
  return InteractionState::Idle;
}

// -------------------- tool selection --------------------

bool DrawingManager::selectTool(DrawingKind kind) {
  const Tool* tool = registry_.find(kind);
  if (!tool) {
    std::fprintf(stderr, "DrawingManager::selectTool: no tool for kind %d\n",
                 static_cast<int>(kind));
    return false;
  }
  if (isDrawing()) return false;

  if (tool == activeTool_) {
    deselectTool();
    return true;
  }

  activeTool_ = tool;
  Event e;
  e.type = EventType::ToolActivated;
  e.tool = tool->name();
  bus_.emit(e);
  return true;
}

bool DrawingManager::selectTool(const std::string& name) {
  DrawingKind kind;
  if (!parseDrawingKind(name, kind)) {
    std::fprintf(stderr, "DrawingManager::selectTool: unknown tool '%s'\n", name.c_str());
    return false;
  }
  return selectTool(kind);
}

void DrawingManager::deselectTool() {
  if (!activeTool_) return;
  if (isDrawing()) cancelDrawing();

  const Tool* previous = activeTool_;
  activeTool_ = nullptr;
  Event e;
  e.type = EventType::ToolDeactivated;
  e.tool = previous->name();
  bus_.emit(e);
}

// -------------------- pointer API --------------------

DomainSample DrawingManager::sampleAt(const ScreenPoint& p) const {
  DomainSample s;
  const CoordinateMapper& m = surface_.mapper();
  s.hasTime = m.screenToTime(p.x, s.point.time);
  s.hasPrice = m.screenToPrice(p.y, s.point.price);
  return s;
}

void DrawingManager::onPointerDown(const ScreenPoint& p) {
  if (state() != InteractionState::Armed) return;
  DomainSample s = sampleAt(p);
  if (!s.complete()) return;  // invalid gesture

  try {
    beginDrawing(s.point);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "DrawingManager::onPointerDown: %s\n", e.what());
    endGesture();
  }
}

void DrawingManager::onPointerMove(const ScreenPoint& p) {
  if (isDrawing()) {
    try {
      updateDrawing(sampleAt(p));
    } catch (const std::exception& e) {
      std::fprintf(stderr, "DrawingManager::onPointerMove: %s\n", e.what());
      cancelDrawing();
    }
    return;
  }
  setHovered(hitTest(p));
}

void DrawingManager::onPointerUp(const ScreenPoint& p) {
  if (!isDrawing()) return;
  try {
    commitDrawing(sampleAt(p));
  } catch (const std::exception& e) {
    std::fprintf(stderr, "DrawingManager::onPointerUp: %s\n", e.what());
    cancelDrawing();
  }
}

void DrawingManager::onPointerLeave() {
  if (isDrawing()) {
    cancelDrawing();
    return;
  }
  setHovered(kInvalidDrawingId);
}

// -------------------- gesture --------------------

bool DrawingManager::beginDrawing(const DomainPoint& start) {
  if (state() != InteractionState::Armed) return false;
  if (!std::isfinite(start.time) || !std::isfinite(start.price)) return false;

  auto d = std::make_unique<Drawing>(
      activeTool_->createDrawing(start, nullptr, clock_()));
  activeTool_->computeDerived(*d);

  inProgress_ = std::move(d);
  navLock_ = std::make_unique<NavigationLock>(surface_);
  bridge_.setPreview(inProgress_.get(), activeTool_);
  repaint();

  Event e;
  e.type = EventType::GestureStarted;
  e.tool = activeTool_->name();
  e.point = start;
  e.hasPoint = true;
  bus_.emit(e);
  return true;
}

void DrawingManager::updateDrawing(const DomainSample& sample) {
  if (!inProgress_) return;
  activeTool_->updateDrawingData(*inProgress_, sample);
  activeTool_->computeDerived(*inProgress_);
  repaint();
}

DrawingId DrawingManager::commitDrawing(const DomainSample& sample) {
  if (!inProgress_) return kInvalidDrawingId;

  // Local owners: the lock is released on every path out of here.
  std::unique_ptr<NavigationLock> lock = std::move(navLock_);
  std::unique_ptr<Drawing> drawing = std::move(inProgress_);
  bridge_.clearPreview();

  const Tool* tool = activeTool_;
  tool->finalizeDrawingData(*drawing, sample);

  if (store_.count() >= config_.maxDrawings) {
    std::fprintf(stderr, "DrawingManager::commitDrawing: limit of %zu drawings reached\n",
                 config_.maxDrawings);
    lock.reset();
    repaint();
    Event e;
    e.type = EventType::GestureCancelled;
    e.tool = tool->name();
    bus_.emit(e);
    return kInvalidDrawingId;
  }

  // Stored, recorded and reported together; the repaint comes last.
  DrawingId id = store_.add(std::move(*drawing));
  const Drawing* stored = store_.get(id);
  bridge_.attach(*stored, *tool);
  lock.reset();

  Drawing snapshot = *stored;
  history_.record({std::string("Add ") + tool->name(),
                   [this, snapshot] { restoreDrawing(snapshot, store_.count()); },
                   [this, id] { eraseDrawing(id); }});
  repaint();

  Event e;
  e.type = EventType::GestureCompleted;
  e.tool = tool->name();
  e.drawingId = id;
  e.count = store_.count();
  bus_.emit(e);
  return id;
}

void DrawingManager::cancelDrawing() {
  if (!inProgress_) return;
  endGesture();
  repaint();

  Event e;
  e.type = EventType::GestureCancelled;
  if (activeTool_) e.tool = activeTool_->name();
  bus_.emit(e);
}

// Host repaint failures are logged and dropped; state changes stand.
void DrawingManager::repaint() {
  try {
    bridge_.requestRepaint();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "DrawingManager::repaint: %s\n", e.what());
  }
}

void DrawingManager::endGesture() {
  bridge_.clearPreview();
  inProgress_.reset();
  navLock_.reset();
}

// -------------------- collection --------------------

void DrawingManager::eraseDrawing(DrawingId id) {
  bridge_.detach(id);
  store_.remove(id);
  if (hovered_ == id) hovered_ = kInvalidDrawingId;
  repaint();
}

void DrawingManager::restoreDrawing(const Drawing& d, std::size_t index) {
  if (!store_.insertAt(index, d)) return;
  resyncBridge();
}

void DrawingManager::resyncBridge() {
  bridge_.detachAll();
  for (const auto& d : store_.drawings()) {
    const Tool* tool = registry_.find(d.kind);
    if (tool) bridge_.attach(d, *tool);
  }
  repaint();
}

bool DrawingManager::removeDrawing(DrawingId id) {
  const Drawing* d = store_.get(id);
  if (!d) return false;

  Drawing snapshot = *d;
  std::size_t index = store_.indexOf(id);
  eraseDrawing(id);

  history_.record({std::string("Remove ") + toString(snapshot.kind),
                   [this, id] { eraseDrawing(id); },
                   [this, snapshot, index] { restoreDrawing(snapshot, index); }});

  emitEvent(EventType::DrawingRemoved, id, store_.count());
  return true;
}

void DrawingManager::clearAll() {
  if (isDrawing()) cancelDrawing();

  std::vector<Drawing> snapshot = store_.drawings();
  bridge_.detachAll();
  store_.clear();
  hovered_ = kInvalidDrawingId;
  repaint();

  if (!snapshot.empty()) {
    history_.record({"Clear drawings",
                     [this] {
                       bridge_.detachAll();
                       store_.clear();
                       hovered_ = kInvalidDrawingId;
                       repaint();
                     },
                     [this, snapshot] {
                       for (std::size_t i = 0; i < snapshot.size(); ++i)
                         store_.insertAt(i, snapshot[i]);
                       resyncBridge();
                     }});
  }

  emitEvent(EventType::DrawingsCleared, kInvalidDrawingId, snapshot.size());
}

DrawingId DrawingManager::hitTest(const ScreenPoint& p) const {
  const auto& all = store_.drawings();
  const CoordinateMapper& mapper = surface_.mapper();
  for (auto it = all.rbegin(); it != all.rend(); ++it) {
    const Tool* tool = registry_.find(it->kind);
    if (!tool) continue;
    if (tool->hitTest(*it, p, config_.hitTolerancePx, mapper, surface_.width()))
      return it->id;
  }
  return kInvalidDrawingId;
}

void DrawingManager::setHovered(DrawingId id) {
  if (id == hovered_) return;
  hovered_ = id;
  emitEvent(EventType::HoverChanged, id);
}

// -------------------- persistence --------------------

std::string DrawingManager::exportAll() const {
  return drawingsToJSON(store_.drawings(), registry_);
}

ImportReport DrawingManager::importAll(const std::string& json) {
  std::vector<Drawing> parsed;
  ImportReport report = drawingsFromJSON(json, registry_, parsed);
  if (!report.parsed) return report;

  std::vector<Drawing> added;
  for (auto& d : parsed) {
    if (store_.count() >= config_.maxDrawings) {
      report.imported--;
      report.skipped++;
      continue;
    }
    const Tool* tool = registry_.find(d.kind);
    DrawingId id = store_.add(std::move(d));
    const Drawing* stored = store_.get(id);
    bridge_.attach(*stored, *tool);
    added.push_back(*stored);
  }
  if (report.imported < parsed.size()) {
    std::fprintf(stderr, "DrawingManager::importAll: %zu records over the limit of %zu\n",
                 parsed.size() - report.imported, config_.maxDrawings);
  }
  repaint();

  if (!added.empty()) {
    history_.record({"Import drawings",
                     [this, added] {
                       for (const auto& d : added) store_.insertAt(store_.count(), d);
                       resyncBridge();
                     },
                     [this, added] {
                       for (const auto& d : added) eraseDrawing(d.id);
                     }});
  }

  emitEvent(EventType::DrawingsImported, kInvalidDrawingId, report.imported);
  return report;
}

// -------------------- history --------------------

bool DrawingManager::undo() {
  if (isDrawing()) return false;
  return history_.undo();
}

bool DrawingManager::redo() {
  if (isDrawing()) return false;
  return history_.redo();
}

void DrawingManager::emitEvent(EventType type, DrawingId id, std::size_t count) {
  Event e;
  e.type = type;
  e.drawingId = id;
  e.count = count;
  if (activeTool_) e.tool = activeTool_->name();
  bus_.emit(e);
}

} // namespace cs
