#include "cs/render/CanvasOverlayBridge.hpp"
#include "cs/tools/Tool.hpp"

#include <cmath>

namespace cs {

CanvasOverlayBridge::CanvasOverlayBridge(const ChartSurface& host)
  : host_(host) {
  resize(host.width(), host.height(), 1.0);
}

void CanvasOverlayBridge::resize(double width, double height, double pixelRatio) {
  if (!(pixelRatio > 0.0) || !std::isfinite(pixelRatio)) pixelRatio = 1.0;
  frame_.setSize(width, height);
  backingW_ = static_cast<int>(std::lround(width * pixelRatio));
  backingH_ = static_cast<int>(std::lround(height * pixelRatio));
  dirty_ = true;
}

bool CanvasOverlayBridge::frameTick() {
  framesSincePaint_++;
  if (!dirty_ || framesSincePaint_ < config_.minFramesBetweenPaints) return false;
  paint();
  return true;
}

void CanvasOverlayBridge::paint() {
  frame_.clear();
  const CoordinateMapper& mapper = host_.mapper();
  for (const auto& e : entries_) e.tool->render(frame_, e.drawing, mapper);
  if (preview_ && previewTool_) previewTool_->render(frame_, *preview_, mapper);

  dirty_ = false;
  framesSincePaint_ = 0;
  paints_++;
}

void CanvasOverlayBridge::attach(const Drawing& drawing, const Tool& tool) {
  for (auto& e : entries_) {
    if (e.drawing.id == drawing.id) {
      e.drawing = drawing;
      e.tool = &tool;
      dirty_ = true;
      return;
    }
  }
  entries_.push_back({drawing, &tool});
  dirty_ = true;
}

bool CanvasOverlayBridge::detach(DrawingId id) {
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->drawing.id == id) {
      entries_.erase(it);
      dirty_ = true;
      return true;
    }
  }
  return false;
}

void CanvasOverlayBridge::detachAll() {
  if (!entries_.empty()) dirty_ = true;
  entries_.clear();
}

void CanvasOverlayBridge::setPreview(const Drawing* drawing, const Tool* tool) {
  preview_ = drawing;
  previewTool_ = tool;
  dirty_ = true;
}

void CanvasOverlayBridge::clearPreview() {
  if (preview_) dirty_ = true;
  preview_ = nullptr;
  previewTool_ = nullptr;
}

} // namespace cs
