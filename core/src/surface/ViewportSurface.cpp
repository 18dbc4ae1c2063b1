#include "cs/surface/ViewportSurface.hpp"
#include <algorithm>

namespace cs {

ViewportSurface::ViewportSurface(int fbWidth, int fbHeight)
  : mapper_(viewport_) {
  viewport_.setPixelViewport(fbWidth, fbHeight);
  viewport_.setPlotRect({0, 0, static_cast<double>(fbWidth),
                         static_cast<double>(fbHeight)});
}

void ViewportSurface::resize(int fbWidth, int fbHeight) {
  viewport_.setPixelViewport(fbWidth, fbHeight);
  requestRepaint();
}

bool ViewportSurface::applyInput(const ViewportInputState& input) {
  if (!navigationEnabled_) return false;

  bool changed = false;
  if (input.dragging && (input.dragDx != 0.0 || input.dragDy != 0.0)) {
    viewport_.pan(input.dragDx, input.dragDy);
    changed = true;
  }
  if (input.scrollDelta != 0.0) {
    viewport_.zoom(input.scrollDelta * navConfig_.zoomSensitivity,
                   input.cursorX, input.cursorY);
    changed = true;
  }
  if (changed) requestRepaint();
  return changed;
}

bool ViewportSurface::frameTick() {
  if (!dirty_) return false;
  dirty_ = false;

  frame_.clear();
  frame_.setSize(width(), height());
  for (const OverlayPrimitive* p : primitives_) {
    p->paint(frame_, mapper_);
  }

  stats_.paintsExecuted++;
  stats_.segmentsDrawn = static_cast<std::uint32_t>(frame_.segments().size());
  stats_.elementsSkipped = frame_.skipped();
  return true;
}

bool ViewportSurface::attachPrimitive(OverlayPrimitive* primitive) {
  if (!primitive) return false;
  if (std::find(primitives_.begin(), primitives_.end(), primitive) != primitives_.end())
    return false;
  primitives_.push_back(primitive);
  requestRepaint();
  return true;
}

bool ViewportSurface::detachPrimitive(OverlayPrimitive* primitive) {
  auto it = std::find(primitives_.begin(), primitives_.end(), primitive);
  if (it == primitives_.end()) return false;
  primitives_.erase(it);
  requestRepaint();
  return true;
}

void ViewportSurface::requestRepaint() {
  stats_.repaintRequests++;
  dirty_ = true;
}

void ViewportSurface::setNavigationEnabled(bool enabled) {
  if (enabled == navigationEnabled_) return;
  navigationEnabled_ = enabled;
  if (enabled) stats_.navigationUnlocks++;
  else stats_.navigationLocks++;
}

double ViewportSurface::width() const {
  return static_cast<double>(viewport_.fbWidth());
}

double ViewportSurface::height() const {
  return static_cast<double>(viewport_.fbHeight());
}

} // namespace cs
