#include "cs/render/PrimitiveRenderBridge.hpp"
#include "cs/tools/Tool.hpp"

#include <cstdio>
#include <exception>

namespace cs {

void PrimitiveRenderBridge::DrawingPrimitive::paint(PaintTarget& target,
                                                    const CoordinateMapper& mapper) const {
  tool->render(target, drawing, mapper);
}

void PrimitiveRenderBridge::PreviewPrimitive::paint(PaintTarget& target,
                                                    const CoordinateMapper& mapper) const {
  if (drawing && tool) tool->render(target, *drawing, mapper);
}

PrimitiveRenderBridge::PrimitiveRenderBridge(ChartSurface& surface)
  : surface_(surface) {}

PrimitiveRenderBridge::~PrimitiveRenderBridge() {
  clearPreview();
  detachAll();
}

void PrimitiveRenderBridge::attach(const Drawing& drawing, const Tool& tool) {
  for (auto& p : primitives_) {
    if (p->drawing.id == drawing.id) {
      p->drawing = drawing;
      p->tool = &tool;
      repaintSurface();
      return;
    }
  }

  auto prim = std::make_unique<DrawingPrimitive>(drawing, tool);
  if (!surface_.attachPrimitive(prim.get())) return;
  primitives_.push_back(std::move(prim));

  // Keep the preview on top.
  if (previewAttached_) {
    surface_.detachPrimitive(&preview_);
    surface_.attachPrimitive(&preview_);
  }
}

bool PrimitiveRenderBridge::detach(DrawingId id) {
  for (auto it = primitives_.begin(); it != primitives_.end(); ++it) {
    if ((*it)->drawing.id == id) {
      surface_.detachPrimitive(it->get());
      primitives_.erase(it);
      return true;
    }
  }
  return false;
}

void PrimitiveRenderBridge::detachAll() {
  for (auto& p : primitives_) surface_.detachPrimitive(p.get());
  bool hadPrimitives = !primitives_.empty();
  primitives_.clear();
  if (hadPrimitives) repaintSurface();
}

void PrimitiveRenderBridge::setPreview(const Drawing* drawing, const Tool* tool) {
  preview_.drawing = drawing;
  preview_.tool = tool;
  if (previewAttached_) surface_.detachPrimitive(&preview_);
  previewAttached_ = surface_.attachPrimitive(&preview_);
}

void PrimitiveRenderBridge::clearPreview() {
  if (previewAttached_) {
    surface_.detachPrimitive(&preview_);
    previewAttached_ = false;
  }
  preview_.drawing = nullptr;
  preview_.tool = nullptr;
}

void PrimitiveRenderBridge::requestRepaint() {
  repaintSurface();
}

void PrimitiveRenderBridge::repaintSurface() {
  try {
    surface_.requestRepaint();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "PrimitiveRenderBridge::requestRepaint: %s\n", e.what());
  }
}

} // namespace cs
