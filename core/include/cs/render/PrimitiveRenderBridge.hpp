#pragma once
#include "cs/render/RenderBridge.hpp"
#include "cs/surface/ChartSurface.hpp"

#include <memory>
#include <vector>

namespace cs {

// One host primitive per committed drawing. Painting, mapping and repaint
// scheduling all come from the host surface.
class PrimitiveRenderBridge : public RenderBridge {
public:
  explicit PrimitiveRenderBridge(ChartSurface& surface);
  ~PrimitiveRenderBridge() override;

  PrimitiveRenderBridge(const PrimitiveRenderBridge&) = delete;
  PrimitiveRenderBridge& operator=(const PrimitiveRenderBridge&) = delete;

  void attach(const Drawing& drawing, const Tool& tool) override;
  bool detach(DrawingId id) override;
  void detachAll() override;
  void setPreview(const Drawing* drawing, const Tool* tool) override;
  void clearPreview() override;
  void requestRepaint() override;
  std::size_t attachedCount() const override { return primitives_.size(); }

private:
  class DrawingPrimitive : public OverlayPrimitive {
  public:
    DrawingPrimitive(const Drawing& d, const Tool& t) : drawing(d), tool(&t) {}
    void paint(PaintTarget& target, const CoordinateMapper& mapper) const override;

    Drawing drawing;
    const Tool* tool;
  };

  class PreviewPrimitive : public OverlayPrimitive {
  public:
    void paint(PaintTarget& target, const CoordinateMapper& mapper) const override;

    const Drawing* drawing{nullptr};
    const Tool* tool{nullptr};
  };

  // Host repaint errors are logged, not propagated.
  void repaintSurface();

  ChartSurface& surface_;
  std::vector<std::unique_ptr<DrawingPrimitive>> primitives_;
  PreviewPrimitive preview_;
  bool previewAttached_{false};
};

} // namespace cs
