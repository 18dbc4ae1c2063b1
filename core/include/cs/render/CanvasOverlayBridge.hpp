#pragma once
#include "cs/render/OverlayFrame.hpp"
#include "cs/render/RenderBridge.hpp"
#include "cs/surface/ChartSurface.hpp"

#include <cstdint>
#include <vector>

namespace cs {

class Tool;

struct CanvasOverlayConfig {
  int minFramesBetweenPaints{1};  // 1 = paint on any dirty frame
};

// Fallback for hosts without a primitive hook: an independent overlay
// frame laid over the host, sized and repainted by the bridge itself.
// The host surface is used only for coordinate mapping.
class CanvasOverlayBridge : public RenderBridge {
public:
  explicit CanvasOverlayBridge(const ChartSurface& host);

  void setConfig(const CanvasOverlayConfig& cfg) { config_ = cfg; }

  // Logical size in surface pixels; the backing store is size * pixelRatio.
  void resize(double width, double height, double pixelRatio);
  int backingWidth() const { return backingW_; }
  int backingHeight() const { return backingH_; }

  // Advance one frame; paints if dirty and the throttle allows.
  // Returns true if a paint happened.
  bool frameTick();

  const OverlayFrame& frame() const { return frame_; }
  std::uint64_t paintCount() const { return paints_; }
  bool dirty() const { return dirty_; }

  void attach(const Drawing& drawing, const Tool& tool) override;
  bool detach(DrawingId id) override;
  void detachAll() override;
  void setPreview(const Drawing* drawing, const Tool* tool) override;
  void clearPreview() override;
  void requestRepaint() override { dirty_ = true; }
  std::size_t attachedCount() const override { return entries_.size(); }

private:
  struct Entry {
    Drawing drawing;
    const Tool* tool;
  };

  void paint();

  const ChartSurface& host_;
  CanvasOverlayConfig config_;
  OverlayFrame frame_;
  std::vector<Entry> entries_;
  const Drawing* preview_{nullptr};
  const Tool* previewTool_{nullptr};
  int backingW_{0}, backingH_{0};
  int framesSincePaint_{0};
  std::uint64_t paints_{0};
  bool dirty_{true};
};

} // namespace cs
