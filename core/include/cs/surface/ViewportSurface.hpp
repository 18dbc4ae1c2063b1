#pragma once
#include "cs/debug/Stats.hpp"
#include "cs/render/OverlayFrame.hpp"
#include "cs/surface/ChartSurface.hpp"
#include "cs/viewport/CoordinateMapper.hpp"
#include "cs/viewport/InputState.hpp"
#include "cs/viewport/Viewport.hpp"

#include <vector>

namespace cs {

// Production ChartSurface over a Viewport. Repaints are coalesced:
// requestRepaint() only marks the surface dirty and frameTick() paints
// at most once per frame into an OverlayFrame.
class ViewportSurface : public ChartSurface {
public:
  ViewportSurface(int fbWidth, int fbHeight);

  ViewportSurface(const ViewportSurface&) = delete;
  ViewportSurface& operator=(const ViewportSurface&) = delete;

  Viewport& viewport() { return viewport_; }
  const Viewport& viewport() const { return viewport_; }

  void setMapperConfig(const MapperConfig& cfg) { mapper_.setConfig(cfg); }
  void setNavigationConfig(const NavigationConfig& cfg) { navConfig_ = cfg; }

  // Resize the framebuffer and schedule a repaint.
  void resize(int fbWidth, int fbHeight);

  // Pan/zoom from one frame of input. Returns true if the view changed.
  // Ignored while navigation is disabled.
  bool applyInput(const ViewportInputState& input);

  // Paint if dirty. Returns true if a paint happened.
  bool frameTick();

  const OverlayFrame& frame() const { return frame_; }
  const OverlayStats& stats() const { return stats_; }
  bool dirty() const { return dirty_; }
  std::size_t primitiveCount() const { return primitives_.size(); }

  // ChartSurface
  const CoordinateMapper& mapper() const override { return mapper_; }
  bool attachPrimitive(OverlayPrimitive* primitive) override;
  bool detachPrimitive(OverlayPrimitive* primitive) override;
  void requestRepaint() override;
  void setNavigationEnabled(bool enabled) override;
  bool navigationEnabled() const override { return navigationEnabled_; }
  double width() const override;
  double height() const override;

private:
  Viewport viewport_;
  ViewportMapper mapper_;
  NavigationConfig navConfig_;
  OverlayFrame frame_;
  OverlayStats stats_;
  std::vector<OverlayPrimitive*> primitives_;
  bool dirty_{true};
  bool navigationEnabled_{true};
};

} // namespace cs
