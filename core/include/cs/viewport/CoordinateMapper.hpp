#pragma once
#include "cs/viewport/Viewport.hpp"

namespace cs {

// Bidirectional domain <-> screen mapping. Every query reports whether it
// resolved; an unresolved result means "do not draw this element".
class CoordinateMapper {
public:
  virtual ~CoordinateMapper() = default;

  virtual bool timeToScreen(double time, double& x) const = 0;
  virtual bool priceToScreen(double price, double& y) const = 0;
  virtual bool screenToTime(double x, double& time) const = 0;
  virtual bool screenToPrice(double y, double& price) const = 0;
};

struct MapperConfig {
  // Pixels outside the plot rect that still resolve.
  double offscreenMarginPx{0};
};

// Maps through a live Viewport. Holds no cached positions.
class ViewportMapper : public CoordinateMapper {
public:
  explicit ViewportMapper(const Viewport& vp) : vp_(vp) {}

  void setConfig(const MapperConfig& cfg) { config_ = cfg; }
  const MapperConfig& config() const { return config_; }

  bool timeToScreen(double time, double& x) const override;
  bool priceToScreen(double price, double& y) const override;
  bool screenToTime(double x, double& time) const override;
  bool screenToPrice(double y, double& price) const override;

private:
  bool inX(double px) const;
  bool inY(double py) const;

  const Viewport& vp_;
  MapperConfig config_;
};

} // namespace cs
