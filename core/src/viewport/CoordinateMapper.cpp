#include "cs/viewport/CoordinateMapper.hpp"
#include <cmath>

namespace cs {

bool ViewportMapper::inX(double px) const {
  const PlotRect& r = vp_.plotRect();
  double m = config_.offscreenMarginPx;
  return px >= r.left - m && px <= r.right() + m;
}

bool ViewportMapper::inY(double py) const {
  const PlotRect& r = vp_.plotRect();
  double m = config_.offscreenMarginPx;
  return py >= r.top - m && py <= r.bottom() + m;
}

bool ViewportMapper::timeToScreen(double time, double& x) const {
  if (!vp_.isValid() || !std::isfinite(time)) return false;
  double px = vp_.timeToPixelX(time);
  if (!std::isfinite(px) || !inX(px)) return false;
  x = px;
  return true;
}

bool ViewportMapper::priceToScreen(double price, double& y) const {
  if (!vp_.isValid() || !std::isfinite(price)) return false;
  double py = vp_.priceToPixelY(price);
  if (!std::isfinite(py) || !inY(py)) return false;
  y = py;
  return true;
}

bool ViewportMapper::screenToTime(double x, double& time) const {
  if (!vp_.isValid() || !std::isfinite(x) || !inX(x)) return false;
  double t = vp_.pixelXToTime(x);
  if (!std::isfinite(t)) return false;
  time = t;
  return true;
}

bool ViewportMapper::screenToPrice(double y, double& price) const {
  if (!vp_.isValid() || !std::isfinite(y) || !inY(y)) return false;
  double p = vp_.pixelYToPrice(y);
  if (!std::isfinite(p)) return false;
  price = p;
  return true;
}

} // namespace cs
