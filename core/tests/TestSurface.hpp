#pragma once
// Test doubles: identity mapping (x = time, y = price) and a host surface
// that records navigation transitions and paints attached primitives on demand.

#include "cs/render/OverlayFrame.hpp"
#include "cs/surface/ChartSurface.hpp"
#include "cs/viewport/CoordinateMapper.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace cstest {

class IdentityMapper : public cs::CoordinateMapper {
public:
  // Coordinates outside [lo, hi] do not resolve.
  double lo{-1.0e9};
  double hi{1.0e9};

  bool timeToScreen(double t, double& x) const override { return pass(t, x); }
  bool priceToScreen(double p, double& y) const override { return pass(p, y); }
  bool screenToTime(double x, double& t) const override { return pass(x, t); }
  bool screenToPrice(double y, double& p) const override { return pass(y, p); }

private:
  bool pass(double in, double& out) const {
    if (!std::isfinite(in) || in < lo || in > hi) return false;
    out = in;
    return true;
  }
};

class FakeSurface : public cs::ChartSurface {
public:
  IdentityMapper identity;
  double w{800}, h{600};
  bool navEnabled{true};
  int locks{0};
  int unlocks{0};
  int repaints{0};
  bool throwOnRepaint{false};
  std::vector<cs::OverlayPrimitive*> primitives;

  const cs::CoordinateMapper& mapper() const override { return identity; }

  bool attachPrimitive(cs::OverlayPrimitive* p) override {
    if (std::find(primitives.begin(), primitives.end(), p) != primitives.end()) return false;
    primitives.push_back(p);
    return true;
  }
  bool detachPrimitive(cs::OverlayPrimitive* p) override {
    auto it = std::find(primitives.begin(), primitives.end(), p);
    if (it == primitives.end()) return false;
    primitives.erase(it);
    return true;
  }
  void requestRepaint() override {
    repaints++;
    if (throwOnRepaint) throw std::runtime_error("host repaint failed");
  }
  void setNavigationEnabled(bool enabled) override {
    if (enabled == navEnabled) return;
    navEnabled = enabled;
    if (enabled) unlocks++; else locks++;
  }
  bool navigationEnabled() const override { return navEnabled; }
  double width() const override { return w; }
  double height() const override { return h; }

  cs::OverlayFrame paint() const {
    cs::OverlayFrame f(w, h);
    for (const auto* p : primitives) p->paint(f, identity);
    return f;
  }
};

} // namespace cstest
