#pragma once
#include "cs/render/PaintTarget.hpp"
#include "cs/viewport/CoordinateMapper.hpp"

namespace cs {

// Scene object painted inside the host's own paint pass.
class OverlayPrimitive {
public:
  virtual ~OverlayPrimitive() = default;
  virtual void paint(PaintTarget& target, const CoordinateMapper& mapper) const = 0;
};

// Contract the annotation engine needs from a host chart.
class ChartSurface {
public:
  virtual ~ChartSurface() = default;

  virtual const CoordinateMapper& mapper() const = 0;

  // Primitives paint in attach order. Attaching twice is rejected.
  virtual bool attachPrimitive(OverlayPrimitive* primitive) = 0;
  virtual bool detachPrimitive(OverlayPrimitive* primitive) = 0;

  virtual void requestRepaint() = 0;

  // Host pan/zoom. Disabled while a gesture holds the NavigationLock.
  virtual void setNavigationEnabled(bool enabled) = 0;
  virtual bool navigationEnabled() const = 0;

  virtual double width() const = 0;
  virtual double height() const = 0;
};

// Disables host navigation for its lifetime.
class NavigationLock {
public:
  explicit NavigationLock(ChartSurface& surface) : surface_(surface) {
    surface_.setNavigationEnabled(false);
  }
  ~NavigationLock() { surface_.setNavigationEnabled(true); }

  NavigationLock(const NavigationLock&) = delete;
  NavigationLock& operator=(const NavigationLock&) = delete;

private:
  ChartSurface& surface_;
};

} // namespace cs
