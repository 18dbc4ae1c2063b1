#pragma once
#include "cs/drawing/Drawing.hpp"
#include <cmath>

namespace cs {

inline double pointDistance(const ScreenPoint& a, const ScreenPoint& b) {
  double dx = a.x - b.x;
  double dy = a.y - b.y;
  return std::sqrt(dx * dx + dy * dy);
}

// Distance from p to the closed segment a-b. A zero-length segment
// degenerates to point distance.
inline double pointToSegmentDistance(const ScreenPoint& p,
                                     const ScreenPoint& a, const ScreenPoint& b) {
  double cx = b.x - a.x;
  double cy = b.y - a.y;
  double lenSq = cx * cx + cy * cy;
  if (lenSq == 0.0) return pointDistance(p, a);

  double t = ((p.x - a.x) * cx + (p.y - a.y) * cy) / lenSq;
  if (t < 0.0) t = 0.0;
  if (t > 1.0) t = 1.0;
  ScreenPoint q{a.x + t * cx, a.y + t * cy};
  return pointDistance(p, q);
}

// Move a and/or b outward along a-b by `distance` pixels.
inline void extendSegment(ScreenPoint& a, ScreenPoint& b,
                          bool extendStart, bool extendEnd, double distance) {
  double dx = b.x - a.x;
  double dy = b.y - a.y;
  double len = std::sqrt(dx * dx + dy * dy);
  if (len == 0.0) return;
  double ux = dx / len * distance;
  double uy = dy / len * distance;
  if (extendStart) { a.x -= ux; a.y -= uy; }
  if (extendEnd)   { b.x += ux; b.y += uy; }
}

} // namespace cs
