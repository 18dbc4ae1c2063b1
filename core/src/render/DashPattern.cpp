#include "cs/render/DashPattern.hpp"
#include <algorithm>
#include <cmath>

namespace cs {

DashLengths dashLengthsOf(LineDash dash, float lineWidth) {
  double scale = std::max(1.0, static_cast<double>(lineWidth));
  switch (dash) {
    case LineDash::Dashed: return {8.0 * scale, 4.0 * scale};
    case LineDash::Dotted: return {2.0 * scale, 3.0 * scale};
    case LineDash::Solid:
    default: return {0.0, 0.0};
  }
}

std::vector<ScreenSegment> splitDashed(const ScreenPoint& a, const ScreenPoint& b,
                                       LineDash dash, float lineWidth) {
  std::vector<ScreenSegment> out;
  DashLengths dl = dashLengthsOf(dash, lineWidth);
  double dx = b.x - a.x;
  double dy = b.y - a.y;
  double len = std::sqrt(dx * dx + dy * dy);

  if (dl.on <= 0.0 || len <= 0.0) {
    out.push_back({a, b});
    return out;
  }

  double ux = dx / len;
  double uy = dy / len;
  double period = dl.on + dl.off;
  out.reserve(static_cast<std::size_t>(len / period) + 1);

  for (double t = 0.0; t < len; t += period) {
    double t1 = std::min(len, t + dl.on);
    out.push_back({{a.x + ux * t, a.y + uy * t}, {a.x + ux * t1, a.y + uy * t1}});
  }
  return out;
}

} // namespace cs
