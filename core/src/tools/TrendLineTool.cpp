#include "cs/tools/TrendLineTool.hpp"
#include "cs/math/PriceFormat.hpp"
#include "cs/math/SegmentMath.hpp"

#include <algorithm>
#include <cmath>

namespace cs {

DrawingStyle TrendLineTool::builtinStyle() {
  DrawingStyle s;
  parseColor("#FF6B6B", s.color);
  s.lineWidth = 2.0f;
  s.dash = LineDash::Solid;
  return s;
}

void TrendLineTool::computeDerived(Drawing& d) const {
  DerivedGeometry g;
  if (d.anchors.size() >= 2) {
    const DomainPoint& s = d.start();
    const DomainPoint& e = d.end();
    g.priceDelta = e.price - s.price;
    g.timeDelta = e.time - s.time;
    g.length = std::sqrt(g.priceDelta * g.priceDelta + g.timeDelta * g.timeDelta);
    g.angle = std::atan2(g.priceDelta, g.timeDelta);
    g.slope = (g.timeDelta != 0.0) ? g.priceDelta / g.timeDelta : 0.0;
    g.priceRange = std::fabs(g.priceDelta);
    if (s.price != 0.0) {
      g.percentChange = g.priceDelta / s.price * 100.0;
      g.hasPercentChange = true;
    }
  }
  d.derived = std::move(g);
}

bool TrendLineTool::screenSegment(const Drawing& d, const CoordinateMapper& mapper,
                                  ScreenPoint& a, ScreenPoint& b) const {
  if (d.anchors.size() < 2) return false;
  return resolve(mapper, d.start(), a) && resolve(mapper, d.end(), b);
}

void TrendLineTool::applyExtension(const Drawing& d, double surfaceExtent,
                                   ScreenPoint& a, ScreenPoint& b) const {
  const DrawingStyle& st = styleOf(d);
  if (!st.extendLeft && !st.extendRight) return;
  double distance = std::max(config_.extendPx, surfaceExtent);
  extendSegment(a, b, st.extendLeft, st.extendRight, distance);
}

void TrendLineTool::render(PaintTarget& target, const Drawing& d,
                           const CoordinateMapper& mapper) const {
  ScreenPoint sa, sb;
  if (!screenSegment(d, mapper, sa, sb)) {
    target.noteSkipped(d.id);
    return;
  }

  const DrawingStyle& st = styleOf(d);
  ScreenPoint a = sa, b = sb;
  applyExtension(d, std::hypot(target.width(), target.height()), a, b);
  target.strokeSegment(d.id, a, b, {st.color, st.lineWidth, st.dash});

  // Decoration is measured on the anchors, not the extension.
  if (pointDistance(sa, sb) <= config_.minDecorationPx) return;

  double r = st.lineWidth + config_.endpointRadiusPad;
  target.fillMarker(d.id, sa, r, st.color);
  target.fillMarker(d.id, sb, r, st.color);

  if (st.showLabels && d.derived.hasPercentChange) {
    ScreenPoint mid{(sa.x + sb.x) * 0.5, (sa.y + sb.y) * 0.5};
    LabelStyle ls = config_.label;
    ls.anchor = LabelAnchor::Center;
    target.drawLabel(d.id, mid,
                     formatChangeLabel(d.derived.priceDelta, d.derived.percentChange,
                                       st.pricePrecision),
                     ls);
  }
}

bool TrendLineTool::hitTest(const Drawing& d, const ScreenPoint& p, double tolerance,
                            const CoordinateMapper& mapper, double surfaceWidth) const {
  ScreenPoint a, b;
  if (!screenSegment(d, mapper, a, b)) return false;
  applyExtension(d, surfaceWidth, a, b);
  return pointToSegmentDistance(p, a, b) <= tolerance;
}

} // namespace cs
