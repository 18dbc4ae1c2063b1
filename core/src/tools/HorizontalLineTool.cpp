#include "cs/tools/HorizontalLineTool.hpp"
#include "cs/math/PriceFormat.hpp"

#include <cmath>

namespace cs {

DrawingStyle HorizontalLineTool::builtinStyle() {
  DrawingStyle s;
  parseColor("#4ECDC4", s.color);
  s.lineWidth = 2.0f;
  s.dash = LineDash::Solid;
  return s;
}

void HorizontalLineTool::updateDrawingData(Drawing& d, const DomainSample& sample) const {
  if (d.anchors.empty()) return;
  if (sample.hasPrice && std::isfinite(sample.point.price))
    d.anchors.front().price = snap(styleOf(d), sample.point.price);
}

void HorizontalLineTool::computeDerived(Drawing& d) const {
  d.derived = DerivedGeometry{};
}

void HorizontalLineTool::render(PaintTarget& target, const Drawing& d,
                                const CoordinateMapper& mapper) const {
  double y;
  if (d.anchors.empty() || !mapper.priceToScreen(d.start().price, y)) {
    target.noteSkipped(d.id);
    return;
  }

  const DrawingStyle& st = styleOf(d);
  double w = target.width();
  target.strokeSegment(d.id, {0.0, y}, {w, y}, {st.color, st.lineWidth, st.dash});

  if (!st.showLabels || w <= config_.minDecorationPx) return;

  LabelStyle ls = config_.label;
  ls.anchor = LabelAnchor::Right;
  target.drawLabel(d.id, {w - config_.horizontalLabelMarginPx, y},
                   formatPrice(d.start().price, st.pricePrecision), ls);
}

bool HorizontalLineTool::hitTest(const Drawing& d, const ScreenPoint& p, double tolerance,
                                 const CoordinateMapper& mapper, double surfaceWidth) const {
  double y;
  if (d.anchors.empty() || !mapper.priceToScreen(d.start().price, y)) return false;
  if (p.x < -tolerance || p.x > surfaceWidth + tolerance) return false;
  return std::fabs(p.y - y) <= tolerance;
}

} // namespace cs
