#include "cs/tools/FibRetracementTool.hpp"
#include "cs/math/PriceFormat.hpp"
#include "cs/math/SegmentMath.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace cs {

std::vector<double> defaultFibLevels() {
  return {0.0, 0.236, 0.382, 0.5, 0.618, 0.786, 1.0};
}

std::vector<Rgba> defaultFibLevelColors() {
  static const char* hex[] = {"#FF6B6B", "#4ECDC4", "#45B7D1", "#96CEB4",
                              "#FFEAA7", "#DDA0DD", "#FF6B6B"};
  std::vector<Rgba> out;
  for (const char* h : hex) {
    Rgba c;
    parseColor(h, c);
    out.push_back(c);
  }
  return out;
}

DrawingStyle FibRetracementTool::builtinStyle() {
  DrawingStyle s;
  parseColor("#9B59B6", s.color);
  s.lineWidth = 1.0f;
  s.dash = LineDash::Solid;
  s.fibLevels = defaultFibLevels();
  s.levelColors = defaultFibLevelColors();
  return s;
}

void FibRetracementTool::computeDerived(Drawing& d) const {
  DerivedGeometry g;
  if (d.anchors.size() >= 2) {
    const DrawingStyle& st = styleOf(d);
    const DomainPoint& s = d.start();
    const DomainPoint& e = d.end();
    g.priceDelta = e.price - s.price;
    g.timeDelta = e.time - s.time;
    g.priceRange = std::fabs(g.priceDelta);

    g.levels.reserve(st.fibLevels.size());
    for (std::size_t i = 0; i < st.fibLevels.size(); ++i) {
      FibLevel lvl;
      lvl.ratio = st.fibLevels[i];
      lvl.price = s.price + g.priceDelta * lvl.ratio;
      lvl.color = (i < st.levelColors.size()) ? st.levelColors[i] : st.color;
      g.levels.push_back(lvl);
    }
  }
  d.derived = std::move(g);
}

void FibRetracementTool::render(PaintTarget& target, const Drawing& d,
                                const CoordinateMapper& mapper) const {
  ScreenPoint a, b;
  if (d.anchors.size() < 2 || !resolve(mapper, d.start(), a) ||
      !resolve(mapper, d.end(), b)) {
    target.noteSkipped(d.id);
    return;
  }

  const DrawingStyle& st = styleOf(d);
  target.strokeSegment(d.id, a, b, {st.color, st.lineWidth, LineDash::Dashed});

  double minX = std::min(a.x, b.x) - config_.fibLevelPaddingPx;
  double maxX = std::max(a.x, b.x) + config_.fibLevelPaddingPx;

  // Level lines: resolved ones are drawn, the rest skipped individually.
  std::vector<std::pair<const FibLevel*, double>> drawn;
  for (const auto& lvl : d.derived.levels) {
    double y;
    if (!mapper.priceToScreen(lvl.price, y)) {
      target.noteSkipped(d.id);
      continue;
    }
    target.strokeSegment(d.id, {minX, y}, {maxX, y},
                         {lvl.color, st.lineWidth, LineDash::Solid});
    drawn.emplace_back(&lvl, y);
  }

  if (pointDistance(a, b) <= config_.minDecorationPx) return;

  double r = st.lineWidth + config_.endpointRadiusPad;
  target.fillMarker(d.id, a, r, st.color);
  target.fillMarker(d.id, b, r, st.color);

  if (!st.showLabels) return;
  double labelX = std::max(a.x, b.x) + config_.fibLabelOffsetPx;
  LabelStyle ls = config_.label;
  ls.anchor = LabelAnchor::Left;
  for (const auto& entry : drawn) {
    const FibLevel& lvl = *entry.first;
    double y = entry.second;
    target.fillMarker(d.id, {labelX - 9.0, y}, config_.levelDotRadius, lvl.color);
    target.drawLabel(d.id, {labelX, y},
                     formatFibLabel(lvl.ratio, lvl.price, st.pricePrecision), ls);
  }
}

bool FibRetracementTool::hitTest(const Drawing& d, const ScreenPoint& p, double tolerance,
                                 const CoordinateMapper& mapper, double) const {
  ScreenPoint a, b;
  if (d.anchors.size() < 2 || !resolve(mapper, d.start(), a) ||
      !resolve(mapper, d.end(), b)) {
    return false;
  }
  if (pointToSegmentDistance(p, a, b) <= tolerance) return true;

  double minX = std::min(a.x, b.x) - config_.fibLevelPaddingPx;
  double maxX = std::max(a.x, b.x) + config_.fibLevelPaddingPx;
  if (p.x < minX || p.x > maxX) return false;

  for (const auto& lvl : d.derived.levels) {
    double y;
    if (mapper.priceToScreen(lvl.price, y) && std::fabs(p.y - y) <= tolerance)
      return true;
  }
  return false;
}

} // namespace cs
