#include "cs/drawing/Drawing.hpp"

namespace cs {

const char* toString(DrawingKind kind) {
  switch (kind) {
    case DrawingKind::TrendLine: return "TrendLine";
    case DrawingKind::HorizontalLine: return "HorizontalLine";
    case DrawingKind::FibRetracement: return "FibRetracement";
    default: return "unknown";
  }
}

bool parseDrawingKind(const std::string& name, DrawingKind& out) {
  // Accept the canonical names plus the lower-case toolbar spellings.
  if (name == "TrendLine" || name == "trendline") {
    out = DrawingKind::TrendLine;
    return true;
  }
  if (name == "HorizontalLine" || name == "horizontalline") {
    out = DrawingKind::HorizontalLine;
    return true;
  }
  if (name == "FibRetracement" || name == "fibretracement") {
    out = DrawingKind::FibRetracement;
    return true;
  }
  return false;
}

std::size_t anchorCountOf(DrawingKind kind) {
  switch (kind) {
    case DrawingKind::HorizontalLine: return 1;
    case DrawingKind::TrendLine:
    case DrawingKind::FibRetracement:
    default: return 2;
  }
}

bool DerivedGeometry::operator==(const DerivedGeometry& o) const {
  return priceDelta == o.priceDelta &&
         timeDelta == o.timeDelta &&
         percentChange == o.percentChange &&
         hasPercentChange == o.hasPercentChange &&
         length == o.length &&
         angle == o.angle &&
         slope == o.slope &&
         priceRange == o.priceRange &&
         levels == o.levels;
}

} // namespace cs
