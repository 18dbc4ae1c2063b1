#pragma once
#include "cs/tools/Tool.hpp"

namespace cs {

// Two-anchor line with optional extension past either end, endpoint
// markers and a "+delta (+pct%)" label at its midpoint.
class TrendLineTool : public Tool {
public:
  TrendLineTool() : Tool(builtinStyle()) {}
  explicit TrendLineTool(const DrawingStyle& style) : Tool(style) {}

  // #FF6B6B, width 2, solid.
  static DrawingStyle builtinStyle();

  DrawingKind kind() const override { return DrawingKind::TrendLine; }

  void computeDerived(Drawing& d) const override;
  void render(PaintTarget& target, const Drawing& d,
              const CoordinateMapper& mapper) const override;
  bool hitTest(const Drawing& d, const ScreenPoint& p, double tolerance,
               const CoordinateMapper& mapper, double surfaceWidth) const override;

private:
  // Resolved anchors. False if either is unresolved.
  bool screenSegment(const Drawing& d, const CoordinateMapper& mapper,
                     ScreenPoint& a, ScreenPoint& b) const;
  void applyExtension(const Drawing& d, double surfaceExtent,
                      ScreenPoint& a, ScreenPoint& b) const;
};

} // namespace cs
