#pragma once
#include "cs/tools/Tool.hpp"

namespace cs {

// Price level spanning the full surface width. Only the price is
// geometric; the anchor time records where it was placed.
class HorizontalLineTool : public Tool {
public:
  HorizontalLineTool() : Tool(builtinStyle()) {}
  explicit HorizontalLineTool(const DrawingStyle& style) : Tool(style) {}

  // #4ECDC4, width 2, solid.
  static DrawingStyle builtinStyle();

  DrawingKind kind() const override { return DrawingKind::HorizontalLine; }

  void updateDrawingData(Drawing& d, const DomainSample& sample) const override;
  void computeDerived(Drawing& d) const override;
  void render(PaintTarget& target, const Drawing& d,
              const CoordinateMapper& mapper) const override;
  bool hitTest(const Drawing& d, const ScreenPoint& p, double tolerance,
               const CoordinateMapper& mapper, double surfaceWidth) const override;
};

} // namespace cs
