#pragma once
#include "cs/tools/Tool.hpp"

#include <vector>

namespace cs {

// Standard retracement ratios and their colors.
std::vector<double> defaultFibLevels();
std::vector<Rgba> defaultFibLevelColors();

// Dashed diagonal between two anchors plus one horizontal line per
// configured ratio at start + (end - start) * ratio.
class FibRetracementTool : public Tool {
public:
  FibRetracementTool() : Tool(builtinStyle()) {}
  explicit FibRetracementTool(const DrawingStyle& style) : Tool(style) {}

  // #9B59B6, width 1, standard levels.
  static DrawingStyle builtinStyle();

  DrawingKind kind() const override { return DrawingKind::FibRetracement; }

  void computeDerived(Drawing& d) const override;
  void render(PaintTarget& target, const Drawing& d,
              const CoordinateMapper& mapper) const override;
  bool hitTest(const Drawing& d, const ScreenPoint& p, double tolerance,
               const CoordinateMapper& mapper, double surfaceWidth) const override;
};

} // namespace cs
