#pragma once
#include "cs/drawing/Drawing.hpp"
#include "cs/drawing/DrawingStyle.hpp"

#include <vector>

namespace cs {

// On/off lengths in pixels, scaled by line width for widths above 1.
struct DashLengths {
  double on{0};
  double off{0};
};

// Solid -> {0, 0}; Dashed -> {8, 4}; Dotted -> {2, 3}.
DashLengths dashLengthsOf(LineDash dash, float lineWidth);

struct ScreenSegment {
  ScreenPoint a, b;
};

// Split a→b into the visible pieces of the dash pattern.
// A solid dash returns the input segment unchanged.
std::vector<ScreenSegment> splitDashed(const ScreenPoint& a, const ScreenPoint& b,
                                       LineDash dash, float lineWidth);

} // namespace cs
