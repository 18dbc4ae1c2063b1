#pragma once
#include "cs/drawing/Drawing.hpp"
#include "cs/drawing/DrawingStyle.hpp"

#include <string>

namespace cs {

struct StrokeStyle {
  Rgba color;
  float width{1.0f};
  LineDash dash{LineDash::Solid};
};

enum class LabelAnchor : std::uint8_t {
  Left = 0,     // text starts at the anchor point
  Center,       // text centred above the anchor point
  Right         // text ends at the anchor point
};

struct LabelStyle {
  Rgba background{0.0f, 0.0f, 0.0f, 0.7f};
  Rgba text{1.0f, 1.0f, 1.0f, 1.0f};
  LabelAnchor anchor{LabelAnchor::Left};
};

// Immediate-mode sink that tools paint into, in surface pixels.
// `owner` tags every element with the drawing it belongs to (0 for a preview).
class PaintTarget {
public:
  virtual ~PaintTarget() = default;

  virtual double width() const = 0;
  virtual double height() const = 0;

  virtual void strokeSegment(DrawingId owner, const ScreenPoint& a,
                             const ScreenPoint& b, const StrokeStyle& style) = 0;
  virtual void fillMarker(DrawingId owner, const ScreenPoint& center,
                          double radius, const Rgba& color) = 0;
  virtual void drawLabel(DrawingId owner, const ScreenPoint& at,
                         const std::string& text, const LabelStyle& style) = 0;

  // An element was not drawn because a coordinate did not resolve.
  virtual void noteSkipped(DrawingId owner) = 0;
};

} // namespace cs
