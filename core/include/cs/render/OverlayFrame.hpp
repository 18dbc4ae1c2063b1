#pragma once
#include "cs/render/PaintTarget.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cs {

struct SegmentCmd {
  DrawingId owner{kInvalidDrawingId};
  ScreenPoint a, b;
  StrokeStyle style;
};

struct MarkerCmd {
  DrawingId owner{kInvalidDrawingId};
  ScreenPoint center;
  double radius{0};
  Rgba color;
};

struct LabelCmd {
  DrawingId owner{kInvalidDrawingId};
  ScreenPoint at;
  std::string text;
  LabelStyle style;
};

// Recording paint target. The resolved screen geometry of one paint pass.
class OverlayFrame : public PaintTarget {
public:
  OverlayFrame() = default;
  OverlayFrame(double w, double h) : width_(w), height_(h) {}

  void setSize(double w, double h) { width_ = w; height_ = h; }
  void clear();

  double width() const override { return width_; }
  double height() const override { return height_; }

  void strokeSegment(DrawingId owner, const ScreenPoint& a,
                     const ScreenPoint& b, const StrokeStyle& style) override;
  void fillMarker(DrawingId owner, const ScreenPoint& center,
                  double radius, const Rgba& color) override;
  void drawLabel(DrawingId owner, const ScreenPoint& at,
                 const std::string& text, const LabelStyle& style) override;
  void noteSkipped(DrawingId owner) override;

  const std::vector<SegmentCmd>& segments() const { return segments_; }
  const std::vector<MarkerCmd>& markers() const { return markers_; }
  const std::vector<LabelCmd>& labels() const { return labels_; }
  std::uint32_t skipped() const { return skipped_; }

  std::size_t segmentsOf(DrawingId owner) const;
  std::size_t labelsOf(DrawingId owner) const;

  // Same geometry, styles and text in the same order (size excluded).
  bool sameContent(const OverlayFrame& o) const;

private:
  double width_{0}, height_{0};
  std::vector<SegmentCmd> segments_;
  std::vector<MarkerCmd> markers_;
  std::vector<LabelCmd> labels_;
  std::uint32_t skipped_{0};
};

} // namespace cs
