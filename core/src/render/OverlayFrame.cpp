#include "cs/render/OverlayFrame.hpp"

namespace cs {

namespace {

bool samePoint(const ScreenPoint& a, const ScreenPoint& b) {
  return a.x == b.x && a.y == b.y;
}

bool sameStroke(const StrokeStyle& a, const StrokeStyle& b) {
  return a.color == b.color && a.width == b.width && a.dash == b.dash;
}

bool sameLabelStyle(const LabelStyle& a, const LabelStyle& b) {
  return a.background == b.background && a.text == b.text && a.anchor == b.anchor;
}

} // namespace

void OverlayFrame::clear() {
  segments_.clear();
  markers_.clear();
  labels_.clear();
  skipped_ = 0;
}

void OverlayFrame::strokeSegment(DrawingId owner, const ScreenPoint& a,
                                 const ScreenPoint& b, const StrokeStyle& style) {
  segments_.push_back({owner, a, b, style});
}

void OverlayFrame::fillMarker(DrawingId owner, const ScreenPoint& center,
                              double radius, const Rgba& color) {
  markers_.push_back({owner, center, radius, color});
}

void OverlayFrame::drawLabel(DrawingId owner, const ScreenPoint& at,
                             const std::string& text, const LabelStyle& style) {
  labels_.push_back({owner, at, text, style});
}

void OverlayFrame::noteSkipped(DrawingId) {
  ++skipped_;
}

std::size_t OverlayFrame::segmentsOf(DrawingId owner) const {
  std::size_t n = 0;
  for (const auto& s : segments_) {
    if (s.owner == owner) ++n;
  }
  return n;
}

std::size_t OverlayFrame::labelsOf(DrawingId owner) const {
  std::size_t n = 0;
  for (const auto& l : labels_) {
    if (l.owner == owner) ++n;
  }
  return n;
}

bool OverlayFrame::sameContent(const OverlayFrame& o) const {
  if (segments_.size() != o.segments_.size() ||
      markers_.size() != o.markers_.size() ||
      labels_.size() != o.labels_.size() ||
      skipped_ != o.skipped_) {
    return false;
  }
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    const auto& x = segments_[i];
    const auto& y = o.segments_[i];
    if (x.owner != y.owner || !samePoint(x.a, y.a) || !samePoint(x.b, y.b) ||
        !sameStroke(x.style, y.style)) {
      return false;
    }
  }
  for (std::size_t i = 0; i < markers_.size(); ++i) {
    const auto& x = markers_[i];
    const auto& y = o.markers_[i];
    if (x.owner != y.owner || !samePoint(x.center, y.center) ||
        x.radius != y.radius || x.color != y.color) {
      return false;
    }
  }
  for (std::size_t i = 0; i < labels_.size(); ++i) {
    const auto& x = labels_[i];
    const auto& y = o.labels_[i];
    if (x.owner != y.owner || !samePoint(x.at, y.at) || x.text != y.text ||
        !sameLabelStyle(x.style, y.style)) {
      return false;
    }
  }
  return true;
}

} // namespace cs
