#pragma once
#include "cs/drawing/Drawing.hpp"
#include "cs/drawing/DrawingStyle.hpp"
#include "cs/drawing/StyleCodec.hpp"
#include "cs/render/PaintTarget.hpp"
#include "cs/viewport/CoordinateMapper.hpp"

#include <cstdint>
#include <memory>

namespace cs {

struct ToolConfig {
  double minDecorationPx{50};     // decorations need at least this on-screen extent
  double endpointRadiusPad{2};    // endpoint marker radius = lineWidth + pad
  double fibLevelPaddingPx{50};   // level lines overhang the anchor x-span
  double fibLabelOffsetPx{20};    // level labels start right of the span
  double extendPx{1000};          // minimum extension for extended trend lines
  double levelDotRadius{3};
  double horizontalLabelMarginPx{10};
  LabelStyle label;
};

// Stateless policy for one annotation kind. Tools never retain a Drawing
// past the call that received it.
class Tool {
public:
  explicit Tool(const DrawingStyle& defaultStyle);
  virtual ~Tool() = default;

  virtual DrawingKind kind() const = 0;
  const char* name() const { return toString(kind()); }
  std::size_t anchorCount() const { return anchorCountOf(kind()); }

  void setConfig(const ToolConfig& cfg) { config_ = cfg; }
  const ToolConfig& config() const { return config_; }

  // Sanitized before it is stored.
  void setDefaultStyle(const DrawingStyle& style);
  const std::shared_ptr<const DrawingStyle>& defaultStyle() const { return defaultStyle_; }

  // Minimal valid drawing at the gesture start: every anchor at `start`.
  // A null style uses the tool default.
  Drawing createDrawing(const DomainPoint& start,
                        std::shared_ptr<const DrawingStyle> style,
                        std::int64_t createdAt) const;

  // Move the trailing anchor. Unresolved components keep their value.
  virtual void updateDrawingData(Drawing& d, const DomainSample& sample) const;

  void finalizeDrawingData(Drawing& d, const DomainSample& sample) const {
    updateDrawingData(d, sample);
    computeDerived(d);
  }

  virtual void computeDerived(Drawing& d) const = 0;

  virtual void render(PaintTarget& target, const Drawing& d,
                      const CoordinateMapper& mapper) const = 0;

  virtual bool hitTest(const Drawing& d, const ScreenPoint& p, double tolerance,
                       const CoordinateMapper& mapper, double surfaceWidth) const = 0;

  // {"kind", "anchors", "style", "createdAt"}
  void serialize(const Drawing& d, JsonWriter& writer) const;

  // Validates kind, anchor count and finiteness; merges the record's style
  // over the default; recomputes derived. `out.id` is left invalid.
  bool deserialize(const rapidjson::Value& record, Drawing& out) const;

protected:
  double snap(const DrawingStyle& style, double price) const;
  static bool resolve(const CoordinateMapper& mapper, const DomainPoint& p,
                      ScreenPoint& out);
  const DrawingStyle& styleOf(const Drawing& d) const {
    return d.style ? *d.style : *defaultStyle_;
  }

  ToolConfig config_;
  std::shared_ptr<const DrawingStyle> defaultStyle_;
};

} // namespace cs
