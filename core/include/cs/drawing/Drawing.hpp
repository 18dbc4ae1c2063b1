#pragma once
#include "cs/drawing/DrawingStyle.hpp"
#include "cs/ids/Id.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cs {

// User-created annotations in domain space (time, price).
enum class DrawingKind : std::uint8_t {
  TrendLine = 1,       // two anchors
  HorizontalLine = 2,  // one anchor, only the price is geometric
  FibRetracement = 3   // two anchors spanning the retracement range
};

const char* toString(DrawingKind kind);
bool parseDrawingKind(const std::string& name, DrawingKind& out);
std::size_t anchorCountOf(DrawingKind kind);

struct DomainPoint {
  double time{0};
  double price{0};

  bool operator==(const DomainPoint& o) const {
    return time == o.time && price == o.price;
  }
  bool operator!=(const DomainPoint& o) const { return !(*this == o); }
};

// Pointer position converted to domain space. Either component may be
// unresolved while the pointer is outside the mappable area.
struct DomainSample {
  DomainPoint point;
  bool hasTime{false};
  bool hasPrice{false};

  bool complete() const { return hasTime && hasPrice; }

  static DomainSample of(const DomainPoint& p) { return {p, true, true}; }
};

struct ScreenPoint {
  double x{0};
  double y{0};
};

struct FibLevel {
  double ratio{0};
  double price{0};
  Rgba color;

  bool operator==(const FibLevel& o) const {
    return ratio == o.ratio && price == o.price && color == o.color;
  }
};

// Values computed from anchors + style. Never persisted.
struct DerivedGeometry {
  double priceDelta{0};
  double timeDelta{0};
  double percentChange{0};
  bool hasPercentChange{false};  // false when the start price is zero
  double length{0};              // domain-space length
  double angle{0};               // atan2(priceDelta, timeDelta)
  double slope{0};               // price per time unit, 0 for vertical
  double priceRange{0};          // |priceDelta|
  std::vector<FibLevel> levels;

  bool operator==(const DerivedGeometry& o) const;
  bool operator!=(const DerivedGeometry& o) const { return !(*this == o); }
};

struct Drawing {
  DrawingId id{kInvalidDrawingId};  // assigned at commit
  DrawingKind kind{DrawingKind::TrendLine};
  std::vector<DomainPoint> anchors;
  std::shared_ptr<const DrawingStyle> style;
  DerivedGeometry derived;
  std::int64_t createdAt{0};  // ms since epoch

  const DomainPoint& start() const { return anchors.front(); }
  const DomainPoint& end() const { return anchors.back(); }
};

} // namespace cs
