#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace cs {

struct Rgba {
  float r{1.0f}, g{1.0f}, b{1.0f}, a{1.0f};

  bool operator==(const Rgba& o) const {
    return r == o.r && g == o.g && b == o.b && a == o.a;
  }
  bool operator!=(const Rgba& o) const { return !(*this == o); }
};

enum class LineDash : std::uint8_t {
  Solid = 0,
  Dashed,
  Dotted
};

const char* toString(LineDash dash);
bool parseLineDash(const std::string& text, LineDash& out);

// Per-drawing presentation. Built once when the drawing is created and
// shared read-only from then on (Drawing holds shared_ptr<const DrawingStyle>).
struct DrawingStyle {
  Rgba color{1.0f, 107.0f / 255.0f, 107.0f / 255.0f, 1.0f};  // #ff6b6b
  float lineWidth{2.0f};
  LineDash dash{LineDash::Solid};
  bool showLabels{true};
  bool snapToPrice{true};
  int pricePrecision{2};

  // Trend lines only
  bool extendLeft{false};
  bool extendRight{false};

  // Fibonacci only: ratios and a parallel color table. A ratio without a
  // color entry falls back to `color`.
  std::vector<double> fibLevels;
  std::vector<Rgba> levelColors;

  bool operator==(const DrawingStyle& o) const;
  bool operator!=(const DrawingStyle& o) const { return !(*this == o); }
};

// Style limits enforced by sanitizeStyle().
inline constexpr float kMinLineWidth = 0.5f;
inline constexpr float kMaxLineWidth = 10.0f;
inline constexpr int kMaxPricePrecision = 8;
inline constexpr std::size_t kMaxFibLevels = 16;
inline constexpr double kMaxFibRatio = 5.0;

// Parse a color from a closed grammar: #rgb, #rrggbb, #rrggbbaa,
// rgb(r,g,b), rgba(r,g,b,a) and a short list of named colors.
// Returns false (leaving `out` untouched) for anything else.
bool parseColor(const std::string& text, Rgba& out);

// "#rrggbb" when opaque, "#rrggbbaa" otherwise.
std::string formatColor(const Rgba& c);

// Clamp every field into its legal range. Non-finite or out-of-range
// Fibonacci ratios are dropped together with their color entry.
DrawingStyle sanitizeStyle(const DrawingStyle& in);

} // namespace cs
