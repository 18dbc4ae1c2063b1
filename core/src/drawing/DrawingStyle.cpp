#include "cs/drawing/DrawingStyle.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace cs {

const char* toString(LineDash dash) {
  switch (dash) {
    case LineDash::Solid: return "solid";
    case LineDash::Dashed: return "dashed";
    case LineDash::Dotted: return "dotted";
    default: return "solid";
  }
}

bool parseLineDash(const std::string& text, LineDash& out) {
  if (text == "solid")  { out = LineDash::Solid;  return true; }
  if (text == "dashed") { out = LineDash::Dashed; return true; }
  if (text == "dotted") { out = LineDash::Dotted; return true; }
  return false;
}

bool DrawingStyle::operator==(const DrawingStyle& o) const {
  return color == o.color &&
         lineWidth == o.lineWidth &&
         dash == o.dash &&
         showLabels == o.showLabels &&
         snapToPrice == o.snapToPrice &&
         pricePrecision == o.pricePrecision &&
         extendLeft == o.extendLeft &&
         extendRight == o.extendRight &&
         fibLevels == o.fibLevels &&
         levelColors == o.levelColors;
}

// -------------------- color parsing --------------------

namespace {

struct NamedColor {
  const char* name;
  std::uint8_t r, g, b;
};

const NamedColor kNamedColors[] = {
  {"black", 0, 0, 0},       {"white", 255, 255, 255}, {"gray", 128, 128, 128},
  {"silver", 192, 192, 192}, {"red", 255, 0, 0},      {"maroon", 128, 0, 0},
  {"orange", 255, 165, 0},  {"yellow", 255, 255, 0},  {"olive", 128, 128, 0},
  {"lime", 0, 255, 0},      {"green", 0, 128, 0},     {"cyan", 0, 255, 255},
  {"teal", 0, 128, 128},    {"blue", 0, 0, 255},      {"navy", 0, 0, 128},
  {"purple", 128, 0, 128},  {"magenta", 255, 0, 255}, {"pink", 255, 192, 203},
  {"brown", 165, 42, 42},   {"gold", 255, 215, 0},
};

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parseHex(const std::string& s, Rgba& out) {
  // s excludes the leading '#'
  std::size_t n = s.size();
  if (n != 3 && n != 6 && n != 8) return false;
  for (char c : s) {
    if (hexValue(c) < 0) return false;
  }

  auto byteAt = [&](std::size_t i) {
    return static_cast<float>(hexValue(s[i]) * 16 + hexValue(s[i + 1])) / 255.0f;
  };

  if (n == 3) {
    out.r = static_cast<float>(hexValue(s[0]) * 17) / 255.0f;
    out.g = static_cast<float>(hexValue(s[1]) * 17) / 255.0f;
    out.b = static_cast<float>(hexValue(s[2]) * 17) / 255.0f;
    out.a = 1.0f;
    return true;
  }
  out.r = byteAt(0);
  out.g = byteAt(2);
  out.b = byteAt(4);
  out.a = (n == 8) ? byteAt(6) : 1.0f;
  return true;
}

// rgb(r,g,b) / rgba(r,g,b,a): components 0..255, alpha 0..1.
bool parseFunctional(const std::string& s, Rgba& out) {
  bool hasAlpha = s.compare(0, 5, "rgba(") == 0;
  std::size_t open = hasAlpha ? 5 : 4;
  if (!hasAlpha && s.compare(0, 4, "rgb(") != 0) return false;
  if (s.back() != ')') return false;

  std::string body = s.substr(open, s.size() - open - 1);
  double vals[4] = {0, 0, 0, 1};
  std::size_t expected = hasAlpha ? 4 : 3;
  std::size_t count = 0;
  const char* p = body.c_str();

  while (*p && count < expected) {
    while (std::isspace(static_cast<unsigned char>(*p))) ++p;
    char* endp = nullptr;
    double v = std::strtod(p, &endp);
    if (endp == p || !std::isfinite(v)) return false;
    vals[count++] = v;
    p = endp;
    while (std::isspace(static_cast<unsigned char>(*p))) ++p;
    if (*p == ',') ++p;
    else if (*p != '\0') return false;
  }
  if (count != expected || *p != '\0') return false;

  for (std::size_t i = 0; i < 3; ++i) {
    if (vals[i] < 0.0 || vals[i] > 255.0) return false;
  }
  if (vals[3] < 0.0 || vals[3] > 1.0) return false;

  out.r = static_cast<float>(vals[0] / 255.0);
  out.g = static_cast<float>(vals[1] / 255.0);
  out.b = static_cast<float>(vals[2] / 255.0);
  out.a = static_cast<float>(vals[3]);
  return true;
}

float clampUnit(float v) {
  if (!std::isfinite(v)) return 1.0f;
  return std::min(1.0f, std::max(0.0f, v));
}

// Snap a channel to the 8-bit grid formatColor() writes, so a stored
// color and its text form parse back to the same value.
float quantizeUnit(float v) {
  return std::round(clampUnit(v) * 255.0f) / 255.0f;
}

Rgba quantize(const Rgba& c) {
  return {quantizeUnit(c.r), quantizeUnit(c.g), quantizeUnit(c.b), quantizeUnit(c.a)};
}

} // namespace

bool parseColor(const std::string& text, Rgba& out) {
  // Trim + lower-case; anything longer than a color literal is rejected.
  if (text.empty() || text.size() > 64) return false;
  std::string s;
  s.reserve(text.size());
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) && s.empty()) continue;
    s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
  if (s.empty()) return false;

  Rgba parsed;
  bool ok = false;
  if (s[0] == '#') {
    ok = parseHex(s.substr(1), parsed);
  } else if (s.compare(0, 3, "rgb") == 0) {
    ok = parseFunctional(s, parsed);
  } else {
    for (const auto& nc : kNamedColors) {
      if (s == nc.name) {
        parsed = {nc.r / 255.0f, nc.g / 255.0f, nc.b / 255.0f, 1.0f};
        ok = true;
        break;
      }
    }
  }
  if (ok) out = quantize(parsed);
  return ok;
}

std::string formatColor(const Rgba& c) {
  auto toByte = [](float v) {
    return static_cast<unsigned>(std::lround(clampUnit(v) * 255.0f));
  };
  char buf[16];
  if (toByte(c.a) == 255u) {
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x",
                  toByte(c.r), toByte(c.g), toByte(c.b));
  } else {
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x",
                  toByte(c.r), toByte(c.g), toByte(c.b), toByte(c.a));
  }
  return buf;
}

DrawingStyle sanitizeStyle(const DrawingStyle& in) {
  DrawingStyle s = in;

  s.color = quantize(in.color);

  if (!std::isfinite(s.lineWidth)) s.lineWidth = 2.0f;
  s.lineWidth = std::min(kMaxLineWidth, std::max(kMinLineWidth, s.lineWidth));

  s.pricePrecision = std::min(kMaxPricePrecision, std::max(0, s.pricePrecision));

  s.fibLevels.clear();
  s.levelColors.clear();
  for (std::size_t i = 0; i < in.fibLevels.size(); ++i) {
    double ratio = in.fibLevels[i];
    if (!std::isfinite(ratio) || std::fabs(ratio) > kMaxFibRatio) continue;
    if (s.fibLevels.size() >= kMaxFibLevels) break;
    s.fibLevels.push_back(ratio);
    if (i < in.levelColors.size())
      s.levelColors.push_back(quantize(in.levelColors[i]));
  }

  return s;
}

} // namespace cs
