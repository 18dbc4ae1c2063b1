#pragma once
#include <cmath>
#include <cstdio>
#include <string>

namespace cs {

// Round to `decimals` places (0..8).
inline double roundToPrecision(double value, int decimals) {
  if (!std::isfinite(value)) return value;
  double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

// Fixed-point price text: formatPrice(161.8, 2) -> "161.80".
inline std::string formatPrice(double value, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
  return buf;
}

// Explicit sign for non-negative values: "+12.34", "-0.50".
inline std::string formatSigned(double value, int decimals) {
  std::string s = formatPrice(value, decimals);
  if (value >= 0.0 && s[0] != '-') s.insert(s.begin(), '+');
  return s;
}

// Trend-line value label: "+12.34 (+5.67%)".
inline std::string formatChangeLabel(double priceDelta, double percentChange,
                                     int decimals) {
  return formatSigned(priceDelta, decimals) + " (" +
         formatSigned(percentChange, 2) + "%)";
}

// Fibonacci level label: "61.8% - 161.80".
inline std::string formatFibLabel(double ratio, double price, int decimals) {
  char pct[32];
  std::snprintf(pct, sizeof(pct), "%.1f%%", ratio * 100.0);
  return std::string(pct) + " - " + formatPrice(price, decimals);
}

} // namespace cs
