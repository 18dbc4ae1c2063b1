#pragma once
#include <string>

namespace cs {

// Visible domain window for serialization.
struct ViewportState {
  double xMin{0}, xMax{100}, yMin{0}, yMax{100};
};

// Saved session: where the user was looking and what they drew.
struct ChartState {
  std::string version{"1.0"};
  ViewportState viewport;
  std::string drawingsJSON;  // DrawingManager::exportAll() output
};

// Serialize ChartState to a JSON string. The drawings array is embedded
// as JSON, not as a string.
std::string serializeChartState(const ChartState& state);

// Returns false on malformed input (out may be partially filled).
bool deserializeChartState(const std::string& json, ChartState& out);

} // namespace cs
