#pragma once
#include "cs/drawing/Drawing.hpp"
#include "cs/tools/ToolRegistry.hpp"

#include <string>
#include <vector>

namespace cs {

struct ImportReport {
  bool parsed{false};       // false if the document itself was not valid JSON
  std::size_t imported{0};
  std::size_t skipped{0};
};

// JSON array of {kind, anchors, style, createdAt} in the given order.
// Ids, screen positions and derived values are not written. Drawings
// whose kind has no registered tool are left out.
std::string drawingsToJSON(const std::vector<Drawing>& drawings,
                           const ToolRegistry& registry);

// Accepts an array of records or an object with a "drawings" array.
// Every valid record is appended to `out` (ids unassigned, derived
// recomputed); malformed records are skipped with a warning.
ImportReport drawingsFromJSON(const std::string& json, const ToolRegistry& registry,
                              std::vector<Drawing>& out);

} // namespace cs
