#pragma once
#include "cs/interaction/DrawingManager.hpp"
#include "cs/render/CanvasOverlayBridge.hpp"
#include "cs/tools/ToolRegistry.hpp"
#include "cs/viewport/CoordinateMapper.hpp"
#include "cs/viewport/InputState.hpp"

#include <string>

namespace cs {

struct EngineConfig {
  DrawingManagerConfig manager;
  ToolConfig tools;
  MapperConfig mapper;
  NavigationConfig navigation;
  CanvasOverlayConfig canvas;

  // Per-kind default styles.
  DrawingStyle trendLineStyle;
  DrawingStyle horizontalLineStyle;
  DrawingStyle fibRetracementStyle;

  EngineConfig();

  const DrawingStyle& styleFor(DrawingKind kind) const;
};

// Read overrides from JSON:
//   {"manager": {...}, "tools": {...}, "mapper": {...}, "navigation": {...},
//    "canvas": {...}, "styles": {"TrendLine": {...}, ...}}
// Unknown keys are ignored and invalid values keep their current value.
// Returns false (config untouched) if the document does not parse.
bool loadEngineConfigJSON(const std::string& json, EngineConfig& config);

// Push tool config and default styles into every registered tool.
void applyEngineConfig(const EngineConfig& config, ToolRegistry& registry);

} // namespace cs
