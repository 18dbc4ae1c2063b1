#include "cs/config/EngineConfig.hpp"
#include "cs/drawing/StyleCodec.hpp"
#include "cs/tools/FibRetracementTool.hpp"
#include "cs/tools/HorizontalLineTool.hpp"
#include "cs/tools/TrendLineTool.hpp"

#include <rapidjson/document.h>

#include <cmath>
#include <cstdio>

namespace cs {

EngineConfig::EngineConfig()
  : trendLineStyle(TrendLineTool::builtinStyle()),
    horizontalLineStyle(HorizontalLineTool::builtinStyle()),
    fibRetracementStyle(FibRetracementTool::builtinStyle()) {}

const DrawingStyle& EngineConfig::styleFor(DrawingKind kind) const {
  switch (kind) {
    case DrawingKind::HorizontalLine: return horizontalLineStyle;
    case DrawingKind::FibRetracement: return fibRetracementStyle;
    case DrawingKind::TrendLine:
    default: return trendLineStyle;
  }
}

namespace {

// Non-negative finite number.
void readDouble(const rapidjson::Value& obj, const char* key, double& out) {
  if (!obj.HasMember(key) || !obj[key].IsNumber()) return;
  double v = obj[key].GetDouble();
  if (std::isfinite(v) && v >= 0.0) out = v;
}

void readSize(const rapidjson::Value& obj, const char* key, std::size_t& out) {
  if (!obj.HasMember(key) || !obj[key].IsUint64()) return;
  out = static_cast<std::size_t>(obj[key].GetUint64());
}

void readInt(const rapidjson::Value& obj, const char* key, int& out) {
  if (!obj.HasMember(key) || !obj[key].IsInt()) return;
  if (obj[key].GetInt() >= 1) out = obj[key].GetInt();
}

} // namespace

bool loadEngineConfigJSON(const std::string& json, EngineConfig& config) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    std::fprintf(stderr, "loadEngineConfigJSON: not a JSON object\n");
    return false;
  }

  EngineConfig cfg = config;

  if (doc.HasMember("manager") && doc["manager"].IsObject()) {
    const auto& m = doc["manager"];
    readDouble(m, "hitTolerancePx", cfg.manager.hitTolerancePx);
    readSize(m, "maxDrawings", cfg.manager.maxDrawings);
    readSize(m, "historyDepth", cfg.manager.historyDepth);
  }

  if (doc.HasMember("tools") && doc["tools"].IsObject()) {
    const auto& t = doc["tools"];
    readDouble(t, "minDecorationPx", cfg.tools.minDecorationPx);
    readDouble(t, "endpointRadiusPad", cfg.tools.endpointRadiusPad);
    readDouble(t, "fibLevelPaddingPx", cfg.tools.fibLevelPaddingPx);
    readDouble(t, "fibLabelOffsetPx", cfg.tools.fibLabelOffsetPx);
    readDouble(t, "extendPx", cfg.tools.extendPx);
    readDouble(t, "levelDotRadius", cfg.tools.levelDotRadius);
    readDouble(t, "horizontalLabelMarginPx", cfg.tools.horizontalLabelMarginPx);

    Rgba c;
    if (t.HasMember("labelBackground") && t["labelBackground"].IsString() &&
        parseColor(t["labelBackground"].GetString(), c))
      cfg.tools.label.background = c;
    if (t.HasMember("labelText") && t["labelText"].IsString() &&
        parseColor(t["labelText"].GetString(), c))
      cfg.tools.label.text = c;
  }

  if (doc.HasMember("mapper") && doc["mapper"].IsObject())
    readDouble(doc["mapper"], "offscreenMarginPx", cfg.mapper.offscreenMarginPx);

  if (doc.HasMember("navigation") && doc["navigation"].IsObject())
    readDouble(doc["navigation"], "zoomSensitivity", cfg.navigation.zoomSensitivity);

  if (doc.HasMember("canvas") && doc["canvas"].IsObject())
    readInt(doc["canvas"], "minFramesBetweenPaints", cfg.canvas.minFramesBetweenPaints);

  if (doc.HasMember("styles") && doc["styles"].IsObject()) {
    const auto& s = doc["styles"];
    if (s.HasMember("TrendLine"))
      cfg.trendLineStyle = readStyle(s["TrendLine"], cfg.trendLineStyle);
    if (s.HasMember("HorizontalLine"))
      cfg.horizontalLineStyle = readStyle(s["HorizontalLine"], cfg.horizontalLineStyle);
    if (s.HasMember("FibRetracement"))
      cfg.fibRetracementStyle = readStyle(s["FibRetracement"], cfg.fibRetracementStyle);
  }

  config = cfg;
  return true;
}

void applyEngineConfig(const EngineConfig& config, ToolRegistry& registry) {
  registry.setConfig(config.tools);
  for (DrawingKind k : registry.kinds()) {
    Tool* tool = registry.findMutable(k);
    if (tool) tool->setDefaultStyle(config.styleFor(k));
  }
}

} // namespace cs
