#include "cs/session/ChartState.hpp"
#include "cs/drawing/StyleCodec.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>

namespace cs {

namespace {

struct ViewportField {
  const char* key;
  double ViewportState::*member;
};

const ViewportField kViewportFields[] = {
  {"xMin", &ViewportState::xMin},
  {"xMax", &ViewportState::xMax},
  {"yMin", &ViewportState::yMin},
  {"yMax", &ViewportState::yMax},
};

} // namespace

std::string serializeChartState(const ChartState& state) {
  rapidjson::StringBuffer sb;
  JsonWriter writer(sb);

  writer.StartObject();
  writer.Key("version");
  writer.String(state.version.c_str());

  writer.Key("viewport");
  writer.StartObject();
  for (const auto& f : kViewportFields) {
    writer.Key(f.key);
    writer.Double(state.viewport.*f.member);
  }
  writer.EndObject();

  // Embedded as a nested array; anything that is not an array becomes [].
  writer.Key("drawings");
  rapidjson::Document drawings;
  if (!state.drawingsJSON.empty()) drawings.Parse(state.drawingsJSON.c_str());
  if (!drawings.HasParseError() && drawings.IsArray()) {
    drawings.Accept(writer);
  } else {
    writer.StartArray();
    writer.EndArray();
  }

  writer.EndObject();
  return sb.GetString();
}

bool deserializeChartState(const std::string& json, ChartState& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  if (doc.HasMember("version") && doc["version"].IsString())
    out.version = doc["version"].GetString();

  if (doc.HasMember("viewport")) {
    const rapidjson::Value& vp = doc["viewport"];
    if (!vp.IsObject()) return false;
    for (const auto& f : kViewportFields) {
      if (!vp.HasMember(f.key)) continue;
      const rapidjson::Value& v = vp[f.key];
      if (!v.IsNumber() || !std::isfinite(v.GetDouble())) return false;
      out.viewport.*f.member = v.GetDouble();
    }
  }

  if (doc.HasMember("drawings")) {
    const rapidjson::Value& drawings = doc["drawings"];
    if (!drawings.IsArray()) return false;
    rapidjson::StringBuffer sb;
    JsonWriter writer(sb);
    drawings.Accept(writer);
    out.drawingsJSON = sb.GetString();
  }

  return true;
}

} // namespace cs
