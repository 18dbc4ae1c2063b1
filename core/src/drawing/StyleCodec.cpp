#include "cs/drawing/StyleCodec.hpp"
#include <cmath>

namespace cs {

void writeStyle(JsonWriter& writer, const DrawingStyle& style) {
  writer.StartObject();
  writer.Key("color");       writer.String(formatColor(style.color).c_str());
  writer.Key("lineWidth");   writer.Double(style.lineWidth);
  writer.Key("dash");        writer.String(toString(style.dash));
  writer.Key("showLabels");  writer.Bool(style.showLabels);
  writer.Key("snapToPrice"); writer.Bool(style.snapToPrice);
  writer.Key("precision");   writer.Int(style.pricePrecision);
  writer.Key("extendLeft");  writer.Bool(style.extendLeft);
  writer.Key("extendRight"); writer.Bool(style.extendRight);

  if (!style.fibLevels.empty()) {
    writer.Key("levels");
    writer.StartArray();
    for (double r : style.fibLevels) writer.Double(r);
    writer.EndArray();

    writer.Key("levelColors");
    writer.StartArray();
    for (const auto& c : style.levelColors) writer.String(formatColor(c).c_str());
    writer.EndArray();
  }
  writer.EndObject();
}

DrawingStyle readStyle(const rapidjson::Value& obj, const DrawingStyle& base) {
  DrawingStyle s = base;
  if (!obj.IsObject()) return sanitizeStyle(s);

  if (obj.HasMember("color") && obj["color"].IsString()) {
    Rgba c;
    if (parseColor(obj["color"].GetString(), c)) s.color = c;
  }
  if (obj.HasMember("lineWidth") && obj["lineWidth"].IsNumber()) {
    double w = obj["lineWidth"].GetDouble();
    if (std::isfinite(w)) s.lineWidth = static_cast<float>(w);
  }
  if (obj.HasMember("dash") && obj["dash"].IsString()) {
    LineDash d;
    if (parseLineDash(obj["dash"].GetString(), d)) s.dash = d;
  }
  if (obj.HasMember("showLabels") && obj["showLabels"].IsBool())
    s.showLabels = obj["showLabels"].GetBool();
  if (obj.HasMember("snapToPrice") && obj["snapToPrice"].IsBool())
    s.snapToPrice = obj["snapToPrice"].GetBool();
  if (obj.HasMember("precision") && obj["precision"].IsInt())
    s.pricePrecision = obj["precision"].GetInt();
  if (obj.HasMember("extendLeft") && obj["extendLeft"].IsBool())
    s.extendLeft = obj["extendLeft"].GetBool();
  if (obj.HasMember("extendRight") && obj["extendRight"].IsBool())
    s.extendRight = obj["extendRight"].GetBool();

  // Levels and colors are replaced as a pair so they stay parallel.
  if (obj.HasMember("levels") && obj["levels"].IsArray()) {
    const auto& arr = obj["levels"];
    std::vector<double> levels;
    std::vector<Rgba> colors;
    const rapidjson::Value* colorArr = nullptr;
    if (obj.HasMember("levelColors") && obj["levelColors"].IsArray())
      colorArr = &obj["levelColors"];

    // Colors are a prefix of the levels: the first missing or unreadable
    // entry ends the table and later levels use the base color.
    bool colorsOpen = colorArr != nullptr;
    for (rapidjson::SizeType i = 0; i < arr.Size(); i++) {
      if (!arr[i].IsNumber()) continue;
      levels.push_back(arr[i].GetDouble());
      if (!colorsOpen) continue;
      Rgba parsed;
      if (i < colorArr->Size() && (*colorArr)[i].IsString() &&
          parseColor((*colorArr)[i].GetString(), parsed)) {
        colors.push_back(parsed);
      } else {
        colorsOpen = false;
      }
    }
    s.fibLevels = std::move(levels);
    s.levelColors = std::move(colors);
  }

  return sanitizeStyle(s);
}

} // namespace cs
