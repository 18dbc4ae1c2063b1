#include "cs/tools/Tool.hpp"
#include "cs/math/PriceFormat.hpp"

#include <cmath>

namespace cs {

Tool::Tool(const DrawingStyle& defaultStyle)
  : defaultStyle_(std::make_shared<const DrawingStyle>(sanitizeStyle(defaultStyle))) {
}

void Tool::setDefaultStyle(const DrawingStyle& style) {
  defaultStyle_ = std::make_shared<const DrawingStyle>(sanitizeStyle(style));
}

Drawing Tool::createDrawing(const DomainPoint& start,
                            std::shared_ptr<const DrawingStyle> style,
                            std::int64_t createdAt) const {
  Drawing d;
  d.kind = kind();
  d.style = style ? std::move(style) : defaultStyle_;
  d.createdAt = createdAt;

  DomainPoint p = start;
  p.price = snap(*d.style, p.price);
  d.anchors.assign(anchorCount(), p);
  return d;
}

void Tool::updateDrawingData(Drawing& d, const DomainSample& sample) const {
  if (d.anchors.empty()) return;
  DomainPoint& trailing = d.anchors.back();
  if (sample.hasTime && std::isfinite(sample.point.time))
    trailing.time = sample.point.time;
  if (sample.hasPrice && std::isfinite(sample.point.price))
    trailing.price = snap(styleOf(d), sample.point.price);
}

double Tool::snap(const DrawingStyle& style, double price) const {
  if (!style.snapToPrice) return price;
  return roundToPrecision(price, style.pricePrecision);
}

bool Tool::resolve(const CoordinateMapper& mapper, const DomainPoint& p,
                   ScreenPoint& out) {
  double x, y;
  if (!mapper.timeToScreen(p.time, x)) return false;
  if (!mapper.priceToScreen(p.price, y)) return false;
  out = {x, y};
  return true;
}

void Tool::serialize(const Drawing& d, JsonWriter& writer) const {
  writer.StartObject();
  writer.Key("kind");
  writer.String(name());

  writer.Key("anchors");
  writer.StartArray();
  for (const auto& a : d.anchors) {
    writer.StartObject();
    writer.Key("time");  writer.Double(a.time);
    writer.Key("price"); writer.Double(a.price);
    writer.EndObject();
  }
  writer.EndArray();

  writer.Key("style");
  writeStyle(writer, styleOf(d));

  writer.Key("createdAt");
  writer.Int64(d.createdAt);
  writer.EndObject();
}

bool Tool::deserialize(const rapidjson::Value& record, Drawing& out) const {
  if (!record.IsObject()) return false;
  if (!record.HasMember("kind") || !record["kind"].IsString()) return false;

  DrawingKind k;
  if (!parseDrawingKind(record["kind"].GetString(), k) || k != kind()) return false;

  if (!record.HasMember("anchors") || !record["anchors"].IsArray()) return false;
  const auto& arr = record["anchors"];
  if (arr.Size() < anchorCount()) return false;

  Drawing d;
  d.kind = kind();
  for (rapidjson::SizeType i = 0; i < anchorCount(); i++) {
    const auto& a = arr[i];
    if (!a.IsObject()) return false;
    if (!a.HasMember("time") || !a["time"].IsNumber()) return false;
    if (!a.HasMember("price") || !a["price"].IsNumber()) return false;
    double t = a["time"].GetDouble();
    double p = a["price"].GetDouble();
    if (!std::isfinite(t) || !std::isfinite(p)) return false;
    d.anchors.push_back({t, p});
  }

  if (record.HasMember("style") && record["style"].IsObject()) {
    d.style = std::make_shared<const DrawingStyle>(
        readStyle(record["style"], *defaultStyle_));
  } else {
    d.style = defaultStyle_;
  }

  if (record.HasMember("createdAt") && record["createdAt"].IsInt64())
    d.createdAt = record["createdAt"].GetInt64();
  else if (record.HasMember("createdAt") && record["createdAt"].IsNumber() &&
           std::isfinite(record["createdAt"].GetDouble()) &&
           std::fabs(record["createdAt"].GetDouble()) < 9.0e18)
    d.createdAt = static_cast<std::int64_t>(record["createdAt"].GetDouble());

  computeDerived(d);
  out = std::move(d);
  return true;
}

} // namespace cs
