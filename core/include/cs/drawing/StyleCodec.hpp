#pragma once
#include "cs/drawing/DrawingStyle.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace cs {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

// Write `style` as a JSON object:
// {color, lineWidth, dash, showLabels, snapToPrice, precision,
//  extendLeft, extendRight, levels, levelColors}
void writeStyle(JsonWriter& writer, const DrawingStyle& style);

// Overlay the members present in `obj` onto `base` and sanitize.
// Members with the wrong type or an unparseable value keep the base value.
DrawingStyle readStyle(const rapidjson::Value& obj, const DrawingStyle& base);

} // namespace cs
