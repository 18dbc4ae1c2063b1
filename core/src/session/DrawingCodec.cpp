#include "cs/session/DrawingCodec.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdio>

namespace cs {

std::string drawingsToJSON(const std::vector<Drawing>& drawings,
                           const ToolRegistry& registry) {
  rapidjson::StringBuffer sb;
  JsonWriter writer(sb);

  writer.StartArray();
  for (const auto& d : drawings) {
    const Tool* tool = registry.find(d.kind);
    if (!tool) continue;
    tool->serialize(d, writer);
  }
  writer.EndArray();

  return sb.GetString();
}

ImportReport drawingsFromJSON(const std::string& json, const ToolRegistry& registry,
                              std::vector<Drawing>& out) {
  ImportReport report;

  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    std::fprintf(stderr, "drawingsFromJSON: parse error at offset %zu\n",
                 static_cast<std::size_t>(doc.GetErrorOffset()));
    return report;
  }

  const rapidjson::Value* records = nullptr;
  if (doc.IsArray()) {
    records = &doc;
  } else if (doc.IsObject() && doc.HasMember("drawings") && doc["drawings"].IsArray()) {
    records = &doc["drawings"];
  } else {
    std::fprintf(stderr, "drawingsFromJSON: expected an array of drawings\n");
    return report;
  }
  report.parsed = true;

  for (rapidjson::SizeType i = 0; i < records->Size(); i++) {
    const auto& rec = (*records)[i];

    const Tool* tool = nullptr;
    if (rec.IsObject() && rec.HasMember("kind") && rec["kind"].IsString())
      tool = registry.findByName(rec["kind"].GetString());
    if (!tool) {
      std::fprintf(stderr, "drawingsFromJSON: record %u skipped (unknown kind)\n", i);
      report.skipped++;
      continue;
    }

    Drawing d;
    if (!tool->deserialize(rec, d)) {
      std::fprintf(stderr, "drawingsFromJSON: record %u skipped (invalid %s)\n",
                   i, tool->name());
      report.skipped++;
      continue;
    }
    out.push_back(std::move(d));
    report.imported++;
  }

  return report;
}

} // namespace cs
