#pragma once
#include "cs/tools/Tool.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cs {

using ToolFactory = std::function<std::unique_ptr<Tool>()>;

// kind -> tool instance. Each factory runs once, at registration.
class ToolRegistry {
public:
  // Returns false (registry unchanged) if the factory yields null or the
  // kind is already registered.
  bool registerTool(const ToolFactory& factory);

  const Tool* find(DrawingKind kind) const;
  Tool* findMutable(DrawingKind kind);

  // Canonical ("TrendLine") or lowercase ("trendline") name. Unknown -> null.
  const Tool* findByName(const std::string& name) const;

  std::vector<DrawingKind> kinds() const;
  std::size_t count() const { return tools_.size(); }

  // Apply the same config to every registered tool.
  void setConfig(const ToolConfig& cfg);

private:
  std::map<DrawingKind, std::unique_ptr<Tool>> tools_;
};

// TrendLine, HorizontalLine, FibRetracement with built-in default styles.
void registerBuiltinTools(ToolRegistry& registry);

} // namespace cs
