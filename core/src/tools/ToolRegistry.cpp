#include "cs/tools/ToolRegistry.hpp"
#include "cs/tools/FibRetracementTool.hpp"
#include "cs/tools/HorizontalLineTool.hpp"
#include "cs/tools/TrendLineTool.hpp"

#include <cstdio>
#include <memory>

namespace cs {

bool ToolRegistry::registerTool(const ToolFactory& factory) {
  if (!factory) return false;
  std::unique_ptr<Tool> tool = factory();
  if (!tool) return false;

  DrawingKind k = tool->kind();
  if (tools_.count(k)) {
    std::fprintf(stderr, "ToolRegistry::registerTool: %s already registered\n",
                 toString(k));
    return false;
  }
  tools_.emplace(k, std::move(tool));
  return true;
}

const Tool* ToolRegistry::find(DrawingKind kind) const {
  auto it = tools_.find(kind);
  return it != tools_.end() ? it->second.get() : nullptr;
}

Tool* ToolRegistry::findMutable(DrawingKind kind) {
  auto it = tools_.find(kind);
  return it != tools_.end() ? it->second.get() : nullptr;
}

const Tool* ToolRegistry::findByName(const std::string& name) const {
  DrawingKind k;
  if (!parseDrawingKind(name, k)) return nullptr;
  return find(k);
}

std::vector<DrawingKind> ToolRegistry::kinds() const {
  std::vector<DrawingKind> out;
  out.reserve(tools_.size());
  for (const auto& kv : tools_) out.push_back(kv.first);
  return out;
}

void ToolRegistry::setConfig(const ToolConfig& cfg) {
  for (auto& kv : tools_) kv.second->setConfig(cfg);
}

void registerBuiltinTools(ToolRegistry& registry) {
  registry.registerTool([]() -> std::unique_ptr<Tool> { return std::make_unique<TrendLineTool>(); });
  registry.registerTool([]() -> std::unique_ptr<Tool> { return std::make_unique<HorizontalLineTool>(); });
  registry.registerTool([]() -> std::unique_ptr<Tool> { return std::make_unique<FibRetracementTool>(); });
}

} // namespace cs
