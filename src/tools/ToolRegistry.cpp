#include "tools/ToolRegistry.h"
#include <stdexcept>

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) {
        throw std::invalid_argument("Cannot register a null tool");
    }

    std::string name = tool->getName();
    if (byName.count(name)) {
        throw std::invalid_argument("Tool already registered: " + name);
    }

    byName[name] = tool.get();
    tools.push_back(std::move(tool));
}

ITool* ToolRegistry::getTool(const std::string& name) const {
    auto it = byName.find(name);
    if (it == byName.end()) {
        return nullptr;
    }
    return it->second;
}

nlohmann::json ToolRegistry::listTools() const {
    nlohmann::json list = nlohmann::json::array();

    for (const auto& tool : tools) {
        nlohmann::json entry;
        entry["name"] = tool->getName();
        entry["description"] = tool->getDescription();
        entry["inputSchema"] = tool->getSchema();
        list.push_back(entry);
    }

    return list;
}

std::string ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args) const {
    ITool* tool = getTool(name);
    if (!tool) {
        throw ToolError("unknown tool: " + name);
    }
    return tool->execute(args);
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return byName.count(name) > 0;
}
