#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/ITool.h"

/**
 * @brief Tool catalog
 *
 * Filled once at startup and read-only afterwards. Tools keep their
 * registration order, which is the order tools/list reports.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /**
     * @brief Register a tool (ownership moves to the registry)
     * @throws std::invalid_argument on a null tool or a duplicate name
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief Look up a tool
     * @return nullptr if no tool has that name
     */
    ITool* getTool(const std::string& name) const;

    /**
     * @brief Descriptors for tools/list, in registration order
     *
     * Each entry:
     * {
     *   "name": "tool_name",
     *   "description": "...",
     *   "inputSchema": { JSON Schema }
     * }
     */
    nlohmann::json listTools() const;

    /**
     * @brief Run a tool by name
     * @throws ToolError("unknown tool: <name>") if the name is not registered;
     *         anything the tool itself throws is passed through
     */
    std::string executeTool(const std::string& name, const nlohmann::json& args) const;

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::vector<std::unique_ptr<ITool>> tools;
    std::unordered_map<std::string, ITool*> byName;
};
