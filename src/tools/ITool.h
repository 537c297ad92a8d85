#pragma once
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

/**
 * @brief Tool-level failure (unknown tool, missing or mistyped argument)
 */
class ToolError : public std::runtime_error {
public:
    explicit ToolError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Tool interface
 *
 * A tool is one named vault operation exposed through tools/list and
 * tools/call. Tools do no protocol work: they validate their own arguments,
 * call the backend, and return the text that goes into the
 * {"type": "text"} content item.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique tool name
     */
    virtual std::string getName() const = 0;

    /**
     * @brief One-line description shown to MCP callers
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief JSON Schema of the arguments object
     *
     * {"type": "object", "properties": {...}, "required": [...]}
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Run the tool
     * @param args the "arguments" object of tools/call (never null, may be empty)
     * @return result text
     * @throws ToolError on invalid arguments, ObsidianError on backend failure
     */
    virtual std::string execute(const nlohmann::json& args) = 0;
};
