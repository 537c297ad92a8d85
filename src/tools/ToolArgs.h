#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * Shallow argument extraction for tool calls.
 *
 * Required fields must be present with the right primitive type, otherwise
 * a ToolError naming the field is thrown. Optional fields fall back to their
 * default when absent, null, of another type, or (for strings) empty.
 */
namespace ToolArgs {
    std::string requireString(const nlohmann::json& args, const std::string& field);

    std::string optionalString(const nlohmann::json& args, const std::string& field,
                               const std::string& fallback);
    int optionalInt(const nlohmann::json& args, const std::string& field, int fallback);
    bool optionalBool(const nlohmann::json& args, const std::string& field, bool fallback);

    // Schema building blocks
    nlohmann::json stringProperty(const std::string& description);
    nlohmann::json enumProperty(const std::string& description, const std::vector<std::string>& values);
    nlohmann::json objectSchema(const nlohmann::json& properties, const std::vector<std::string>& required = {});
}
