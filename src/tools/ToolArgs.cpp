#include "tools/ToolArgs.h"
#include "tools/ITool.h"
#include <limits>

namespace ToolArgs {

std::string requireString(const nlohmann::json& args, const std::string& field) {
    auto it = args.find(field);
    if (it == args.end() || it->is_null()) {
        throw ToolError(field + " is required");
    }
    if (!it->is_string()) {
        throw ToolError(field + " must be a string");
    }
    return it->get<std::string>();
}

std::string optionalString(const nlohmann::json& args, const std::string& field,
                           const std::string& fallback) {
    auto it = args.find(field);
    if (it == args.end() || !it->is_string()) return fallback;
    std::string value = it->get<std::string>();
    return value.empty() ? fallback : value;
}

int optionalInt(const nlohmann::json& args, const std::string& field, int fallback) {
    auto it = args.find(field);
    if (it == args.end() || !it->is_number()) return fallback;

    double value = it->get<double>();
    if (value > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (value < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(value);
}

bool optionalBool(const nlohmann::json& args, const std::string& field, bool fallback) {
    auto it = args.find(field);
    if (it == args.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

nlohmann::json stringProperty(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

nlohmann::json enumProperty(const std::string& description, const std::vector<std::string>& values) {
    return {{"type", "string"}, {"description", description}, {"enum", values}};
}

nlohmann::json objectSchema(const nlohmann::json& properties, const std::vector<std::string>& required) {
    nlohmann::json schema;
    schema["type"] = "object";
    schema["properties"] = properties.is_null() ? nlohmann::json::object() : properties;
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

}
