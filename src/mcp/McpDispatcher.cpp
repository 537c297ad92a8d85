#include "mcp/McpDispatcher.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"
#include <exception>

McpDispatcher::McpDispatcher(const ToolRegistry& registry) : registry(registry) {}

std::optional<McpResponse> McpDispatcher::handle(const McpRequest& request) {
    std::string idText = request.id.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    Logger::getInstance().debug("dispatch " + request.method + " id=" + idText);

    if (request.method == "initialize") {
        return handleInitialize(request);
    }
    if (request.method == "ping") {
        return handlePing(request);
    }
    if (request.method == "tools/list") {
        return handleToolsList(request);
    }
    if (request.method == "tools/call") {
        return handleToolsCall(request);
    }

    Logger::getInstance().warn("Method not found: " + request.method);
    return McpResponse::failure(request.id, ErrorCode::METHOD_NOT_FOUND, "Method not found", request.method);
}

McpResponse McpDispatcher::handleInitialize(const McpRequest& request) {
    nlohmann::json result = {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", {
            {"tools", nlohmann::json::object()}
        }},
        {"serverInfo", {
            {"name", SERVER_NAME},
            {"version", SERVER_VERSION}
        }}
    };
    return McpResponse::success(request.id, result);
}

McpResponse McpDispatcher::handlePing(const McpRequest& request) {
    return McpResponse::success(request.id, nlohmann::json::object());
}

McpResponse McpDispatcher::handleToolsList(const McpRequest& request) {
    return McpResponse::success(request.id, {{"tools", registry.listTools()}});
}

McpResponse McpDispatcher::handleToolsCall(const McpRequest& request) {
    auto nameIt = request.params.find("name");
    if (nameIt == request.params.end() || !nameIt->is_string()) {
        Logger::getInstance().warn("tools/call without a tool name");
        return McpResponse::failure(request.id, ErrorCode::INVALID_PARAMS, "Invalid params: missing tool name");
    }
    std::string name = nameIt->get<std::string>();

    nlohmann::json arguments = nlohmann::json::object();
    auto argsIt = request.params.find("arguments");
    if (argsIt != request.params.end() && argsIt->is_object()) {
        arguments = *argsIt;
    }

    std::string text;
    try {
        text = registry.executeTool(name, arguments);
    } catch (const std::exception& e) {
        Logger::getInstance().warn("Tool " + name + " failed: " + e.what());
        return McpResponse::failure(request.id, ErrorCode::INTERNAL_ERROR, e.what());
    }

    nlohmann::json content = nlohmann::json::array();
    content.push_back({{"type", "text"}, {"text", text}});
    return McpResponse::success(request.id, {{"content", content}});
}
