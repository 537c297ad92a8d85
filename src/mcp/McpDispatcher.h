#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "mcp/McpTypes.h"

class ToolRegistry;

/**
 * @brief Routes a decoded request to its handler
 *
 * Methods: initialize, ping, tools/list, tools/call. Every handler answers;
 * an empty optional is reserved for notification-style methods and is
 * never produced today. No exception leaves handle().
 */
class McpDispatcher {
public:
    static constexpr const char* PROTOCOL_VERSION = "2024-11-05";
    static constexpr const char* SERVER_NAME = "obsidian-mcp-server";
    static constexpr const char* SERVER_VERSION = "1.0.0";

    explicit McpDispatcher(const ToolRegistry& registry);

    std::optional<McpResponse> handle(const McpRequest& request);

private:
    const ToolRegistry& registry;

    McpResponse handleInitialize(const McpRequest& request);
    McpResponse handlePing(const McpRequest& request);
    McpResponse handleToolsList(const McpRequest& request);
    McpResponse handleToolsCall(const McpRequest& request);
};
