#pragma once
#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

// JSON-RPC 2.0 error codes used by the server
namespace ErrorCode {
    constexpr int PARSE_ERROR = -32700;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
}

struct StructuredError {
    int code;
    std::string message;
    nlohmann::json data;    // null when there is no auxiliary data

    nlohmann::json toJson() const;
};

/**
 * @brief Decoded JSON-RPC request
 *
 * id is null when the request carried none. params is always an object
 * (empty when absent).
 */
struct McpRequest {
    std::string jsonrpc;
    nlohmann::json id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    /**
     * @brief Decode one request line
     * @throws RequestDecodeError on malformed JSON or a value that is not a request
     */
    static McpRequest parse(const std::string& line);
};

class RequestDecodeError : public std::runtime_error {
public:
    explicit RequestDecodeError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief JSON-RPC response carrying exactly one of result / error
 *
 * Only constructible through success() and failure().
 */
class McpResponse {
public:
    static McpResponse success(const nlohmann::json& id, const nlohmann::json& result);
    static McpResponse failure(const nlohmann::json& id, const StructuredError& error);
    static McpResponse failure(const nlohmann::json& id, int code, const std::string& message,
                               const nlohmann::json& data = nullptr);

    const nlohmann::json& getId() const { return id; }
    bool isError() const { return error.has_value(); }
    const nlohmann::json& getResult() const { return result; }
    const std::optional<StructuredError>& getError() const { return error; }

    nlohmann::json toJson() const;

    // Single-line serialization; invalid UTF-8 is replaced, never thrown on.
    std::string serialize() const;

private:
    McpResponse() = default;

    nlohmann::json id;
    nlohmann::json result;
    std::optional<StructuredError> error;
};
