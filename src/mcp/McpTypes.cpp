#include "mcp/McpTypes.h"

nlohmann::json StructuredError::toJson() const {
    nlohmann::json j = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        j["data"] = data;
    }
    return j;
}

McpRequest McpRequest::parse(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw RequestDecodeError(e.what());
    }

    if (!j.is_object()) {
        throw RequestDecodeError(std::string("request must be a JSON object, got ") + j.type_name());
    }

    McpRequest request;
    if (j.contains("jsonrpc")) {
        if (!j["jsonrpc"].is_string()) {
            throw RequestDecodeError("field \"jsonrpc\" must be a string");
        }
        request.jsonrpc = j["jsonrpc"].get<std::string>();
    }

    if (j.contains("id")) {
        request.id = j["id"];
    }

    if (j.contains("method") && !j["method"].is_null()) {
        if (!j["method"].is_string()) {
            throw RequestDecodeError("field \"method\" must be a string");
        }
        request.method = j["method"].get<std::string>();
    }

    if (j.contains("params") && !j["params"].is_null()) {
        if (!j["params"].is_object()) {
            throw RequestDecodeError("field \"params\" must be an object");
        }
        request.params = j["params"];
    }

    return request;
}

McpResponse McpResponse::success(const nlohmann::json& id, const nlohmann::json& result) {
    McpResponse response;
    response.id = id;
    response.result = result;
    return response;
}

McpResponse McpResponse::failure(const nlohmann::json& id, const StructuredError& error) {
    McpResponse response;
    response.id = id;
    response.error = error;
    return response;
}

McpResponse McpResponse::failure(const nlohmann::json& id, int code, const std::string& message,
                                 const nlohmann::json& data) {
    return failure(id, StructuredError{code, message, data});
}

nlohmann::json McpResponse::toJson() const {
    nlohmann::json j;
    j["jsonrpc"] = "2.0";
    if (!id.is_null()) {
        j["id"] = id;
    }
    if (error) {
        j["error"] = error->toJson();
    } else {
        j["result"] = result;
    }
    return j;
}

std::string McpResponse::serialize() const {
    return toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
