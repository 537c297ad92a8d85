#include "mcp/StdioServer.h"
#include "mcp/McpDispatcher.h"
#include "mcp/McpTypes.h"
#include "utils/Logger.h"

StdioServer::StdioServer(McpDispatcher& dispatcher, std::istream& in, std::ostream& out)
    : dispatcher(dispatcher), in(in), out(out) {}

bool StdioServer::run() {
    std::string line;
    while (std::getline(in, line)) {
        if (!processLine(line)) {
            return false;
        }
    }
    Logger::getInstance().info("End of input after " + std::to_string(requestCount) + " request(s)");
    return true;
}

bool StdioServer::processLine(const std::string& rawLine) {
    std::string line = rawLine;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos) {
        return true;
    }

    requestCount++;

    McpRequest request;
    try {
        request = McpRequest::parse(line);
    } catch (const RequestDecodeError& e) {
        Logger::getInstance().warn(std::string("Parse error: ") + e.what());
        McpResponse response = McpResponse::failure(nullptr, ErrorCode::PARSE_ERROR, "Parse error", e.what());
        return writeLine(response.serialize());
    }

    std::optional<McpResponse> response = dispatcher.handle(request);
    if (!response) {
        return true;
    }
    return writeLine(response->serialize());
}

bool StdioServer::writeLine(const std::string& line) {
    // One write per response so a response is never interleaved or split
    std::string framed = line + "\n";
    out.write(framed.data(), static_cast<std::streamsize>(framed.size()));
    out.flush();
    if (!out) {
        Logger::getInstance().error("Failed to write response to output stream");
        return false;
    }
    return true;
}
