#pragma once
#include <istream>
#include <ostream>
#include <string>

class McpDispatcher;

/**
 * @brief Line-delimited JSON-RPC loop
 *
 * Reads one request per line, dispatches it, and writes the response as one
 * line before reading the next request. A line that does not decode gets a
 * parse-error response without an id and the loop goes on. Only end of input
 * or a failed write ends run().
 */
class StdioServer {
public:
    StdioServer(McpDispatcher& dispatcher, std::istream& in, std::ostream& out);

    /**
     * @brief Serve until end of input
     * @return false if writing a response failed
     */
    bool run();

    // Handle one raw input line. Returns false if the response could not be written.
    bool processLine(const std::string& line);

    size_t getRequestCount() const { return requestCount; }

private:
    McpDispatcher& dispatcher;
    std::istream& in;
    std::ostream& out;
    size_t requestCount = 0;

    bool writeLine(const std::string& line);
};
