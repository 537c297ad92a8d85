#pragma once
#include <string>
#include <vector>
#include "obsidian/ObsidianClient.h"

/**
 * ObsidianClient that never touches the network: makeRequest() records the
 * call and answers with a canned body or a canned HTTP failure.
 */
class RecordingObsidianClient : public ObsidianClient {
public:
    struct Call {
        std::string method;
        std::string target;
        Headers headers;
        std::string body;

        std::string header(const std::string& name) const {
            auto it = headers.find(name);
            return it == headers.end() ? "" : it->second;
        }
    };

    RecordingObsidianClient() : ObsidianClient("test-token", "http://127.0.0.1:27123") {}

    std::vector<Call> calls;
    std::string nextBody = "{}";
    int failWithStatus = 0;

protected:
    std::string makeRequest(const std::string& method, const std::string& target,
                            const Headers& headers, const std::string& body) override {
        calls.push_back({method, target, headers, body});
        if (failWithStatus >= 400) {
            throw ObsidianError("API error (status " + std::to_string(failWithStatus) + "): {}", failWithStatus);
        }
        return nextBody;
    }
};
