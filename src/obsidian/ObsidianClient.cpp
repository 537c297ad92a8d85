#include "obsidian/ObsidianClient.h"
#ifdef _WIN32
    #include <winsock2.h>
#endif
#include "httplib.h"
#include "utils/Logger.h"
#include "utils/UrlUtils.h"
#include <nlohmann/json.hpp>
#include <regex>

namespace {
    enum class BodyShape { Object, Array };

    // Decode the backend body and re-serialize it with stable indentation.
    std::string normalizeJson(const std::string& body, BodyShape shape, const std::string& failurePrefix) {
        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(body);
        } catch (const nlohmann::json::parse_error& e) {
            throw ObsidianError(failurePrefix + ": " + e.what());
        }

        if (shape == BodyShape::Object && !parsed.is_object()) {
            throw ObsidianError(failurePrefix + ": expected a JSON object, got " + parsed.type_name());
        }
        if (shape == BodyShape::Array && !parsed.is_array()) {
            throw ObsidianError(failurePrefix + ": expected a JSON array, got " + parsed.type_name());
        }
        return parsed.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    // httplib drops header values containing CR/LF without telling the caller.
    void requireHeaderSafe(const std::string& name, const std::string& value) {
        if (value.find_first_of("\r\n") != std::string::npos) {
            throw ObsidianError("invalid " + name + " header value: contains a line break");
        }
    }
}

ObsidianClient::ObsidianClient(const std::string& apiToken, const std::string& baseUrl)
    : apiToken(apiToken) {
    std::string normalized = baseUrl;
    if (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }
    this->baseUrl = normalized;
    parseBaseUrl(normalized);
}

void ObsidianClient::parseBaseUrl(const std::string& url) {
    std::regex urlRegex(R"((http|https)://([^/:]+)(?::(\d+))?(.*))");
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        throw std::invalid_argument("Invalid Obsidian base URL: " + url);
    }

    isSsl = (match[1] == "https");
    host = match[2];
    if (match[3].matched) {
        port = std::stoi(match[3]);
    } else {
        port = isSsl ? 443 : 80;
    }
    pathPrefix = match[4];
}

std::string ObsidianClient::vaultPath(const std::string& filename) {
    return "/vault/" + UrlUtils::escapePath(UrlUtils::trimPrefix(filename, '/'));
}

std::string ObsidianClient::makeRequest(const std::string& method, const std::string& target,
                                        const Headers& headers, const std::string& body) {
    Logger::getInstance().debug("-> " + method + " " + target);

    httplib::Request req;
    req.method = method;
    req.path = pathPrefix + target;
    for (const auto& [key, value] : headers) {
        req.set_header(key, value);
    }
    req.set_header("Authorization", "Bearer " + apiToken);
    req.body = body;

    // Targets are escaped by the caller; httplib must not encode them again.
    httplib::Result res;
    if (isSsl) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        httplib::SSLClient cli(host, port);
        cli.set_url_encode(false);
        res = cli.send(req);
#else
        throw ObsidianError("request failed: https base URL requires a build with OpenSSL support");
#endif
    } else {
        httplib::Client cli(host, port);
        cli.set_url_encode(false);
        res = cli.send(req);
    }

    if (!res) {
        throw ObsidianError("request failed: " + httplib::to_string(res.error()));
    }

    Logger::getInstance().debug("<- " + std::to_string(res->status) + " " + method + " " + target);
    if (res->status >= 400) {
        throw ObsidianError("API error (status " + std::to_string(res->status) + "): " + res->body,
                            res->status);
    }
    return res->body;
}

std::string ObsidianClient::getServerInfo() {
    return normalizeJson(makeRequest("GET", "/"), BodyShape::Object, "failed to parse response");
}

std::string ObsidianClient::listVaultFiles(const std::string& path) {
    std::string target = "/vault/";
    std::string dir = UrlUtils::trim(path, '/');
    if (!dir.empty()) {
        target += UrlUtils::escapePath(dir) + "/";
    }
    return normalizeJson(makeRequest("GET", target), BodyShape::Object, "failed to parse response");
}

std::string ObsidianClient::getFileContent(const std::string& filename, const std::string& format) {
    Headers headers;
    const bool asJson = (format == "json");
    if (asJson) {
        headers.emplace("Accept", "application/vnd.olrapi.note+json");
    }

    std::string body = makeRequest("GET", vaultPath(filename), headers);
    if (asJson) {
        return normalizeJson(body, BodyShape::Object, "failed to parse JSON response");
    }
    return body;
}

std::string ObsidianClient::createOrUpdateFile(const std::string& filename, const std::string& content,
                                               const std::string& contentType) {
    requireHeaderSafe("Content-Type", contentType);
    makeRequest("PUT", vaultPath(filename), {{"Content-Type", contentType}}, content);
    return "Successfully created/updated file: " + filename;
}

std::string ObsidianClient::appendToFile(const std::string& filename, const std::string& content) {
    makeRequest("POST", vaultPath(filename), {{"Content-Type", "text/markdown"}}, content);
    return "Successfully appended to file: " + filename;
}

std::string ObsidianClient::patchFileContent(const std::string& filename, const std::string& operation,
                                             const std::string& targetType, const std::string& target,
                                             const std::string& content, const std::string& contentType,
                                             const std::string& delimiter) {
    requireHeaderSafe("Content-Type", contentType);
    requireHeaderSafe("Operation", operation);
    requireHeaderSafe("Target-Type", targetType);
    requireHeaderSafe("Target-Delimiter", delimiter);

    Headers headers = {
        {"Content-Type", contentType},
        {"Operation", operation},
        {"Target-Type", targetType},
        {"Target", UrlUtils::queryEscape(target)},
        {"Target-Delimiter", delimiter}
    };
    makeRequest("PATCH", vaultPath(filename), headers, content);
    return "Successfully patched file: " + filename + " (operation: " + operation + ", target: " + target + ")";
}

std::string ObsidianClient::deleteFile(const std::string& filename) {
    makeRequest("DELETE", vaultPath(filename));
    return "Successfully deleted file: " + filename;
}

std::string ObsidianClient::searchVaultSimple(const std::string& query, int contextLength) {
    std::string target = "/search/simple/?query=" + UrlUtils::queryEscape(query);
    if (contextLength > 0) {
        target += "&contextLength=" + std::to_string(contextLength);
    }
    return normalizeJson(makeRequest("POST", target), BodyShape::Array, "failed to parse search results");
}

std::string ObsidianClient::searchVaultAdvanced(const std::string& query, const std::string& queryType) {
    std::string contentType;
    if (queryType == "dataview") {
        contentType = "application/vnd.olrapi.dataview.dql+txt";
    } else if (queryType == "jsonlogic") {
        contentType = "application/vnd.olrapi.jsonlogic+json";
        // Reject malformed logic before spending a round-trip on it
        try {
            (void)nlohmann::json::parse(query);
        } catch (const nlohmann::json::parse_error& e) {
            throw ObsidianError(std::string("invalid JSON query: ") + e.what());
        }
    } else {
        throw ObsidianError("unsupported query type: " + queryType);
    }

    std::string body = makeRequest("POST", "/search/", {{"Content-Type", contentType}}, query);
    return normalizeJson(body, BodyShape::Array, "failed to parse search results");
}

std::string ObsidianClient::listCommands() {
    return normalizeJson(makeRequest("GET", "/commands/"), BodyShape::Object, "failed to parse response");
}

std::string ObsidianClient::executeCommand(const std::string& commandId) {
    makeRequest("POST", "/commands/" + UrlUtils::pathEscape(commandId) + "/");
    return "Successfully executed command: " + commandId;
}

std::string ObsidianClient::openFile(const std::string& filename, bool newLeaf) {
    std::string target = "/open/" + UrlUtils::escapePath(UrlUtils::trimPrefix(filename, '/'));
    if (newLeaf) {
        target += "?newLeaf=true";
    }
    makeRequest("POST", target);
    return "Successfully opened file: " + filename;
}
