#pragma once
#include <string>
#include <map>
#include <stdexcept>

/**
 * @brief Failure talking to the Obsidian Local REST API
 *
 * status() is the HTTP status for backend rejections (>= 400) and 0 for
 * transport failures and checks done before any request is sent.
 */
class ObsidianError : public std::runtime_error {
public:
    explicit ObsidianError(const std::string& message, int status = 0)
        : std::runtime_error(message), statusCode(status) {}

    int status() const { return statusCode; }

private:
    int statusCode;
};

/**
 * @brief Client for the Obsidian Local REST API
 *
 * One method per vault operation. Every call is a single blocking request
 * carrying "Authorization: Bearer <token>". Reads of structured data return
 * the backend JSON re-serialized with 2-space indentation; mutations return
 * a confirmation line. All failures throw ObsidianError.
 *
 * Methods are virtual so tests can substitute a recording double.
 */
class ObsidianClient {
public:
    using Headers = std::multimap<std::string, std::string>;

    ObsidianClient(const std::string& apiToken, const std::string& baseUrl);
    virtual ~ObsidianClient() = default;

    virtual std::string getServerInfo();
    virtual std::string listVaultFiles(const std::string& path);
    virtual std::string getFileContent(const std::string& filename, const std::string& format);
    virtual std::string createOrUpdateFile(const std::string& filename, const std::string& content,
                                           const std::string& contentType);
    virtual std::string appendToFile(const std::string& filename, const std::string& content);
    virtual std::string patchFileContent(const std::string& filename, const std::string& operation,
                                         const std::string& targetType, const std::string& target,
                                         const std::string& content, const std::string& contentType,
                                         const std::string& delimiter);
    virtual std::string deleteFile(const std::string& filename);
    virtual std::string searchVaultSimple(const std::string& query, int contextLength);
    virtual std::string searchVaultAdvanced(const std::string& query, const std::string& queryType);
    virtual std::string listCommands();
    virtual std::string executeCommand(const std::string& commandId);
    virtual std::string openFile(const std::string& filename, bool newLeaf);

    // Base URL without the trailing '/'
    const std::string& getBaseUrl() const { return baseUrl; }

protected:
    /**
     * @brief Send one request and return the response body
     * @param target path (and query) relative to the base URL, already escaped
     * @throws ObsidianError on transport failure or HTTP status >= 400
     */
    virtual std::string makeRequest(const std::string& method, const std::string& target,
                                    const Headers& headers = {}, const std::string& body = "");

private:
    std::string apiToken;
    std::string baseUrl;
    bool isSsl;
    std::string host;
    int port;
    std::string pathPrefix;

    void parseBaseUrl(const std::string& url);
    static std::string vaultPath(const std::string& filename);
};
