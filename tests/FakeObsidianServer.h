#pragma once
/**
 * In-process stand-in for the Obsidian Local REST API, for tests.
 *
 * Serves a small in-memory vault on 127.0.0.1 (random port) and records
 * every request that reaches a handler. Requests without the expected
 * bearer token get 401 like the real plugin.
 */
#include "httplib.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct RecordedRequest {
    std::string method;
    std::string path;                           // decoded by httplib
    std::multimap<std::string, std::string> params;
    std::map<std::string, std::string> headers;
    std::string body;

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? "" : it->second;
    }
    std::string param(const std::string& name) const {
        auto it = params.find(name);
        return it == params.end() ? "" : it->second;
    }
    bool hasParam(const std::string& name) const { return params.count(name) > 0; }
};

class FakeObsidianServer {
public:
    // Return true when the override produced the response. Runs under the
    // server lock: it must not call back into FakeObsidianServer.
    using Override = std::function<bool(const httplib::Request&, httplib::Response&)>;

    explicit FakeObsidianServer(const std::string& token = "test-token") : token(token) {
        auto handler = [this](const httplib::Request& req, httplib::Response& res) { handle(req, res); };
        svr.Get("/(.*)", handler);
        svr.Post("/(.*)", handler);
        svr.Put("/(.*)", handler);
        svr.Patch("/(.*)", handler);
        svr.Delete("/(.*)", handler);

        port = svr.bind_to_any_port("127.0.0.1");
        worker = std::thread([this]() { svr.listen_after_bind(); });
        while (!svr.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    ~FakeObsidianServer() {
        svr.stop();
        if (worker.joinable()) worker.join();
    }

    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(port); }

    void setOverride(Override fn) {
        std::lock_guard<std::mutex> lock(mtx);
        override = std::move(fn);
    }

    void putNote(const std::string& name, const std::string& content) {
        std::lock_guard<std::mutex> lock(mtx);
        notes[name] = content;
    }

    std::string note(const std::string& name) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = notes.find(name);
        return it == notes.end() ? "" : it->second;
    }

    bool hasNote(const std::string& name) {
        std::lock_guard<std::mutex> lock(mtx);
        return notes.count(name) > 0;
    }

    std::vector<RecordedRequest> requests() {
        std::lock_guard<std::mutex> lock(mtx);
        return recorded;
    }

    RecordedRequest lastRequest() {
        std::lock_guard<std::mutex> lock(mtx);
        return recorded.empty() ? RecordedRequest{} : recorded.back();
    }

private:
    httplib::Server svr;
    std::thread worker;
    int port = 0;
    std::string token;

    std::mutex mtx;
    Override override;
    std::map<std::string, std::string> notes;
    std::vector<RecordedRequest> recorded;

    static void sendJson(httplib::Response& res, int status, const nlohmann::json& body) {
        res.status = status;
        res.set_content(body.dump(), "application/json");
    }

    static void notFound(httplib::Response& res) {
        sendJson(res, 404, {{"errorCode", 40400}, {"message", "Not Found"}});
    }

    void handle(const httplib::Request& req, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(mtx);

        RecordedRequest r;
        r.method = req.method;
        r.path = req.path;
        for (const auto& [k, v] : req.params) r.params.emplace(k, v);
        for (const auto& [k, v] : req.headers) r.headers[k] = v;
        r.body = req.body;
        recorded.push_back(r);

        if (req.get_header_value("Authorization") != "Bearer " + token) {
            sendJson(res, 401, {{"errorCode", 40101}, {"message", "Authorization required."}});
            return;
        }

        if (override && override(req, res)) {
            return;
        }

        const std::string& path = req.path;
        if (path == "/" && req.method == "GET") {
            sendJson(res, 200, {
                {"ok", "OK"},
                {"service", "Obsidian Local REST API"},
                {"authenticated", true},
                {"versions", {{"obsidian", "1.5.0"}, {"self", "3.0.0"}}}
            });
        } else if (path.rfind("/vault/", 0) == 0) {
            handleVault(req, res, path.substr(7));
        } else if (path == "/search/simple/" && req.method == "POST") {
            handleSimpleSearch(req, res);
        } else if (path == "/search/" && req.method == "POST") {
            nlohmann::json results = nlohmann::json::array();
            for (const auto& [name, content] : notes) {
                results.push_back({{"filename", name}, {"result", true}});
            }
            sendJson(res, 200, results);
        } else if (path == "/commands/" && req.method == "GET") {
            sendJson(res, 200, {{"commands", {
                {{"id", "editor:toggle-bold"}, {"name", "Toggle bold"}},
                {{"id", "app:go-back"}, {"name", "Navigate back"}}
            }}});
        } else if (path.rfind("/commands/", 0) == 0 && req.method == "POST") {
            res.status = 204;
        } else if (path.rfind("/open/", 0) == 0 && req.method == "POST") {
            res.status = 200;
        } else {
            notFound(res);
        }
    }

    void handleVault(const httplib::Request& req, httplib::Response& res, const std::string& name) {
        if (name.empty() || name.back() == '/') {
            if (req.method != "GET") { notFound(res); return; }
            nlohmann::json files = nlohmann::json::array();
            for (const auto& [noteName, content] : notes) {
                if (noteName.rfind(name, 0) == 0) files.push_back(noteName.substr(name.size()));
            }
            sendJson(res, 200, {{"files", files}});
            return;
        }

        auto it = notes.find(name);
        if (req.method == "GET") {
            if (it == notes.end()) { notFound(res); return; }
            if (req.get_header_value("Accept") == "application/vnd.olrapi.note+json") {
                sendJson(res, 200, {
                    {"path", name},
                    {"content", it->second},
                    {"frontmatter", nlohmann::json::object()},
                    {"tags", nlohmann::json::array()}
                });
            } else {
                res.status = 200;
                res.set_content(it->second, "text/markdown");
            }
        } else if (req.method == "PUT") {
            notes[name] = req.body;
            res.status = 204;
        } else if (req.method == "POST") {
            notes[name] += req.body;
            res.status = 204;
        } else if (req.method == "PATCH") {
            if (it == notes.end()) { notFound(res); return; }
            if (req.get_header_value("Operation") == "prepend") {
                it->second = req.body + it->second;
            } else {
                it->second += req.body;
            }
            res.status = 200;
        } else if (req.method == "DELETE") {
            if (it == notes.end()) { notFound(res); return; }
            notes.erase(it);
            res.status = 204;
        } else {
            notFound(res);
        }
    }

    void handleSimpleSearch(const httplib::Request& req, httplib::Response& res) {
        std::string query = req.get_param_value("query");
        nlohmann::json results = nlohmann::json::array();
        for (const auto& [name, content] : notes) {
            size_t pos = content.find(query);
            if (query.empty() || pos == std::string::npos) continue;
            results.push_back({
                {"filename", name},
                {"score", 1.0},
                {"matches", {{
                    {"match", {{"start", pos}, {"end", pos + query.size()}}},
                    {"context", content}
                }}}
            });
        }
        sendJson(res, 200, results);
    }
};
