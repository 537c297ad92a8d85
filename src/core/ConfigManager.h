#pragma once
#include <string>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>
#include <nlohmann/json.hpp>

struct Config {
    static constexpr const char* DEFAULT_BASE_URL = "http://127.0.0.1:27123";
    static constexpr const char* TOKEN_ENV_VAR = "OBSIDIAN_API_TOKEN";

    struct Obsidian {
        std::string apiToken;
        std::string baseUrl = DEFAULT_BASE_URL;
    } obsidian;

    struct Server {
        std::string logFile;
        bool debug = false;
    } server;

    /**
     * @brief Load a JSON config file
     *
     * {
     *   "obsidian": {"api_token": "...", "base_url": "http://127.0.0.1:27123"},
     *   "server":   {"log_file": "obsidian-mcp.log", "debug": false}
     * }
     *
     * Every key is optional; missing keys keep their defaults.
     */
    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be an object: " + path.string());
        }

        Config cfg;
        try {
            if (j.contains("obsidian")) {
                const auto& o = j.at("obsidian");
                cfg.obsidian.apiToken = o.value("api_token", "");
                cfg.obsidian.baseUrl = o.value("base_url", std::string(DEFAULT_BASE_URL));
            }
            if (j.contains("server")) {
                const auto& s = j.at("server");
                cfg.server.logFile = s.value("log_file", "");
                cfg.server.debug = s.value("debug", false);
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config in " + path.string() + ": " + e.what());
        }
        return cfg;
    }

    // Fill the token from the environment when nothing else provided one.
    void applyEnvironment() {
        if (!obsidian.apiToken.empty()) return;
        const char* token = std::getenv(TOKEN_ENV_VAR);
        if (token) {
            obsidian.apiToken = token;
        }
    }
};
