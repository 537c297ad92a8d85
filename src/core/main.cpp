#include <iostream>
#include <string>
#include <memory>
#include <filesystem>
#include <optional>
#include "core/ConfigManager.h"
#include "obsidian/ObsidianClient.h"
#include "tools/ToolRegistry.h"
#include "tools/VaultTools.h"
#include "mcp/McpDispatcher.h"
#include "mcp/StdioServer.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace {

struct CommandLine {
    std::optional<std::string> token;
    std::optional<std::string> url;
    std::optional<std::string> configPath;
    std::optional<std::string> logFile;
    bool debug = false;
    bool showVersion = false;
    bool showHelp = false;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --token <token>     Obsidian API token (or set " << Config::TOKEN_ENV_VAR << ")\n"
              << "  --url <url>         Obsidian server base URL (default: " << Config::DEFAULT_BASE_URL << ")\n"
              << "  --config <path>     JSON config file\n"
              << "  --log-file <path>   Append log lines to this file\n"
              << "  --debug             Log every request and backend call\n"
              << "  --version           Show version information\n"
              << "  --help              Show this message\n";
}

// Accepts "--flag" and "-flag" spellings.
std::string flagName(const std::string& arg) {
    if (arg.rfind("--", 0) == 0) return arg.substr(2);
    if (arg.rfind("-", 0) == 0) return arg.substr(1);
    return "";
}

bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string name = flagName(arg);

        std::optional<std::string>* target = nullptr;
        if (name == "token") target = &cmd.token;
        else if (name == "url") target = &cmd.url;
        else if (name == "config") target = &cmd.configPath;
        else if (name == "log-file") target = &cmd.logFile;
        else if (name == "debug") { cmd.debug = true; continue; }
        else if (name == "version") { cmd.showVersion = true; continue; }
        else if (name == "help" || name == "h") { cmd.showHelp = true; continue; }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }

        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return false;
        }
        *target = argv[++i];
    }
    return true;
}

}

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return 2;
    }
    if (cmd.showHelp) {
        printUsage(argv[0]);
        return 0;
    }
    if (cmd.showVersion) {
        std::cout << McpDispatcher::SERVER_NAME << " v" << McpDispatcher::SERVER_VERSION << std::endl;
        return 0;
    }

    Config cfg;
    if (cmd.configPath) {
        try {
            if (!fs::exists(fs::u8path(*cmd.configPath))) {
                throw std::runtime_error("Configuration file not found: " + *cmd.configPath);
            }
            cfg = Config::load(*cmd.configPath);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << std::endl;
            return 1;
        }
    }
    if (cmd.token) cfg.obsidian.apiToken = *cmd.token;
    if (cmd.url) cfg.obsidian.baseUrl = *cmd.url;
    if (cmd.logFile) cfg.server.logFile = *cmd.logFile;
    if (cmd.debug) cfg.server.debug = true;
    cfg.applyEnvironment();

    Logger& logger = Logger::getInstance();
    logger.setLogFile(cfg.server.logFile);
    logger.setDebugEnabled(cfg.server.debug);

    if (cfg.obsidian.apiToken.empty()) {
        std::cerr << "Error: API token is required. Use --token or set the "
                  << Config::TOKEN_ENV_VAR << " environment variable." << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    std::unique_ptr<ObsidianClient> client;
    try {
        client = std::make_unique<ObsidianClient>(cfg.obsidian.apiToken, cfg.obsidian.baseUrl);
    } catch (const std::exception& e) {
        logger.error(e.what());
        return 1;
    }

    ToolRegistry registry;
    registerVaultTools(registry, *client);
    McpDispatcher dispatcher(registry);

    logger.info("Starting Obsidian MCP Server...");
    logger.info("Base URL: " + client->getBaseUrl());
    logger.info("Registered " + std::to_string(registry.getToolCount()) + " tools");
    logger.info("Listening on stdin/stdout for MCP requests");

    StdioServer server(dispatcher, std::cin, std::cout);
    if (!server.run()) {
        logger.error("Server error: failed to send response");
        return 1;
    }
    return 0;
}
