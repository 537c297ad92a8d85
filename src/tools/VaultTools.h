#pragma once
#include "tools/ITool.h"
#include <string>

class ObsidianClient;
class ToolRegistry;

/**
 * @brief Base for tools backed by the Obsidian REST client
 *
 * Each concrete tool owns a typed Args bundle and a static parseArgs() that
 * turns the untyped "arguments" object into it (throwing ToolError on a
 * missing or mistyped required field). execute() is parseArgs() followed by
 * exactly one client call.
 */
class VaultTool : public ITool {
public:
    explicit VaultTool(ObsidianClient& client) : client(client) {}

protected:
    ObsidianClient& client;
};

class GetServerInfoTool : public VaultTool {
public:
    using VaultTool::VaultTool;

    std::string getName() const override { return "get_server_info"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string execute(const nlohmann::json& args) override;
};

class ListVaultFilesTool : public VaultTool {
public:
    struct Args {
        std::string path;
    };

    using VaultTool::VaultTool;

    std::string getName() const override { return "list_vault_files"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string execute(const nlohmann::json& args) override;

    static Args parseArgs(const nlohmann::json& args);
};

class GetFileContentTool : public VaultTool {
public:
    struct Args {
        std::string filename;
        std::string format;     // "markdown" unless given
    };

    using VaultTool::VaultTool;

    std::string getName() const override { return "get_file_content"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string execute(const nlohmann::json& args) override;

    static Args parseArgs(const nlohmann::json& args);
};

class CreateOrUpdateFileTool : public VaultTool {
public:
    struct Args {
        std::string filename;
        std::string content;
        std::string contentType;  // "text/markdown" unless given
    };

    using VaultTool::VaultTool;

    std::string getName() const override { return "create_or_update_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string execute(const nlohmann::json& args) override;

    static Args parseArgs(const nlohmann::json& args);
};

class AppendToFileTool : public VaultTool {
public:
    struct Args {
        std::string filename;
        std::string content;
    };

    using VaultTool::VaultTool;

    std::string getName() const override { return "append_to_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string execute(const nlohmann::json& args) override;

    static Args parseArgs(const nlohmann::json& args);
};

/**
 * @brief Insert content relative to a heading, block reference or frontmatter field
 */
class PatchFileContentTool : public VaultTool {
public:
    struct Args {
        std::string filename;
        std::string operation;    // append | prepend | replace
        std::string targetType;   // heading | block | frontmatter
        std::string target;
        std::string content;
        std::string contentType;  // "text/markdown" unless given
        std::string delimiter;    // "::" unless given
    };

    using VaultTool::VaultTool;

    std::string getName() const override { return "patch_file_content"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string execute(const nlohmann::json& args) override;

    static Args parseArgs(const nlohmann::json& args);
};

class DeleteFileTool : public VaultTool {
public:
    struct Args {
        std::string filename;
    };

    using VaultTool::VaultTool;

    std::string getName() const override { return "delete_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string execute(const nlohmann::json& args) override;

    static Args parseArgs(const nlohmann::json& args);
};

class SearchVaultSimpleTool : public VaultTool {
public:
    struct Args {
        std::string query;
        int contextLength;        // 100 unless given
    };

    using VaultTool::VaultTool;

    std::string getName() const override { return "search_vault_simple"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string execute(const nlohmann::json& args) override;

    static Args parseArgs(const nlohmann::json& args);
};

/**
 * @brief Dataview DQL or JsonLogic search
 *
 * The query type is not checked here; the client rejects anything other
 * than "dataview" and "jsonlogic" before sending.
 */
class SearchVaultAdvancedTool : public VaultTool {
public:
    struct Args {
        std::string query;
        std::string queryType;
    };

    using VaultTool::VaultTool;

    std::string getName() const override { return "search_vault_advanced"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string execute(const nlohmann::json& args) override;

    static Args parseArgs(const nlohmann::json& args);
};

class ListCommandsTool : public VaultTool {
public:
    using VaultTool::VaultTool;

    std::string getName() const override { return "list_commands"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string execute(const nlohmann::json& args) override;
};

class ExecuteCommandTool : public VaultTool {
public:
    struct Args {
        std::string commandId;
    };

    using VaultTool::VaultTool;

    std::string getName() const override { return "execute_command"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string execute(const nlohmann::json& args) override;

    static Args parseArgs(const nlohmann::json& args);
};

class OpenFileTool : public VaultTool {
public:
    struct Args {
        std::string filename;
        bool newLeaf;             // false unless given
    };

    using VaultTool::VaultTool;

    std::string getName() const override { return "open_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    std::string execute(const nlohmann::json& args) override;

    static Args parseArgs(const nlohmann::json& args);
};

/**
 * @brief Register the 12 vault tools, in catalog order
 */
void registerVaultTools(ToolRegistry& registry, ObsidianClient& client);
