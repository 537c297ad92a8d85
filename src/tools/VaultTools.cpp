#include "tools/VaultTools.h"
#include "tools/ToolArgs.h"
#include "tools/ToolRegistry.h"
#include "obsidian/ObsidianClient.h"
#include <memory>

using namespace ToolArgs;

namespace {
    const char* FILENAME_DESCRIPTION = "Path to the file relative to vault root";
    const char* CONTENT_TYPE_DESCRIPTION = "Content type (defaults to 'text/markdown')";
    const char* DEFAULT_CONTENT_TYPE = "text/markdown";
}

// ---------------------------------------------------------------------------
// get_server_info
// ---------------------------------------------------------------------------

std::string GetServerInfoTool::getDescription() const {
    return "Get basic server details and authentication status from Obsidian";
}

nlohmann::json GetServerInfoTool::getSchema() const {
    return objectSchema(nlohmann::json::object());
}

std::string GetServerInfoTool::execute(const nlohmann::json&) {
    return client.getServerInfo();
}

// ---------------------------------------------------------------------------
// list_vault_files
// ---------------------------------------------------------------------------

std::string ListVaultFilesTool::getDescription() const {
    return "List files in the vault root or a specific directory";
}

nlohmann::json ListVaultFilesTool::getSchema() const {
    return objectSchema({
        {"path", stringProperty("Directory path relative to vault root (optional, defaults to root)")}
    });
}

ListVaultFilesTool::Args ListVaultFilesTool::parseArgs(const nlohmann::json& args) {
    return {optionalString(args, "path", "")};
}

std::string ListVaultFilesTool::execute(const nlohmann::json& args) {
    Args a = parseArgs(args);
    return client.listVaultFiles(a.path);
}

// ---------------------------------------------------------------------------
// get_file_content
// ---------------------------------------------------------------------------

std::string GetFileContentTool::getDescription() const {
    return "Get the content of a specific file, supports both markdown and JSON format";
}

nlohmann::json GetFileContentTool::getSchema() const {
    return objectSchema({
        {"filename", stringProperty(FILENAME_DESCRIPTION)},
        {"format", enumProperty("Response format: 'markdown' (default) or 'json' (includes metadata)",
                                {"markdown", "json"})}
    }, {"filename"});
}

GetFileContentTool::Args GetFileContentTool::parseArgs(const nlohmann::json& args) {
    Args a;
    a.filename = requireString(args, "filename");
    a.format = optionalString(args, "format", "markdown");
    return a;
}

std::string GetFileContentTool::execute(const nlohmann::json& args) {
    Args a = parseArgs(args);
    return client.getFileContent(a.filename, a.format);
}

// ---------------------------------------------------------------------------
// create_or_update_file
// ---------------------------------------------------------------------------

std::string CreateOrUpdateFileTool::getDescription() const {
    return "Create a new file or update an existing one";
}

nlohmann::json CreateOrUpdateFileTool::getSchema() const {
    return objectSchema({
        {"filename", stringProperty(FILENAME_DESCRIPTION)},
        {"content", stringProperty("Content to write to the file")},
        {"contentType", stringProperty(CONTENT_TYPE_DESCRIPTION)}
    }, {"filename", "content"});
}

CreateOrUpdateFileTool::Args CreateOrUpdateFileTool::parseArgs(const nlohmann::json& args) {
    Args a;
    a.filename = requireString(args, "filename");
    a.content = requireString(args, "content");
    a.contentType = optionalString(args, "contentType", DEFAULT_CONTENT_TYPE);
    return a;
}

std::string CreateOrUpdateFileTool::execute(const nlohmann::json& args) {
    Args a = parseArgs(args);
    return client.createOrUpdateFile(a.filename, a.content, a.contentType);
}

// ---------------------------------------------------------------------------
// append_to_file
// ---------------------------------------------------------------------------

std::string AppendToFileTool::getDescription() const {
    return "Append content to the end of an existing file";
}

nlohmann::json AppendToFileTool::getSchema() const {
    return objectSchema({
        {"filename", stringProperty(FILENAME_DESCRIPTION)},
        {"content", stringProperty("Content to append to the file")}
    }, {"filename", "content"});
}

AppendToFileTool::Args AppendToFileTool::parseArgs(const nlohmann::json& args) {
    Args a;
    a.filename = requireString(args, "filename");
    a.content = requireString(args, "content");
    return a;
}

std::string AppendToFileTool::execute(const nlohmann::json& args) {
    Args a = parseArgs(args);
    return client.appendToFile(a.filename, a.content);
}

// ---------------------------------------------------------------------------
// patch_file_content
// ---------------------------------------------------------------------------

std::string PatchFileContentTool::getDescription() const {
    return "Insert content relative to headings, blocks, or frontmatter fields";
}

nlohmann::json PatchFileContentTool::getSchema() const {
    return objectSchema({
        {"filename", stringProperty(FILENAME_DESCRIPTION)},
        {"operation", enumProperty("Patch operation to perform", {"append", "prepend", "replace"})},
        {"targetType", enumProperty("Type of target to patch", {"heading", "block", "frontmatter"})},
        {"target", stringProperty("Target to patch (heading path, block ID, or frontmatter field)")},
        {"content", stringProperty("Content to insert")},
        {"contentType", stringProperty(CONTENT_TYPE_DESCRIPTION)},
        {"delimiter", stringProperty("Delimiter for nested targets (defaults to '::')")}
    }, {"filename", "operation", "targetType", "target", "content"});
}

PatchFileContentTool::Args PatchFileContentTool::parseArgs(const nlohmann::json& args) {
    Args a;
    a.filename = requireString(args, "filename");
    a.operation = requireString(args, "operation");
    a.targetType = requireString(args, "targetType");
    a.target = requireString(args, "target");
    a.content = requireString(args, "content");
    a.contentType = optionalString(args, "contentType", DEFAULT_CONTENT_TYPE);
    a.delimiter = optionalString(args, "delimiter", "::");
    return a;
}

std::string PatchFileContentTool::execute(const nlohmann::json& args) {
    Args a = parseArgs(args);
    return client.patchFileContent(a.filename, a.operation, a.targetType, a.target,
                                   a.content, a.contentType, a.delimiter);
}

// ---------------------------------------------------------------------------
// delete_file
// ---------------------------------------------------------------------------

std::string DeleteFileTool::getDescription() const {
    return "Delete a specific file from the vault";
}

nlohmann::json DeleteFileTool::getSchema() const {
    return objectSchema({
        {"filename", stringProperty(FILENAME_DESCRIPTION)}
    }, {"filename"});
}

DeleteFileTool::Args DeleteFileTool::parseArgs(const nlohmann::json& args) {
    return {requireString(args, "filename")};
}

std::string DeleteFileTool::execute(const nlohmann::json& args) {
    Args a = parseArgs(args);
    return client.deleteFile(a.filename);
}

// ---------------------------------------------------------------------------
// search_vault_simple
// ---------------------------------------------------------------------------

std::string SearchVaultSimpleTool::getDescription() const {
    return "Simple text search across the vault";
}

nlohmann::json SearchVaultSimpleTool::getSchema() const {
    return objectSchema({
        {"query", stringProperty("Search query")},
        {"contextLength", {
            {"type", "integer"},
            {"description", "Amount of context to return around matches (default: 100)"}
        }}
    }, {"query"});
}

SearchVaultSimpleTool::Args SearchVaultSimpleTool::parseArgs(const nlohmann::json& args) {
    Args a;
    a.query = requireString(args, "query");
    a.contextLength = optionalInt(args, "contextLength", 100);
    return a;
}

std::string SearchVaultSimpleTool::execute(const nlohmann::json& args) {
    Args a = parseArgs(args);
    return client.searchVaultSimple(a.query, a.contextLength);
}

// ---------------------------------------------------------------------------
// search_vault_advanced
// ---------------------------------------------------------------------------

std::string SearchVaultAdvancedTool::getDescription() const {
    return "Advanced search using Dataview DQL or JsonLogic queries";
}

nlohmann::json SearchVaultAdvancedTool::getSchema() const {
    return objectSchema({
        {"query", stringProperty("Search query (DQL or JsonLogic)")},
        {"queryType", enumProperty("Query type", {"dataview", "jsonlogic"})}
    }, {"query", "queryType"});
}

SearchVaultAdvancedTool::Args SearchVaultAdvancedTool::parseArgs(const nlohmann::json& args) {
    Args a;
    a.query = requireString(args, "query");
    a.queryType = requireString(args, "queryType");
    return a;
}

std::string SearchVaultAdvancedTool::execute(const nlohmann::json& args) {
    Args a = parseArgs(args);
    return client.searchVaultAdvanced(a.query, a.queryType);
}

// ---------------------------------------------------------------------------
// list_commands
// ---------------------------------------------------------------------------

std::string ListCommandsTool::getDescription() const {
    return "Get a list of available Obsidian commands";
}

nlohmann::json ListCommandsTool::getSchema() const {
    return objectSchema(nlohmann::json::object());
}

std::string ListCommandsTool::execute(const nlohmann::json&) {
    return client.listCommands();
}

// ---------------------------------------------------------------------------
// execute_command
// ---------------------------------------------------------------------------

std::string ExecuteCommandTool::getDescription() const {
    return "Execute a specific Obsidian command";
}

nlohmann::json ExecuteCommandTool::getSchema() const {
    return objectSchema({
        {"commandId", stringProperty("ID of the command to execute")}
    }, {"commandId"});
}

ExecuteCommandTool::Args ExecuteCommandTool::parseArgs(const nlohmann::json& args) {
    return {requireString(args, "commandId")};
}

std::string ExecuteCommandTool::execute(const nlohmann::json& args) {
    Args a = parseArgs(args);
    return client.executeCommand(a.commandId);
}

// ---------------------------------------------------------------------------
// open_file
// ---------------------------------------------------------------------------

std::string OpenFileTool::getDescription() const {
    return "Open a file in the Obsidian UI";
}

nlohmann::json OpenFileTool::getSchema() const {
    return objectSchema({
        {"filename", stringProperty(FILENAME_DESCRIPTION)},
        {"newLeaf", {
            {"type", "boolean"},
            {"description", "Open in a new leaf (default: false)"}
        }}
    }, {"filename"});
}

OpenFileTool::Args OpenFileTool::parseArgs(const nlohmann::json& args) {
    Args a;
    a.filename = requireString(args, "filename");
    a.newLeaf = optionalBool(args, "newLeaf", false);
    return a;
}

std::string OpenFileTool::execute(const nlohmann::json& args) {
    Args a = parseArgs(args);
    return client.openFile(a.filename, a.newLeaf);
}

void registerVaultTools(ToolRegistry& registry, ObsidianClient& client) {
    registry.registerTool(std::make_unique<GetServerInfoTool>(client));
    registry.registerTool(std::make_unique<ListVaultFilesTool>(client));
    registry.registerTool(std::make_unique<GetFileContentTool>(client));
    registry.registerTool(std::make_unique<CreateOrUpdateFileTool>(client));
    registry.registerTool(std::make_unique<AppendToFileTool>(client));
    registry.registerTool(std::make_unique<PatchFileContentTool>(client));
    registry.registerTool(std::make_unique<DeleteFileTool>(client));
    registry.registerTool(std::make_unique<SearchVaultSimpleTool>(client));
    registry.registerTool(std::make_unique<SearchVaultAdvancedTool>(client));
    registry.registerTool(std::make_unique<ListCommandsTool>(client));
    registry.registerTool(std::make_unique<ExecuteCommandTool>(client));
    registry.registerTool(std::make_unique<OpenFileTool>(client));
}
