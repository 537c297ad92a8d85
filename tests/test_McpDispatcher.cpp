#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "RecordingObsidianClient.h"
#include "mcp/McpDispatcher.h"
#include "tools/ToolRegistry.h"
#include "tools/VaultTools.h"

namespace {
McpRequest makeRequest(const nlohmann::json& id, const std::string& method,
                       const nlohmann::json& params = nlohmann::json::object()) {
    McpRequest req;
    req.jsonrpc = "2.0";
    req.id = id;
    req.method = method;
    req.params = params;
    return req;
}

std::string errorMessage(const McpResponse& res) {
    return res.getError() ? res.getError()->message : "";
}
} // namespace

class McpDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        registerVaultTools(registry, client);
    }

    McpResponse call(const nlohmann::json& id, const std::string& method,
                     const nlohmann::json& params = nlohmann::json::object()) {
        auto res = dispatcher.handle(makeRequest(id, method, params));
        EXPECT_TRUE(res.has_value()) << method << " produced no response";
        return *res;
    }

    RecordingObsidianClient client;
    ToolRegistry registry;
    McpDispatcher dispatcher{registry};
};

TEST_F(McpDispatcherTest, InitializeAnnouncesCapabilities) {
    auto res = call(1, "initialize");
    ASSERT_FALSE(res.isError());
    const auto& result = res.getResult();
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(result["capabilities"]["tools"].is_object());
    EXPECT_EQ(result["serverInfo"]["name"], "obsidian-mcp-server");
    EXPECT_EQ(result["serverInfo"]["version"], "1.0.0");
}

TEST_F(McpDispatcherTest, InitializeIgnoresClientParams) {
    auto res = call("init", "initialize", {
        {"protocolVersion", "1999-01-01"},
        {"capabilities", {{"roots", {{"listChanged", true}}}}},
        {"clientInfo", {{"name", "test"}, {"version", "0"}}}
    });
    EXPECT_EQ(res.getResult()["protocolVersion"], "2024-11-05");
}

TEST_F(McpDispatcherTest, PingReturnsEmptyObject) {
    auto res = call(2, "ping");
    ASSERT_FALSE(res.isError());
    EXPECT_EQ(res.getResult(), nlohmann::json::object());
    EXPECT_EQ(res.getId(), 2);
}

TEST_F(McpDispatcherTest, ToolsListReturnsCatalog) {
    auto first = call(3, "tools/list");
    auto second = call(4, "tools/list");
    ASSERT_EQ(first.getResult()["tools"].size(), 12u);
    EXPECT_EQ(first.getResult()["tools"], second.getResult()["tools"]);
    EXPECT_EQ(first.getResult()["tools"][0]["name"], "get_server_info");
    EXPECT_TRUE(first.getResult()["tools"][0].contains("inputSchema"));
}

TEST_F(McpDispatcherTest, UnknownMethodIsMethodNotFound) {
    auto res = call(5, "resources/list");
    ASSERT_TRUE(res.isError());
    EXPECT_EQ(res.getError()->code, -32601);
    EXPECT_EQ(res.getError()->message, "Method not found");
    EXPECT_EQ(res.getError()->data, "resources/list");
    EXPECT_EQ(res.getId(), 5);
}

TEST_F(McpDispatcherTest, CallWithoutNameIsInvalidParams) {
    auto res = call(6, "tools/call", {{"arguments", nlohmann::json::object()}});
    ASSERT_TRUE(res.isError());
    EXPECT_EQ(res.getError()->code, -32602);
    EXPECT_EQ(errorMessage(res), "Invalid params: missing tool name");

    auto nonString = call(7, "tools/call", {{"name", 12}});
    EXPECT_EQ(nonString.getError()->code, -32602);
}

TEST_F(McpDispatcherTest, UnknownToolIsInternalError) {
    auto res = call(8, "tools/call", {{"name", "nonexistent_tool"}, {"arguments", nlohmann::json::object()}});
    ASSERT_TRUE(res.isError());
    EXPECT_EQ(res.getError()->code, -32603);
    EXPECT_NE(errorMessage(res).find("nonexistent_tool"), std::string::npos);
    EXPECT_NE(errorMessage(res).find("unknown tool"), std::string::npos);
}

TEST_F(McpDispatcherTest, MissingArgumentIsInternalError) {
    auto res = call(9, "tools/call", {{"name", "get_file_content"}, {"arguments", nlohmann::json::object()}});
    ASSERT_TRUE(res.isError());
    EXPECT_EQ(res.getError()->code, -32603);
    EXPECT_EQ(errorMessage(res), "filename is required");
    EXPECT_TRUE(client.calls.empty());
}

TEST_F(McpDispatcherTest, MissingArgumentsObjectMeansEmpty) {
    auto res = call(10, "tools/call", {{"name", "get_file_content"}});
    EXPECT_EQ(errorMessage(res), "filename is required");

    client.nextBody = R"({"ok": "OK"})";
    auto ok = call(11, "tools/call", {{"name", "get_server_info"}, {"arguments", "ignored"}});
    EXPECT_FALSE(ok.isError());
}

TEST_F(McpDispatcherTest, SuccessfulCallWrapsTextContent) {
    client.nextBody = "# Note\nbody";
    auto res = call("abc", "tools/call", {
        {"name", "get_file_content"},
        {"arguments", {{"filename", "note.md"}}}
    });
    ASSERT_FALSE(res.isError()) << errorMessage(res);
    EXPECT_EQ(res.getId(), "abc");

    const auto& content = res.getResult()["content"];
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0]["type"], "text");
    EXPECT_EQ(content[0]["text"], "# Note\nbody");

    ASSERT_EQ(client.calls.size(), 1u);
    EXPECT_EQ(client.calls[0].method, "GET");
    EXPECT_EQ(client.calls[0].target, "/vault/note.md");
}

TEST_F(McpDispatcherTest, BackendFailureIsInternalErrorWithStatus) {
    client.failWithStatus = 404;
    auto res = call(12, "tools/call", {{"name", "get_file_content"}, {"arguments", {{"filename", "x.md"}}}});
    ASSERT_TRUE(res.isError());
    EXPECT_EQ(res.getError()->code, -32603);
    EXPECT_NE(errorMessage(res).find("404"), std::string::npos);
}

TEST_F(McpDispatcherTest, UnsupportedQueryTypeFailsLocally) {
    auto res = call(13, "tools/call", {
        {"name", "search_vault_advanced"},
        {"arguments", {{"query", "x"}, {"queryType", "regex"}}}
    });
    ASSERT_TRUE(res.isError());
    EXPECT_EQ(res.getError()->code, -32603);
    EXPECT_NE(errorMessage(res).find("unsupported query type"), std::string::npos);
    EXPECT_TRUE(client.calls.empty());
}

TEST_F(McpDispatcherTest, IdIsEchoedForEveryKind) {
    for (const nlohmann::json& id : {nlohmann::json(0), nlohmann::json(42), nlohmann::json("req-7"), nlohmann::json(nullptr)}) {
        EXPECT_EQ(call(id, "ping").getId(), id);
        EXPECT_EQ(call(id, "bogus").getId(), id);
        EXPECT_EQ(call(id, "tools/call").getId(), id);
    }
}

TEST_F(McpDispatcherTest, ResponseJsonCarriesExactlyOneOfResultOrError) {
    auto ok = call(1, "ping").toJson();
    EXPECT_TRUE(ok.contains("result"));
    EXPECT_FALSE(ok.contains("error"));
    EXPECT_EQ(ok["jsonrpc"], "2.0");

    auto bad = call(1, "nope").toJson();
    EXPECT_FALSE(bad.contains("result"));
    EXPECT_TRUE(bad.contains("error"));
}
