#include <catch2/catch.hpp>
#include "mcp/mcp_server.hpp"
#include "mcp/render.hpp"
#include "config.hpp"
#include "memory.hpp"
#include "classifier.hpp"
#include <memory>
#include <stdexcept>

using namespace memcat;
using ojson = nlohmann::ordered_json;

namespace {

// Stands in for an operation whose own code throws std::invalid_argument.
class ThrowingOperation : public Operation {
public:
    explicit ThrowingOperation(std::string name) : name_(std::move(name)) {}
    OperationResult execute(const ojson&) override {
        throw std::invalid_argument("bad state inside operation");
    }
    std::string name() const override { return name_; }
    std::string description() const override { return "throws"; }
    std::string parameters_json() const override { return R"({"type":"object"})"; }

private:
    std::string name_;
};

struct McpFixture {
    Classifier classifier;
    MemoryStore store{classifier};
    OperationTable ops = create_operation_table(store);
    Config config;
    McpServer server{ops, config};

    ojson request(const std::string& method, ojson params = ojson::object(), int id = 1) {
        ojson msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
        if (!params.empty()) msg["params"] = std::move(params);
        auto r = server.handle(msg);
        REQUIRE(r.has_value());
        return *r;
    }

    ojson call(const std::string& tool, ojson args) {
        return request("tools/call", {{"name", tool}, {"arguments", std::move(args)}});
    }
};

} // namespace

// ── Protocol ─────────────────────────────────────────────────────

TEST_CASE("McpServer: initialize reports server info", "[mcp]") {
    McpFixture f;
    auto r = f.request("initialize", {{"protocolVersion", kMcpProtocolVersion}});
    REQUIRE(r["jsonrpc"] == "2.0");
    REQUIRE(r["id"] == 1);
    REQUIRE(r["result"]["protocolVersion"] == kMcpProtocolVersion);
    REQUIRE(r["result"]["serverInfo"]["name"] == "Memory Agent MCP");
    REQUIRE(r["result"]["capabilities"].contains("tools"));
}

TEST_CASE("McpServer: ping", "[mcp]") {
    McpFixture f;
    auto r = f.request("ping");
    REQUIRE(r["result"] == ojson::object());
}

TEST_CASE("McpServer: notifications get no response", "[mcp]") {
    McpFixture f;
    ojson note = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    REQUIRE_FALSE(f.server.handle(note).has_value());
}

TEST_CASE("McpServer: malformed notifications get no response", "[mcp]") {
    McpFixture f;
    REQUIRE_FALSE(f.server.handle({{"jsonrpc", "1.0"}, {"method", "ping"}}).has_value());
    REQUIRE_FALSE(f.server.handle({{"method", "ping"}}).has_value());
    REQUIRE_FALSE(f.server.handle({{"jsonrpc", "2.0"}, {"method", 5}}).has_value());
    REQUIRE_FALSE(f.server.handle({{"jsonrpc", "2.0"}}).has_value());
    REQUIRE_FALSE(f.server.handle_text(R"({"jsonrpc":"3.0","method":"x"})").has_value());
}

TEST_CASE("McpServer: unknown method", "[mcp]") {
    McpFixture f;
    auto r = f.request("tools/destroy");
    REQUIRE(r["error"]["code"] == rpc_error::METHOD_NOT_FOUND);
}

TEST_CASE("McpServer: invalid requests", "[mcp]") {
    McpFixture f;

    auto no_version = f.server.handle({{"id", 1}, {"method", "ping"}});
    REQUIRE(no_version.has_value());
    REQUIRE((*no_version)["error"]["code"] == rpc_error::INVALID_REQUEST);

    auto bad_method = f.server.handle({{"jsonrpc", "2.0"}, {"id", 2}, {"method", 42}});
    REQUIRE((*bad_method)["error"]["code"] == rpc_error::INVALID_REQUEST);
    REQUIRE((*bad_method)["id"] == 2);

    auto scalar = f.server.handle(ojson(7));
    REQUIRE((*scalar)["error"]["code"] == rpc_error::INVALID_REQUEST);
    REQUIRE((*scalar)["id"].is_null());
}

TEST_CASE("McpServer: handle_text reports parse errors", "[mcp]") {
    McpFixture f;
    auto r = f.server.handle_text("{not json");
    REQUIRE(r.has_value());
    auto j = ojson::parse(*r);
    REQUIRE(j["error"]["code"] == rpc_error::PARSE_ERROR);
    REQUIRE(j["id"].is_null());
}

TEST_CASE("McpServer: batches answer requests and skip notifications", "[mcp]") {
    McpFixture f;
    ojson batch = ojson::array();
    batch.push_back({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}});
    batch.push_back({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    batch.push_back({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "ping"}});

    auto r = f.server.handle(batch);
    REQUIRE(r.has_value());
    REQUIRE(r->is_array());
    REQUIRE(r->size() == 2);
    REQUIRE((*r)[1]["id"] == 2);

    auto empty = f.server.handle(ojson::array());
    REQUIRE((*empty)["error"]["code"] == rpc_error::INVALID_REQUEST);
}

// ── Tools ────────────────────────────────────────────────────────

TEST_CASE("McpServer: tools/list exposes the six tools", "[mcp]") {
    McpFixture f;
    auto r = f.request("tools/list");
    const auto& tools = r["result"]["tools"];
    REQUIRE(tools.size() == 6);
    REQUIRE(tools[0]["name"] == "save_memory");
    REQUIRE(tools[5]["name"] == "get_memory_stats");
    for (const auto& t : tools) {
        REQUIRE(t["inputSchema"]["type"] == "object");
        REQUIRE_FALSE(t["description"].get<std::string>().empty());
    }
}

TEST_CASE("McpServer: save_memory then retrieve_memories", "[mcp]") {
    McpFixture f;
    auto saved = f.call("save_memory", {{"content", "Reunião com cliente"}, {"user_id", "u1"}});
    REQUIRE(saved["result"]["isError"] == false);
    REQUIRE(saved["result"]["structuredContent"]["memory"]["category"] == "professional");
    auto text = saved["result"]["content"][0]["text"].get<std::string>();
    REQUIRE(text.rfind("Memory saved.", 0) == 0);

    auto listed = f.call("retrieve_memories", {{"user_id", "u1"}});
    REQUIRE(listed["result"]["structuredContent"]["count"] == 1);
}

TEST_CASE("McpServer: only advertised tool names are callable", "[mcp]") {
    McpFixture f;
    for (const char* name : {"save", "categorizeText", "getMemoryStats"}) {
        auto r = f.call(name, {{"text", "bug na api"}, {"content", "algo"}});
        REQUIRE(r["error"]["code"] == rpc_error::INVALID_PARAMS);
        REQUIRE(r["error"]["message"] == std::string("Unknown tool: ") + name);
    }
    REQUIRE(f.store.count("default") == 0);

    auto ok = f.call("categorize_text", {{"text", "bug na api"}});
    REQUIRE(ok["result"]["structuredContent"]["category"] == "technical");
}

TEST_CASE("McpServer: validation errors are tool results", "[mcp]") {
    McpFixture f;
    auto r = f.call("save_memory", ojson::object());
    REQUIRE_FALSE(r.contains("error"));
    REQUIRE(r["result"]["isError"] == true);
    REQUIRE_FALSE(r["result"].contains("structuredContent"));
    REQUIRE(r["result"]["content"][0]["text"] == "Error: Missing required parameter: content");
}

TEST_CASE("McpServer: unknown tool is invalid params", "[mcp]") {
    McpFixture f;
    auto r = f.call("wipe_everything", ojson::object());
    REQUIRE(r["error"]["code"] == rpc_error::INVALID_PARAMS);
    REQUIRE(r["error"]["message"] == "Unknown tool: wipe_everything");

    REQUIRE_THROWS_AS(f.server.call_tool("wipe_everything", ojson::object()),
                      std::invalid_argument);
}

TEST_CASE("McpServer: invalid_argument inside a tool is an internal error", "[mcp]") {
    OperationTable ops;
    ops.add(std::make_unique<ThrowingOperation>("save"));
    Config config;
    McpServer server(ops, config);

    auto r = server.handle({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"},
                            {"params", {{"name", "save_memory"}, {"arguments", ojson::object()}}}});
    REQUIRE(r.has_value());
    REQUIRE((*r)["error"]["code"] == rpc_error::INTERNAL_ERROR);
    REQUIRE((*r)["error"]["message"] == "bad state inside operation");
}

TEST_CASE("McpServer: advertised tool missing from the table is unknown", "[mcp]") {
    OperationTable ops;
    ops.add(std::make_unique<ThrowingOperation>("save"));
    Config config;
    McpServer server(ops, config);

    auto r = server.handle({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"},
                            {"params", {{"name", "search_memories"}, {"arguments", ojson::object()}}}});
    REQUIRE((*r)["error"]["code"] == rpc_error::INVALID_PARAMS);
    REQUIRE((*r)["error"]["message"] == "Unknown tool: search_memories");
}

TEST_CASE("McpServer: tools/call without a name", "[mcp]") {
    McpFixture f;
    auto r = f.request("tools/call", {{"arguments", ojson::object()}});
    REQUIRE(r["error"]["code"] == rpc_error::INVALID_PARAMS);
}

// ── Resources ────────────────────────────────────────────────────

TEST_CASE("McpServer: guide resource", "[mcp]") {
    McpFixture f;
    auto list = f.request("resources/list");
    REQUIRE(list["result"]["resources"][0]["uri"] == kGuideUri);

    auto read = f.request("resources/read", {{"uri", kGuideUri}});
    REQUIRE(read["result"]["contents"][0]["text"] == guide_text());

    auto missing = f.request("resources/read", {{"uri", "memory://nope"}});
    REQUIRE(missing["error"]["code"] == rpc_error::INVALID_PARAMS);
}

// ── Rendering ────────────────────────────────────────────────────

TEST_CASE("render_result: retrieve and search messages", "[mcp][render]") {
    McpFixture f;

    auto none = f.ops.dispatch("retrieveMemories", {{"user_id", "u1"}});
    REQUIRE(render_result("retrieveMemories", none) == "No memories found");

    auto none_cat = f.ops.dispatch("retrieveMemories", {{"user_id", "u1"}, {"category", "technical"}});
    REQUIRE(render_result("retrieveMemories", none_cat) == "No memories found in category 'technical'");

    f.ops.dispatch("save", {{"content", "bug na api"}, {"user_id", "u1"}});
    auto one = f.ops.dispatch("retrieveMemories", {{"user_id", "u1"}});
    auto text = render_result("retrieveMemories", one);
    REQUIRE(text.rfind("1 memory(ies) found:", 0) == 0);
    REQUIRE(text.find("[TECHNICAL]") != std::string::npos);

    auto miss = f.ops.dispatch("searchMemories", {{"query", "python"}, {"user_id", "u1"}});
    REQUIRE(render_result("searchMemories", miss) == "No memories found matching 'python'");
}

TEST_CASE("render_result: delete messages", "[mcp][render]") {
    McpFixture f;
    auto no_user = f.ops.dispatch("deleteMemory", {{"memory_id", "mem_1"}, {"user_id", "ghost"}});
    REQUIRE(render_result("deleteMemory", no_user) == "User 'ghost' not found");

    f.ops.dispatch("save", {{"content", "algo"}, {"user_id", "u1"}});
    auto no_mem = f.ops.dispatch("deleteMemory", {{"memory_id", "mem_1"}, {"user_id", "u1"}});
    REQUIRE(render_result("deleteMemory", no_mem) == "Memory mem_1 not found");
}

TEST_CASE("render_result: stats text", "[mcp][render]") {
    McpFixture f;
    REQUIRE(render_result("getMemoryStats", f.ops.dispatch("getMemoryStats", ojson::object())) ==
            "No memories stored yet");

    f.ops.dispatch("save", {{"content", "projeto"}});
    f.ops.dispatch("save", {{"content", "cliente"}});
    f.ops.dispatch("save", {{"content", "família"}});
    auto text = render_result("getMemoryStats", f.ops.dispatch("getMemoryStats", ojson::object()));
    REQUIRE(text.rfind("MEMORY STATISTICS\n", 0) == 0);
    REQUIRE(text.find("Total memories: 3") != std::string::npos);
    REQUIRE(text.find("  - PERSONAL: 1 (33.3%)") != std::string::npos);
    REQUIRE(text.find("  - PROFESSIONAL: 2 (66.7%)") != std::string::npos);
}

TEST_CASE("format_percentage: one decimal", "[mcp][render]") {
    REQUIRE(format_percentage(100.0) == "100.0");
    REQUIRE(format_percentage(2.0 / 3.0 * 100.0) == "66.7");
    REQUIRE(format_percentage(0.04) == "0.0");
}
