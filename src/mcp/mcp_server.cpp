#include "mcp_server.hpp"
#include "render.hpp"
#include "../config.hpp"
#include <iostream>
#include <stdexcept>

namespace memcat {

const std::vector<ToolBinding>& default_tool_bindings() {
    static const std::vector<ToolBinding> bindings = {
        {"save_memory",       "save",             "Save Memory"},
        {"retrieve_memories", "retrieveMemories", "Retrieve Memories"},
        {"categorize_text",   "categorizeText",   "Categorize Text"},
        {"delete_memory",     "deleteMemory",     "Delete Memory"},
        {"search_memories",   "searchMemories",   "Search Memories"},
        {"get_memory_stats",  "getMemoryStats",   "Memory Statistics"},
    };
    return bindings;
}

std::string guide_text() {
    return "MCP MEMORY SYSTEM GUIDE\n"
           "=======================\n"
           "\n"
           "This server stores memories per user and categorizes them automatically.\n"
           "\n"
           "CATEGORIES:\n"
           "- personal: personal information, family, hobbies\n"
           "- professional: work, career, business\n"
           "- technical: code, programming, technology\n"
           "- general: general knowledge, everything else\n"
           "\n"
           "TOOLS:\n"
           "1. save_memory: save a new memory with automatic categorization\n"
           "2. retrieve_memories: list memories, most recent first, optionally by category\n"
           "3. categorize_text: categorize a text without saving it\n"
           "4. delete_memory: remove a specific memory by id\n"
           "5. search_memories: keyword search (case-insensitive, up to 10 results)\n"
           "6. get_memory_stats: usage statistics per category\n"
           "\n"
           "Memories live in process memory only and are lost on restart.\n";
}

McpServer::McpServer(const OperationTable& ops, const Config& config)
    : ops_(ops)
    , server_name_(config.server_name)
    , server_version_(config.server_version)
    , debug_(config.debug)
    , bindings_(default_tool_bindings())
{}

nlohmann::ordered_json McpServer::make_result(const nlohmann::ordered_json& id,
                                              const nlohmann::ordered_json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::ordered_json McpServer::make_error(const nlohmann::ordered_json& id, int code,
                                             const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

std::optional<std::string> McpServer::handle_text(const std::string& text) const {
    nlohmann::ordered_json message;
    try {
        message = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error(nullptr, rpc_error::PARSE_ERROR,
                          std::string("Parse error: ") + e.what()).dump();
    }

    auto response = handle(message);
    if (!response) return std::nullopt;
    return response->dump();
}

std::optional<nlohmann::ordered_json> McpServer::handle(const nlohmann::ordered_json& message) const {
    if (!message.is_array()) return handle_single(message);

    // Batch: answer each request, skip notifications
    if (message.empty()) {
        return make_error(nullptr, rpc_error::INVALID_REQUEST, "Empty batch");
    }
    nlohmann::ordered_json responses = nlohmann::ordered_json::array();
    for (const auto& item : message) {
        if (auto r = handle_single(item)) responses.push_back(std::move(*r));
    }
    if (responses.empty()) return std::nullopt;
    return responses;
}

std::optional<nlohmann::ordered_json> McpServer::handle_single(const nlohmann::ordered_json& request) const {
    if (!request.is_object()) {
        return make_error(nullptr, rpc_error::INVALID_REQUEST, "Request must be an object");
    }

    nlohmann::ordered_json id = request.contains("id") ? request["id"] : nlohmann::ordered_json();
    bool is_notification = !request.contains("id");

    // Malformed notifications are dropped like any other notification
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        if (is_notification) return std::nullopt;
        return make_error(id, rpc_error::INVALID_REQUEST, "Missing or invalid jsonrpc version");
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        if (is_notification) return std::nullopt;
        return make_error(id, rpc_error::INVALID_REQUEST, "Missing or invalid method");
    }

    std::string method = request["method"].get<std::string>();
    nlohmann::ordered_json params = request.contains("params") ? request["params"]
                                                               : nlohmann::ordered_json::object();

    if (debug_) {
        std::cerr << "[mcp] " << method << (is_notification ? " (notification)" : "") << "\n";
    }

    // Notifications never get a response
    if (is_notification) return std::nullopt;

    if (method == "initialize") {
        return handle_initialize(id);
    } else if (method == "ping") {
        return make_result(id, nlohmann::ordered_json::object());
    } else if (method == "tools/list") {
        return make_result(id, {{"tools", tools_list()}});
    } else if (method == "tools/call") {
        return handle_tools_call(params, id);
    } else if (method == "resources/list") {
        nlohmann::ordered_json resources = nlohmann::ordered_json::array();
        resources.push_back({
            {"uri", kGuideUri},
            {"name", "Memory System Guide"},
            {"description", "How to use the memory and categorization tools"},
            {"mimeType", "text/plain"}
        });
        return make_result(id, {{"resources", resources}});
    } else if (method == "resources/read") {
        return handle_resources_read(params, id);
    }

    return make_error(id, rpc_error::METHOD_NOT_FOUND, "Method not found: " + method);
}

nlohmann::ordered_json McpServer::handle_initialize(const nlohmann::ordered_json& id) const {
    nlohmann::ordered_json result = {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", {
            {"tools", {{"listChanged", true}}},
            {"resources", {{"subscribe", false}, {"listChanged", false}}}
        }},
        {"serverInfo", {
            {"name", server_name_},
            {"version", server_version_}
        }}
    };
    return make_result(id, result);
}

const ToolBinding* McpServer::find_binding(const std::string& tool_name) const {
    for (const auto& b : bindings_) {
        if (b.tool_name == tool_name) return &b;
    }
    return nullptr;
}

nlohmann::ordered_json McpServer::tools_list() const {
    auto specs = ops_.specs();
    nlohmann::ordered_json tools = nlohmann::ordered_json::array();
    for (const auto& b : bindings_) {
        for (const auto& spec : specs) {
            if (spec.name != b.operation) continue;
            tools.push_back({
                {"name", b.tool_name},
                {"title", b.title},
                {"description", spec.description},
                {"inputSchema", nlohmann::ordered_json::parse(spec.parameters_json)}
            });
            break;
        }
    }
    return tools;
}

nlohmann::ordered_json McpServer::call_tool(const std::string& tool_name,
                                            const nlohmann::ordered_json& arguments) const {
    const ToolBinding* binding = find_binding(tool_name);
    if (!binding) {
        throw std::invalid_argument("Unknown tool: " + tool_name);
    }

    OperationResult result = ops_.dispatch(binding->operation, arguments);

    nlohmann::ordered_json content = nlohmann::ordered_json::array();
    content.push_back({{"type", "text"}, {"text", render_result(binding->operation, result)}});

    nlohmann::ordered_json out = {{"content", content}};
    if (result.success) out["structuredContent"] = result.value;
    out["isError"] = !result.success;
    return out;
}

nlohmann::ordered_json McpServer::handle_tools_call(const nlohmann::ordered_json& params,
                                                    const nlohmann::ordered_json& id) const {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return make_error(id, rpc_error::INVALID_PARAMS, "tools/call requires a string 'name'");
    }
    std::string name = params["name"].get<std::string>();
    nlohmann::ordered_json arguments = params.contains("arguments") ? params["arguments"]
                                                                    : nlohmann::ordered_json::object();

    const ToolBinding* binding = find_binding(name);
    if (!binding || !ops_.has(binding->operation)) {
        std::cerr << "[mcp] tools/call rejected: unknown tool " << name << "\n";
        return make_error(id, rpc_error::INVALID_PARAMS, "Unknown tool: " + name);
    }

    try {
        return make_result(id, call_tool(name, arguments));
    } catch (const std::exception& e) {
        std::cerr << "[mcp] tools/call " << name << " failed: " << e.what() << "\n";
        return make_error(id, rpc_error::INTERNAL_ERROR, e.what());
    }
}

nlohmann::ordered_json McpServer::handle_resources_read(const nlohmann::ordered_json& params,
                                                        const nlohmann::ordered_json& id) const {
    std::string uri;
    if (params.is_object() && params.contains("uri") && params["uri"].is_string()) {
        uri = params["uri"].get<std::string>();
    }
    if (uri != kGuideUri) {
        return make_error(id, rpc_error::INVALID_PARAMS, "Unknown resource: " + uri);
    }

    nlohmann::ordered_json contents = nlohmann::ordered_json::array();
    contents.push_back({
        {"uri", uri},
        {"mimeType", "text/plain"},
        {"text", guide_text()}
    });
    return make_result(id, {{"contents", contents}});
}

} // namespace memcat
