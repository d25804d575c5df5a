#pragma once
#include "../dispatcher.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace memcat {

struct Config;

// JSON-RPC 2.0 error codes
namespace rpc_error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
}

inline constexpr const char* kMcpProtocolVersion = "2025-06-18";
inline constexpr const char* kGuideUri = "memory://guide";

// Public tool name on the wire -> operation name in the table.
struct ToolBinding {
    std::string tool_name;
    std::string operation;
    std::string title;
};

const std::vector<ToolBinding>& default_tool_bindings();

// Model Context Protocol adapter over an OperationTable. Transport-agnostic:
// it maps one JSON-RPC message to at most one response. Holds no per-session
// state, so one instance can serve every transport at once.
class McpServer {
public:
    McpServer(const OperationTable& ops, const Config& config);

    // Handle a parsed message. Returns std::nullopt for notifications.
    std::optional<nlohmann::ordered_json> handle(const nlohmann::ordered_json& message) const;

    // Parse and handle raw text; parse failures become JSON-RPC errors.
    std::optional<std::string> handle_text(const std::string& text) const;

    nlohmann::ordered_json tools_list() const;

    // Run a tool by its wire name. Throws std::invalid_argument for a name
    // tools_list() does not advertise.
    nlohmann::ordered_json call_tool(const std::string& tool_name,
                                     const nlohmann::ordered_json& arguments) const;

    static nlohmann::ordered_json make_result(const nlohmann::ordered_json& id,
                                              const nlohmann::ordered_json& result);
    static nlohmann::ordered_json make_error(const nlohmann::ordered_json& id, int code,
                                             const std::string& message);

private:
    std::optional<nlohmann::ordered_json> handle_single(const nlohmann::ordered_json& request) const;
    nlohmann::ordered_json handle_initialize(const nlohmann::ordered_json& id) const;
    nlohmann::ordered_json handle_tools_call(const nlohmann::ordered_json& params,
                                             const nlohmann::ordered_json& id) const;
    nlohmann::ordered_json handle_resources_read(const nlohmann::ordered_json& params,
                                                 const nlohmann::ordered_json& id) const;
    const ToolBinding* find_binding(const std::string& tool_name) const;

    const OperationTable& ops_;
    std::string server_name_;
    std::string server_version_;
    bool debug_ = false;
    std::vector<ToolBinding> bindings_;
};

// Text of the memory://guide resource
std::string guide_text();

} // namespace memcat
