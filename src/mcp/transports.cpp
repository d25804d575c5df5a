#include "transports.hpp"
#include "../util.hpp"
#include <string>

namespace memcat {

size_t run_stdio(const McpServer& server, std::istream& in, std::ostream& out,
                 const std::atomic<bool>& stop) {
    size_t handled = 0;
    std::string line;
    while (!stop.load() && std::getline(in, line)) {
        std::string msg = trim(line);
        if (msg.empty()) continue;

        handled++;
        if (auto response = server.handle_text(msg)) {
            out << *response << "\n" << std::flush;
        }
    }
    return handled;
}

static bool is_rpc_path(const std::string& path) {
    return path == "/mcp" || path == "/mc" || path == "/";
}

HttpResponse handle_http_request(const McpServer& server, const HttpRequest& req) {
    if (req.method == "OPTIONS") {
        return {204, "text/plain", ""};
    }

    if (req.path == "/health") {
        if (req.method != "GET") return {405, "text/plain", "Method Not Allowed"};
        return {200, "text/plain", "ok"};
    }

    if (!is_rpc_path(req.path)) {
        return {404, "text/plain", "Not Found"};
    }

    if (req.method != "POST") {
        return {405, "text/plain", "Method Not Allowed"};
    }

    auto response = server.handle_text(req.body);
    if (!response) {
        // Notification: acknowledge with an empty result envelope
        return {200, "application/json", R"({"jsonrpc":"2.0","result":{}})"};
    }
    return {200, "application/json", *response};
}

} // namespace memcat
