#pragma once
#include "mcp_server.hpp"
#include "../http_server.hpp"
#include <atomic>
#include <istream>
#include <ostream>

namespace memcat {

// Newline-delimited JSON-RPC over a stream pair. Returns when `in` hits EOF
// or `stop` is set. Returns the number of messages handled.
size_t run_stdio(const McpServer& server, std::istream& in, std::ostream& out,
                 const std::atomic<bool>& stop);

// Route one HTTP request: POST /mcp, /mc and / carry JSON-RPC, GET /health
// answers "ok", OPTIONS is a CORS preflight.
HttpResponse handle_http_request(const McpServer& server, const HttpRequest& req);

} // namespace memcat
