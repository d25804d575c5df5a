#pragma once
#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <thread>
#include <cstdint>

namespace memcat {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;   // "GET", "POST", "OPTIONS", ...
    std::string path;     // e.g. "/mcp", query string stripped
    std::map<std::string, std::string> headers;  // header names lowercased
    std::string body;
};

struct HttpResponse {
    int         status       = 200;
    std::string content_type = "text/plain";
    std::string body;
};

// Minimal single-threaded TCP HTTP/1.1 server. Handles one connection at a
// time and closes it after the response. Runs its accept loop in a
// background thread. Every response carries permissive CORS headers.
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:8181"
    // max_body:    maximum request body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Signal the accept thread to stop and join it.
    void stop();

    bool running() const { return running_.load(); }

private:
    void accept_loop();
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Parse the request line and header block (everything before CRLFCRLF).
// Returns false when the request line is malformed.
bool parse_request_head(const std::string& head, HttpRequest& req);

// Status line reason phrase for the codes this server emits.
const char* http_reason(int status);

// Full HTTP/1.1 response text with CORS headers. 204 carries no body headers.
std::string serialize_response(const HttpResponse& response);

} // namespace memcat
