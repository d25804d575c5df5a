#include "http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace memcat {

static constexpr size_t kMaxHeadBytes = 16384;

// ── Parsing ───────────────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    try {
        size_t used = 0;
        std::string port_str = addr.substr(pos + 1);
        int p = std::stoi(port_str, &used);
        if (used != port_str.size()) return false;
        if (p <= 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

bool parse_request_head(const std::string& head, HttpRequest& req) {
    auto rl_end = head.find("\r\n");
    std::string request_line = rl_end == std::string::npos ? head : head.substr(0, rl_end);

    {
        std::istringstream ss(request_line);
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) return false;
        if (ver.rfind("HTTP/", 0) != 0) return false;
        // Routing ignores the query string
        req.path = pq.substr(0, pq.find('?'));
    }

    if (rl_end == std::string::npos) return true;

    size_t pos = rl_end + 2;
    while (pos < head.size()) {
        auto ne = head.find("\r\n", pos);
        if (ne == std::string::npos) ne = head.size();
        std::string hline = head.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }
    return true;
}

const char* http_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default:  return "OK";
    }
}

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint32_t max_body, Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    auto fail = [this, &error](const std::string& msg) {
        error = msg;
        ::close(server_fd_); server_fd_ = -1;
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    };

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        return fail("Invalid bind address: " + host);
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        return fail(std::string("bind failed: ") + std::strerror(errno));
    }

    if (::listen(server_fd_, 16) != 0) {
        return fail(std::string("listen failed: ") + std::strerror(errno));
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0 && ::write(shutdown_pipe_[1], &b, 1) < 0) {
        std::cerr << "[http] Failed to signal shutdown: " << std::strerror(errno) << "\n";
    }
    if (thread_.joinable()) thread_.join();
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd >= 0) {
            struct timeval tv{10, 0};  // 10s recv timeout
            ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            handle_connection(cfd);
            ::close(cfd);
        }
    }
}

// ── HTTP helpers ──────────────────────────────────────────────────────────────

std::string serialize_response(const HttpResponse& r) {
    std::string out = "HTTP/1.1 " + std::to_string(r.status) + " " + http_reason(r.status) + "\r\n";
    out += "Access-Control-Allow-Origin: *\r\n";
    out += "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n";
    out += "Access-Control-Allow-Headers: *\r\n";
    bool has_body = r.status != 204;
    if (has_body) {
        out += "Content-Type: " + r.content_type + "\r\n";
        out += "Content-Length: " + std::to_string(r.body.size()) + "\r\n";
    }
    out += "Connection: close\r\n\r\n";
    if (has_body) out += r.body;
    return out;
}

static void send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return;  // peer went away
        sent += static_cast<size_t>(n);
    }
}

static void reply(int fd, int status, const std::string& message) {
    send_all(fd, serialize_response({status, "text/plain", message}));
}

// Read until CRLFCRLF. The head is capped at 16 KB; whatever follows it
// is the start of the body.
static bool read_head(int fd, std::string& head, std::string& rest, bool& too_large) {
    std::string buf;
    char chunk[4096];
    too_large = false;
    for (;;) {
        auto end = buf.find("\r\n\r\n");
        if (end != std::string::npos) {
            head = buf.substr(0, end);
            rest = buf.substr(end + 4);
            return true;
        }
        if (buf.size() > kMaxHeadBytes) {
            too_large = true;
            return false;
        }
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) return false;
        buf.append(chunk, static_cast<size_t>(n));
    }
}

static void read_body(int fd, std::string& body, size_t content_len) {
    char chunk[4096];
    while (body.size() < content_len) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) break;
        body.append(chunk, static_cast<size_t>(n));
    }
    if (body.size() > content_len) body.resize(content_len);
}

void HttpServer::handle_connection(int fd) const {
    std::string head, rest;
    bool too_large = false;
    if (!read_head(fd, head, rest, too_large)) {
        if (too_large) reply(fd, 400, "Headers too large");
        return;
    }

    HttpRequest req;
    if (!parse_request_head(head, req)) {
        reply(fd, 400, "Malformed request line");
        return;
    }

    size_t content_len = 0;
    auto it = req.headers.find("content-length");
    if (it != req.headers.end()) {
        size_t used = 0;
        try {
            content_len = std::stoul(it->second, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == 0 || used != it->second.size()) {
            reply(fd, 400, "Invalid Content-Length");
            return;
        }
    }
    if (content_len > max_body_) {
        reply(fd, 413, "Payload too large");
        return;
    }

    req.body = std::move(rest);
    read_body(fd, req.body, content_len);

    HttpResponse resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        std::cerr << "[http] Handler error on " << req.method << " " << req.path
                  << ": " << e.what() << "\n";
        resp = {500, "text/plain", "Internal Server Error"};
    }
    send_all(fd, serialize_response(resp));
}

} // namespace memcat
