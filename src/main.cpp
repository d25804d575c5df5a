#include "config.hpp"
#include "classifier.hpp"
#include "memory.hpp"
#include "dispatcher.hpp"
#include "http_server.hpp"
#include "mcp/mcp_server.hpp"
#include "mcp/transports.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: memcat [options]\n"
              << "\n"
              << "Options:\n"
              << "  --transport NAME     Transport to serve on (http, stdio)\n"
              << "  --port N             HTTP port (keeps the configured host)\n"
              << "  --listen HOST:PORT   HTTP listen address\n"
              << "  --debug              Log every request and store mutation\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "HTTP endpoints:\n"
              << "  POST /mcp, /mc, /    JSON-RPC 2.0 (Model Context Protocol)\n"
              << "  GET  /health         Liveness check\n"
              << "\n"
              << "Environment variables:\n"
              << "  MEMCAT_TRANSPORT     Default transport\n"
              << "  MEMCAT_LISTEN        Default HTTP listen address\n"
              << "  MEMCAT_DEBUG         Enable debug logging (1/true)\n"
              << "\n"
              << "Config file: ~/.memcat/config.json\n";
}

static int run_http(const memcat::McpServer& server, const memcat::Config& config,
                    const memcat::MemoryStore& store) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    memcat::HttpServer http(config.listen, config.max_body,
        [&server](const memcat::HttpRequest& req) {
            return memcat::handle_http_request(server, req);
        });

    std::string error;
    if (!http.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    std::cerr << "[http] " << config.server_name << " listening on http://"
              << config.listen << "/mcp\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[http] Shutting down (" << store.total_count()
              << " memories discarded).\n";
    http.stop();
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string transport;
    std::string port;
    std::string listen;
    bool debug = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--transport") == 0 && i + 1 < argc) {
            transport = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port = argv[++i];
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            debug = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = memcat::Config::load();

    // Override config with CLI args
    if (!transport.empty()) {
        if (!memcat::is_valid_transport(transport)) {
            std::cerr << "Error: unknown transport '" << transport << "' (use http or stdio)\n";
            return 1;
        }
        config.transport = transport;
    }
    if (!listen.empty()) config.listen = listen;
    if (!port.empty() && !config.set_port(port)) {
        std::cerr << "Error: invalid port '" << port << "'\n";
        return 1;
    }
    if (debug) config.debug = true;

    // Process-lifetime state, torn down in reverse order on return
    memcat::Classifier classifier;
    memcat::MemoryStore store(classifier);
    store.set_debug(config.debug);
    auto ops = memcat::create_operation_table(store);
    ops.set_debug(config.debug);
    memcat::McpServer server(ops, config);

    std::cerr << "[memcat] Debug mode: " << (config.debug ? "on" : "off") << "\n";

    if (config.transport == "stdio") {
        size_t handled = memcat::run_stdio(server, std::cin, std::cout, g_shutdown);
        std::cerr << "[stdio] Input closed after " << handled << " message(s), "
                  << store.total_count() << " memories discarded.\n";
        return 0;
    }
    return run_http(server, config, store);
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
