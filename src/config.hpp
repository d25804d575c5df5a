#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace memcat {

struct Config {
    std::string transport = "http";       // "http" or "stdio"
    std::string listen = "127.0.0.1:8181";
    uint32_t max_body = 1048576;           // bytes; larger HTTP bodies get 413
    bool debug = false;
    std::string server_name = "Memory Agent MCP";
    std::string server_version = "1.0.0";

    // Load from ~/.memcat/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Path of the config file (~ expanded)
    static std::string path();

    // Replace the port of `listen`, keeping its host. Returns false on a bad port.
    bool set_port(const std::string& port);
};

// Accepted transport names
bool is_valid_transport(const std::string& name);

} // namespace memcat
