#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace memcat {

nlohmann::json Config::defaults_json() {
    return {
        {"transport", "http"},
        {"listen", "127.0.0.1:8181"},
        {"max_body", 1048576},
        {"debug", false},
        {"server_name", "Memory Agent MCP"},
        {"server_version", "1.0.0"}
    };
}

std::string Config::path() {
    return expand_home("~/.memcat/config.json");
}

bool is_valid_transport(const std::string& name) {
    return name == "http" || name == "stdio";
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static bool env_flag(const char* v) {
    std::string s = to_lower(trim(v));
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

Config Config::load() {
    Config cfg;

    std::string config_path = path();
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            if (!original.is_object()) {
                throw std::runtime_error("config root is not an object");
            }
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    if (j.contains("transport") && j["transport"].is_string()) {
        auto t = j["transport"].get<std::string>();
        if (is_valid_transport(t)) {
            cfg.transport = t;
        } else {
            std::cerr << "[config] Unknown transport '" << t << "', using "
                      << cfg.transport << "\n";
        }
    }
    if (j.contains("listen") && j["listen"].is_string())
        cfg.listen = j["listen"].get<std::string>();
    if (j.contains("max_body") && j["max_body"].is_number_unsigned())
        cfg.max_body = j["max_body"].get<uint32_t>();
    if (j.contains("debug") && j["debug"].is_boolean())
        cfg.debug = j["debug"].get<bool>();
    if (j.contains("server_name") && j["server_name"].is_string())
        cfg.server_name = j["server_name"].get<std::string>();
    if (j.contains("server_version") && j["server_version"].is_string())
        cfg.server_version = j["server_version"].get<std::string>();

    // Environment variables always override config file
    if (const char* v = std::getenv("MEMCAT_TRANSPORT")) {
        if (is_valid_transport(v)) cfg.transport = v;
    }
    if (const char* v = std::getenv("MEMCAT_LISTEN"))
        cfg.listen = v;
    if (const char* v = std::getenv("MEMCAT_DEBUG"))
        cfg.debug = env_flag(v);

    return cfg;
}

bool Config::set_port(const std::string& port) {
    int p = 0;
    try {
        size_t used = 0;
        p = std::stoi(port, &used);
        if (used != port.size()) return false;
    } catch (const std::exception&) {
        return false;
    }
    if (p <= 0 || p > 65535) return false;

    auto pos = listen.rfind(':');
    std::string host = pos == std::string::npos ? "127.0.0.1" : listen.substr(0, pos);
    listen = host + ":" + std::to_string(p);
    return true;
}

} // namespace memcat
