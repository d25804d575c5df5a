#pragma once
#include "../operation.hpp"
#include "../memory.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <initializer_list>

namespace memcat {

// Look up the first of several accepted spellings (e.g. "user_id", "userId").
// Returns nullptr when none is present or the value is null.
inline const nlohmann::ordered_json* find_arg(const nlohmann::ordered_json& args,
                                              std::initializer_list<const char*> names) {
    if (!args.is_object()) return nullptr;
    for (const char* name : names) {
        auto it = args.find(name);
        if (it != args.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

// Arguments must be an object; null counts as empty.
inline std::optional<OperationResult> check_args_object(const nlohmann::ordered_json& args) {
    if (args.is_null() || args.is_object()) return std::nullopt;
    return OperationResult::validation_error("Arguments must be a JSON object");
}

// Required non-empty string.
inline std::optional<OperationResult> require_string(const nlohmann::ordered_json& args,
                                                     std::initializer_list<const char*> names,
                                                     std::string& out) {
    const auto* v = find_arg(args, names);
    if (!v || !v->is_string()) {
        return OperationResult::validation_error(
            std::string("Missing required parameter: ") + *names.begin());
    }
    out = v->get<std::string>();
    if (out.empty()) {
        return OperationResult::validation_error(
            std::string("Parameter must not be empty: ") + *names.begin());
    }
    return std::nullopt;
}

// Optional user id; absent or empty falls back to the default user.
inline std::optional<OperationResult> read_user_id(const nlohmann::ordered_json& args, std::string& out) {
    out = kDefaultUserId;
    const auto* v = find_arg(args, {"user_id", "userId"});
    if (!v) return std::nullopt;
    if (!v->is_string()) {
        return OperationResult::validation_error("Parameter user_id must be a string");
    }
    if (!v->get_ref<const std::string&>().empty()) out = v->get<std::string>();
    return std::nullopt;
}

// Optional category; absent or empty means none.
inline std::optional<OperationResult> read_category(const nlohmann::ordered_json& args,
                                                    std::optional<MemoryCategory>& out) {
    out.reset();
    const auto* v = find_arg(args, {"category"});
    if (!v) return std::nullopt;
    if (!v->is_string()) {
        return OperationResult::validation_error("Parameter category must be a string");
    }
    const auto& s = v->get_ref<const std::string&>();
    if (s.empty()) return std::nullopt;
    out = category_from_string(s);
    if (!out) {
        return OperationResult::validation_error(
            "Invalid category '" + s + "' (expected personal, professional, technical or general)");
    }
    return std::nullopt;
}

} // namespace memcat
