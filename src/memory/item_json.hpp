#pragma once
#include "../memory.hpp"
#include <nlohmann/json.hpp>

namespace memcat {

// Wire form of store values, shared by the operations and the MCP renderer.

inline nlohmann::ordered_json item_to_json(const MemoryItem& item) {
    return {
        {"id", item.id},
        {"content", item.content},
        {"category", category_to_string(item.category)},
        {"timestamp", item.timestamp},
        {"user_id", item.user_id},
        {"metadata", item.metadata}
    };
}

inline nlohmann::ordered_json items_to_json(const std::vector<MemoryItem>& items) {
    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& item : items) {
        arr.push_back(item_to_json(item));
    }
    return arr;
}

inline nlohmann::ordered_json stats_to_json(const std::optional<MemoryStats>& stats) {
    if (!stats) return {{"empty", true}};

    nlohmann::ordered_json cats = nlohmann::ordered_json::array();
    for (const auto& c : stats->categories) {
        cats.push_back({
            {"category", category_to_string(c.category)},
            {"count", c.count},
            {"percentage", c.percentage}
        });
    }
    return {
        {"empty", false},
        {"total", stats->total},
        {"categories", cats},
        {"oldest", item_to_json(stats->oldest)},
        {"newest", item_to_json(stats->newest)}
    };
}

} // namespace memcat
