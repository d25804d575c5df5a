#include "search_memories.hpp"
#include "op_util.hpp"
#include "../memory/item_json.hpp"

namespace memcat {

OperationResult SearchMemoriesOperation::execute(const nlohmann::ordered_json& args) {
    if (auto err = check_args_object(args)) return *err;

    std::string query;
    if (auto err = require_string(args, {"query"}, query)) return *err;

    std::string user_id;
    if (auto err = read_user_id(args, user_id)) return *err;

    std::optional<MemoryCategory> category;
    if (auto err = read_category(args, category)) return *err;

    auto result = store_.search(user_id, query, category);

    nlohmann::ordered_json value = {
        {"query", query},
        {"memories", items_to_json(result.memories)},
        {"count", result.memories.size()},
        {"total_matches", result.total_matches}
    };
    if (category) value["category"] = category_to_string(*category);
    return OperationResult::ok(std::move(value));
}

std::string SearchMemoriesOperation::description() const {
    return "Search memories by keyword (case-insensitive, at most 10 results)";
}

std::string SearchMemoriesOperation::parameters_json() const {
    return R"json({"type":"object","required":["query"],"properties":{"query":{"type":"string","description":"Search term"},"user_id":{"type":"string","description":"User id","default":"default"},"category":{"type":"string","enum":["personal","professional","technical","general"],"description":"Filter by category (optional)"}}})json";
}

} // namespace memcat
