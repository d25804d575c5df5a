#include "retrieve_memories.hpp"
#include "op_util.hpp"
#include "../memory/item_json.hpp"
#include <algorithm>
#include <limits>

namespace memcat {

OperationResult RetrieveMemoriesOperation::execute(const nlohmann::ordered_json& args) {
    if (auto err = check_args_object(args)) return *err;

    std::string user_id;
    if (auto err = read_user_id(args, user_id)) return *err;

    std::optional<MemoryCategory> category;
    if (auto err = read_category(args, category)) return *err;

    int64_t limit = kDefaultListLimit;
    if (const auto* l = find_arg(args, {"limit"})) {
        if (!l->is_number_integer()) {
            return OperationResult::validation_error("Parameter limit must be an integer");
        }
        if (l->is_number_unsigned()) {
            limit = static_cast<int64_t>(std::min<uint64_t>(
                l->get<uint64_t>(), static_cast<uint64_t>(std::numeric_limits<int64_t>::max())));
        } else {
            limit = l->get<int64_t>();
        }
    }

    auto memories = store_.list(user_id, category, limit);

    nlohmann::ordered_json value = {
        {"memories", items_to_json(memories)},
        {"count", memories.size()}
    };
    if (category) value["category"] = category_to_string(*category);
    return OperationResult::ok(std::move(value));
}

std::string RetrieveMemoriesOperation::description() const {
    return "Retrieve saved memories, most recent first, optionally filtered by category";
}

std::string RetrieveMemoriesOperation::parameters_json() const {
    return R"json({"type":"object","properties":{"user_id":{"type":"string","description":"User id","default":"default"},"category":{"type":"string","enum":["personal","professional","technical","general"],"description":"Filter by category (optional)"},"limit":{"type":"integer","description":"Maximum number of memories to return","default":10}}})json";
}

} // namespace memcat
