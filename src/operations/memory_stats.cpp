#include "memory_stats.hpp"
#include "op_util.hpp"
#include "../memory/item_json.hpp"

namespace memcat {

OperationResult MemoryStatsOperation::execute(const nlohmann::ordered_json& args) {
    if (auto err = check_args_object(args)) return *err;

    std::string user_id;
    if (auto err = read_user_id(args, user_id)) return *err;

    return OperationResult::ok(stats_to_json(store_.stats(user_id)));
}

std::string MemoryStatsOperation::description() const {
    return "Get statistics about the stored memories";
}

std::string MemoryStatsOperation::parameters_json() const {
    return R"json({"type":"object","properties":{"user_id":{"type":"string","description":"User id","default":"default"}}})json";
}

} // namespace memcat
