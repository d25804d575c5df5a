#include "delete_memory.hpp"
#include "op_util.hpp"

namespace memcat {

OperationResult DeleteMemoryOperation::execute(const nlohmann::ordered_json& args) {
    if (auto err = check_args_object(args)) return *err;

    std::string memory_id;
    if (auto err = require_string(args, {"memory_id", "memoryId"}, memory_id)) return *err;

    std::string user_id;
    if (auto err = read_user_id(args, user_id)) return *err;

    nlohmann::ordered_json value = {{"memory_id", memory_id}, {"user_id", user_id}};
    switch (store_.remove(user_id, memory_id)) {
        case RemoveOutcome::Removed:
            value["deleted"] = true;
            break;
        case RemoveOutcome::UserNotFound:
            value["deleted"] = false;
            value["reason"] = "user_not_found";
            break;
        case RemoveOutcome::MemoryNotFound:
            value["deleted"] = false;
            value["reason"] = "memory_not_found";
            break;
    }
    return OperationResult::ok(std::move(value));
}

std::string DeleteMemoryOperation::description() const {
    return "Delete a specific memory by id";
}

std::string DeleteMemoryOperation::parameters_json() const {
    return R"json({"type":"object","required":["memory_id"],"properties":{"memory_id":{"type":"string","description":"Id of the memory to delete"},"user_id":{"type":"string","description":"User id","default":"default"}}})json";
}

} // namespace memcat
