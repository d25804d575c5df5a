#include "save_memory.hpp"
#include "op_util.hpp"
#include "../memory/item_json.hpp"

namespace memcat {

OperationResult SaveMemoryOperation::execute(const nlohmann::ordered_json& args) {
    if (auto err = check_args_object(args)) return *err;

    std::string content;
    if (auto err = require_string(args, {"content"}, content)) return *err;

    std::string user_id;
    if (auto err = read_user_id(args, user_id)) return *err;

    std::optional<MemoryCategory> category;
    if (auto err = read_category(args, category)) return *err;

    Metadata metadata = Metadata::object();
    if (const auto* m = find_arg(args, {"metadata"})) {
        if (!m->is_object()) {
            return OperationResult::validation_error("Parameter metadata must be an object");
        }
        metadata = *m;
    }

    MemoryItem item = store_.create(user_id, content, category, std::move(metadata));
    return OperationResult::ok({{"memory", item_to_json(item)}});
}

std::string SaveMemoryOperation::description() const {
    return "Save a new memory, categorizing it automatically when no category is given";
}

std::string SaveMemoryOperation::parameters_json() const {
    return R"json({"type":"object","required":["content"],"properties":{"content":{"type":"string","description":"Memory content to save"},"user_id":{"type":"string","description":"User id (optional)","default":"default"},"category":{"type":"string","enum":["personal","professional","technical","general"],"description":"Manual category (optional, auto-categorized when omitted)"},"metadata":{"type":"object","description":"Additional metadata (optional)"}}})json";
}

} // namespace memcat
