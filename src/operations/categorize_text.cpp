#include "categorize_text.hpp"
#include "op_util.hpp"
#include "../classifier.hpp"

namespace memcat {

OperationResult CategorizeTextOperation::execute(const nlohmann::ordered_json& args) {
    if (auto err = check_args_object(args)) return *err;

    std::string text;
    if (auto err = require_string(args, {"text"}, text)) return *err;

    auto s = classifier_.scores(text);
    return OperationResult::ok({
        {"category", category_to_string(classifier_.classify(text))},
        {"scores", {
            {"personal", s.personal},
            {"professional", s.professional},
            {"technical", s.technical}
        }}
    });
}

std::string CategorizeTextOperation::description() const {
    return "Categorize a text as personal, professional, technical or general";
}

std::string CategorizeTextOperation::parameters_json() const {
    return R"json({"type":"object","required":["text"],"properties":{"text":{"type":"string","description":"Text to categorize"}}})json";
}

} // namespace memcat
