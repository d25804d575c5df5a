#pragma once
#include "../operation.hpp"

namespace memcat {

// Runs the classifier only; does not touch the store.
class CategorizeTextOperation : public Operation {
public:
    explicit CategorizeTextOperation(const Classifier& classifier) : classifier_(classifier) {}

    OperationResult execute(const nlohmann::ordered_json& args) override;
    std::string name() const override { return "categorizeText"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    const Classifier& classifier_;
};

} // namespace memcat
