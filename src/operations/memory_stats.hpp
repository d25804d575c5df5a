#pragma once
#include "../operation.hpp"

namespace memcat {

class MemoryStatsOperation : public StoreOperation {
public:
    using StoreOperation::StoreOperation;

    OperationResult execute(const nlohmann::ordered_json& args) override;
    std::string name() const override { return "getMemoryStats"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace memcat
