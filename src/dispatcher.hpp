#pragma once
#include "operation.hpp"
#include <string>
#include <vector>
#include <memory>

namespace memcat {

// Name -> operation lookup. Registration order is kept for listing.
class OperationTable {
public:
    void add(std::unique_ptr<Operation> op);

    // Execute the named operation. Throws std::invalid_argument for an
    // unregistered name: that is a wiring error, not a caller error.
    OperationResult dispatch(const std::string& name, const nlohmann::ordered_json& args) const;

    bool has(const std::string& name) const;
    std::vector<OperationSpec> specs() const;
    size_t size() const { return ops_.size(); }

    void set_debug(bool debug) { debug_ = debug; }

private:
    Operation* find(const std::string& name) const;

    std::vector<std::unique_ptr<Operation>> ops_;
    bool debug_ = false;
};

// Table holding the six memory operations bound to store.
OperationTable create_operation_table(MemoryStore& store);

} // namespace memcat
