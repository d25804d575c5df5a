#include "dispatcher.hpp"
#include <iostream>
#include <stdexcept>

namespace memcat {

void OperationTable::add(std::unique_ptr<Operation> op) {
    if (!op) return;
    if (has(op->name())) {
        throw std::invalid_argument("Duplicate operation: " + op->name());
    }
    ops_.push_back(std::move(op));
}

Operation* OperationTable::find(const std::string& name) const {
    for (const auto& op : ops_) {
        if (op->name() == name) return op.get();
    }
    return nullptr;
}

bool OperationTable::has(const std::string& name) const {
    return find(name) != nullptr;
}

OperationResult OperationTable::dispatch(const std::string& name,
                                         const nlohmann::ordered_json& args) const {
    Operation* op = find(name);
    if (!op) {
        throw std::invalid_argument("Unknown operation: " + name);
    }

    auto result = op->execute(args);

    if (debug_) {
        std::cerr << "[dispatch] " << name << " -> "
                  << (result.success ? "ok" : "error: " + result.error) << "\n";
    }
    return result;
}

std::vector<OperationSpec> OperationTable::specs() const {
    std::vector<OperationSpec> out;
    out.reserve(ops_.size());
    for (const auto& op : ops_) {
        out.push_back(op->spec());
    }
    return out;
}

OperationTable create_operation_table(MemoryStore& store) {
    OperationTable table;
    for (auto& op : create_memory_operations(store)) {
        table.add(std::move(op));
    }
    return table;
}

} // namespace memcat
