#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <memory>
#include <vector>

namespace memcat {

class MemoryStore;
class Classifier;

enum class ErrorKind { None, Validation };

// Structured outcome of an operation. Rendering is left to the caller.
struct OperationResult {
    bool success = false;
    nlohmann::ordered_json value;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    static OperationResult ok(nlohmann::ordered_json value) {
        return OperationResult{true, std::move(value), ErrorKind::None, {}};
    }

    static OperationResult validation_error(std::string message) {
        return OperationResult{false, nullptr, ErrorKind::Validation, std::move(message)};
    }
};

struct OperationSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for arguments
};

class Operation {
public:
    virtual ~Operation() = default;
    virtual OperationResult execute(const nlohmann::ordered_json& args) = 0;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    OperationSpec spec() const {
        return OperationSpec{name(), description(), parameters_json()};
    }
};

// Base class for operations backed by the memory store.
class StoreOperation : public Operation {
public:
    explicit StoreOperation(MemoryStore& store) : store_(store) {}

protected:
    MemoryStore& store_;
};

// Create the six memory operations bound to store.
std::vector<std::unique_ptr<Operation>> create_memory_operations(MemoryStore& store);

} // namespace memcat
