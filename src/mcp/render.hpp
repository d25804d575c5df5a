#pragma once
#include "../operation.hpp"
#include <string>

namespace memcat {

// Human-readable text for an operation result, keyed by operation name.
std::string render_result(const std::string& operation, const OperationResult& result);

// "66.7" style one-decimal percentage
std::string format_percentage(double pct);

} // namespace memcat
