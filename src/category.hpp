#pragma once
#include <string>
#include <optional>
#include <array>

namespace memcat {

enum class MemoryCategory { Personal, Professional, Technical, General };

// Declaration order; also the tie-break order used by the classifier.
inline constexpr std::array<MemoryCategory, 4> kAllCategories = {
    MemoryCategory::Personal,
    MemoryCategory::Professional,
    MemoryCategory::Technical,
    MemoryCategory::General,
};

std::string category_to_string(MemoryCategory cat);

// Strict parse: only the four lower-case names are accepted.
std::optional<MemoryCategory> category_from_string(const std::string& s);

} // namespace memcat
