#include "category.hpp"

namespace memcat {

std::string category_to_string(MemoryCategory cat) {
    switch (cat) {
        case MemoryCategory::Personal:     return "personal";
        case MemoryCategory::Professional: return "professional";
        case MemoryCategory::Technical:    return "technical";
        case MemoryCategory::General:      return "general";
    }
    return "general";
}

std::optional<MemoryCategory> category_from_string(const std::string& s) {
    for (MemoryCategory cat : kAllCategories) {
        if (s == category_to_string(cat)) return cat;
    }
    return std::nullopt;
}

} // namespace memcat
