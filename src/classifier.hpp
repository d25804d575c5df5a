#pragma once
#include "category.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace memcat {

// Raw keyword hits for the three scored categories.
struct CategoryScores {
    uint32_t personal = 0;
    uint32_t professional = 0;
    uint32_t technical = 0;
};

// Keyword-count classifier. Each keyword of a category's list that occurs
// anywhere in the lower-cased text (substring, not word match) adds one to
// that category's score. The highest score wins; ties go to the earlier
// category in personal, professional, technical order. No hits -> General.
class Classifier {
public:
    Classifier();

    MemoryCategory classify(const std::string& text) const;

    CategoryScores scores(const std::string& text) const;

private:
    static uint32_t count_hits(const std::string& lowered,
                               const std::vector<std::string>& keywords);

    std::vector<std::string> personal_;
    std::vector<std::string> professional_;
    std::vector<std::string> technical_;
};

} // namespace memcat
