#include "classifier.hpp"
#include "util.hpp"

namespace memcat {

Classifier::Classifier()
    : personal_{"família", "amigo", "casa", "hobby", "sentimento",
                "pessoal", "vida", "relacionamento"}
    , professional_{"trabalho", "empresa", "projeto", "cliente", "reunião",
                    "carreira", "negócio", "profissional"}
    , technical_{"código", "programa", "api", "servidor", "database",
                 "algoritmo", "software", "bug", "feature"}
{}

uint32_t Classifier::count_hits(const std::string& lowered,
                                const std::vector<std::string>& keywords) {
    uint32_t hits = 0;
    for (const auto& kw : keywords) {
        if (lowered.find(kw) != std::string::npos) hits++;
    }
    return hits;
}

CategoryScores Classifier::scores(const std::string& text) const {
    std::string lowered = utf8_to_lower(text);
    CategoryScores s;
    s.personal = count_hits(lowered, personal_);
    s.professional = count_hits(lowered, professional_);
    s.technical = count_hits(lowered, technical_);
    return s;
}

MemoryCategory Classifier::classify(const std::string& text) const {
    auto s = scores(text);

    // Strict > keeps the earlier category on ties
    MemoryCategory best = MemoryCategory::General;
    uint32_t best_score = 0;
    if (s.personal > best_score) {
        best = MemoryCategory::Personal;
        best_score = s.personal;
    }
    if (s.professional > best_score) {
        best = MemoryCategory::Professional;
        best_score = s.professional;
    }
    if (s.technical > best_score) {
        best = MemoryCategory::Technical;
    }
    return best;
}

} // namespace memcat
