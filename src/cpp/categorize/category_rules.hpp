#pragma once
// =============================================================================
// Keyword rule table and scorer
//
// Each category owns a list of weighted keywords. A description scores the
// sum of the weights of every keyword found in it on word boundaries; the
// highest-scoring category wins, ties go to the earlier category in the
// priority list.
// =============================================================================

#include <map>
#include <string>
#include <vector>
#include "../model/category.hpp"

namespace ledgerflow {

struct KeywordWeight {
    std::string keyword;
    double weight = 1.0;
};

struct CategoryRule {
    Category category = Category::OTHER;
    std::vector<KeywordWeight> keywords;
};

// Built-in table; multi-word keywords weigh more than single words
std::vector<CategoryRule> default_category_rules();

// Declaration order of Category
std::vector<Category> default_category_priority();

struct RuleScore {
    Category category = Category::OTHER;
    double score = 0.0;
    double confidence = 0.0;   // min(1, score / scale); 0 when nothing matched
    size_t hits = 0;           // Keywords matched for the winning category
};

class RuleScorer {
public:
    RuleScorer(const std::vector<CategoryRule>& rules,
               const std::vector<Category>& priority,
               double score_scale);

    [[nodiscard]] RuleScore score(const std::string& description) const;

    // Raw per-category sums (categories without hits are absent)
    [[nodiscard]] std::map<Category, double> score_all(const std::string& description) const;

    [[nodiscard]] size_t keyword_count() const;

private:
    struct CompiledRule {
        Category category;
        // Keyword normalized and padded with spaces: " taco bell "
        std::vector<std::pair<std::string, double>> keywords;
    };

    int rank_of(Category c) const;

    std::vector<CompiledRule> rules_;
    std::vector<Category> priority_;
    double score_scale_;
};

} // namespace ledgerflow
