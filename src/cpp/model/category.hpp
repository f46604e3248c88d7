#pragma once
#include <string>
#include <vector>

namespace ledgerflow {

// Fixed category set. Declaration order is the default tie-break priority.
enum class Category {
    FOOD,
    TRANSPORT,
    ENTERTAINMENT,
    SHOPPING,
    UTILITIES,
    HEALTHCARE,
    EDUCATION,
    TRAVEL,
    INSURANCE,
    INVESTMENT,
    OTHER
};

inline const char* category_str(Category c) {
    switch (c) {
        case Category::FOOD:          return "food";
        case Category::TRANSPORT:     return "transport";
        case Category::ENTERTAINMENT: return "entertainment";
        case Category::SHOPPING:      return "shopping";
        case Category::UTILITIES:     return "utilities";
        case Category::HEALTHCARE:    return "healthcare";
        case Category::EDUCATION:     return "education";
        case Category::TRAVEL:        return "travel";
        case Category::INSURANCE:     return "insurance";
        case Category::INVESTMENT:    return "investment";
        case Category::OTHER:         return "other";
    }
    return "other";
}

inline const std::vector<Category>& all_categories() {
    static const std::vector<Category> cats = {
        Category::FOOD, Category::TRANSPORT, Category::ENTERTAINMENT,
        Category::SHOPPING, Category::UTILITIES, Category::HEALTHCARE,
        Category::EDUCATION, Category::TRAVEL, Category::INSURANCE,
        Category::INVESTMENT, Category::OTHER
    };
    return cats;
}

// Case-insensitive; returns false for names outside the fixed set
inline bool parse_category(const std::string& s, Category& out) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        lower += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }
    for (Category c : all_categories()) {
        if (lower == category_str(c)) {
            out = c;
            return true;
        }
    }
    return false;
}

} // namespace ledgerflow
