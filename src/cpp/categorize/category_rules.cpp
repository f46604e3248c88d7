#include "category_rules.hpp"
#include "../utils/text_utils.hpp"
#include <algorithm>

namespace ledgerflow {

namespace {

CategoryRule make_rule(Category c, const std::vector<std::string>& words) {
    CategoryRule rule;
    rule.category = c;
    for (const auto& w : words) {
        size_t n = split_words(normalize_words(w)).size();
        rule.keywords.push_back({w, 1.5 * static_cast<double>(std::max<size_t>(n, 1))});
    }
    return rule;
}

} // namespace

std::vector<CategoryRule> default_category_rules() {
    return {
        make_rule(Category::FOOD, {
            "restaurant", "cafe", "grocery", "food", "meal", "dining", "takeout",
            "delivery", "coffee", "lunch", "dinner", "breakfast", "pizza", "burger",
            "sushi", "bistro", "diner", "eatery", "market", "supermarket",
            "mcdonalds", "starbucks", "subway", "dominos", "chipotle", "panera",
            "taco bell", "wendys", "kfc", "burger king", "dairy queen",
            "tim hortons", "dunkin", "five guys", "in-n-out"}),
        make_rule(Category::TRANSPORT, {
            "uber", "lyft", "taxi", "gas", "fuel", "parking", "metro", "bus",
            "train", "subway", "transport", "commute", "shell", "exxon", "chevron",
            "bp", "valero", "mobil", "citgo", "sunoco", "speedway", "wawa"}),
        make_rule(Category::ENTERTAINMENT, {
            "movie", "theater", "concert", "show", "game", "netflix", "spotify",
            "amazon prime", "entertainment", "hulu", "disney+", "youtube",
            "ticketmaster", "fandango", "cinema", "amc", "regal", "imax",
            "paramount", "warner bros"}),
        make_rule(Category::SHOPPING, {
            "amazon", "walmart", "target", "mall", "store", "shop", "retail",
            "clothing", "electronics", "shopping", "best buy", "home depot",
            "lowes", "costco", "sams club", "macys", "nordstrom", "kohls",
            "tj maxx", "marshalls", "ross", "old navy", "gap"}),
        make_rule(Category::UTILITIES, {
            "electric", "water", "gas", "internet", "phone", "cable", "utility",
            "bill", "verizon", "at&t", "comcast", "xfinity", "duke energy",
            "pg&e", "spectrum", "cox", "directv", "dish"}),
        make_rule(Category::HEALTHCARE, {
            "doctor", "hospital", "pharmacy", "medical", "health", "dental",
            "vision", "cvs", "walgreens", "rite aid", "urgent care", "clinic",
            "dentist", "optometrist"}),
        make_rule(Category::EDUCATION, {
            "school", "university", "college", "course", "book", "tuition",
            "education", "learning", "textbook", "library", "coursera", "udemy",
            "khan academy", "edx", "skillshare"}),
        make_rule(Category::TRAVEL, {
            "hotel", "airline", "airlines", "flight", "vacation", "trip", "travel",
            "booking", "reservation", "marriott", "hilton", "airbnb", "expedia",
            "booking.com", "priceline", "kayak", "travelocity", "orbitz"}),
        make_rule(Category::INSURANCE, {
            "car insurance", "home insurance", "life insurance", "health insurance",
            "insurance", "geico", "state farm", "allstate", "progressive", "usaa",
            "liberty mutual"}),
        make_rule(Category::INVESTMENT, {
            "investment", "stock", "bond", "fund", "portfolio", "trading",
            "brokerage", "fidelity", "vanguard", "schwab", "robinhood", "etrade",
            "td ameritrade", "merrill lynch", "401k", "ira"}),
    };
}

std::vector<Category> default_category_priority() {
    return all_categories();
}

RuleScorer::RuleScorer(const std::vector<CategoryRule>& rules,
                       const std::vector<Category>& priority,
                       double score_scale)
    : priority_(priority)
    , score_scale_(score_scale > 0 ? score_scale : 1.0)
{
    for (const auto& rule : rules) {
        CompiledRule compiled{rule.category, {}};
        for (const auto& kw : rule.keywords) {
            std::string norm = normalize_words(kw.keyword);
            if (norm.empty() || kw.weight <= 0) continue;
            compiled.keywords.emplace_back(" " + norm + " ", kw.weight);
        }
        rules_.push_back(std::move(compiled));
    }
}

int RuleScorer::rank_of(Category c) const {
    auto it = std::find(priority_.begin(), priority_.end(), c);
    if (it != priority_.end()) return static_cast<int>(it - priority_.begin());
    return static_cast<int>(priority_.size()) + static_cast<int>(c);
}

std::map<Category, double> RuleScorer::score_all(const std::string& description) const {
    std::map<Category, double> scores;
    std::string haystack = " " + normalize_words(description) + " ";
    for (const auto& rule : rules_) {
        double sum = 0.0;
        for (const auto& kw : rule.keywords) {
            if (haystack.find(kw.first) != std::string::npos) sum += kw.second;
        }
        if (sum > 0) scores[rule.category] += sum;
    }
    return scores;
}

RuleScore RuleScorer::score(const std::string& description) const {
    std::string haystack = " " + normalize_words(description) + " ";

    // Categories may appear in several rules (config merges onto defaults)
    std::map<Category, std::pair<double, size_t>> sums;
    for (const auto& rule : rules_) {
        for (const auto& kw : rule.keywords) {
            if (haystack.find(kw.first) != std::string::npos) {
                auto& entry = sums[rule.category];
                entry.first += kw.second;
                entry.second++;
            }
        }
    }

    RuleScore best;
    int best_rank = 0;
    for (const auto& kv : sums) {
        double sum = kv.second.first;
        int rank = rank_of(kv.first);
        if (sum > best.score || (sum == best.score && rank < best_rank)) {
            best.category = kv.first;
            best.score = sum;
            best.hits = kv.second.second;
            best_rank = rank;
        }
    }

    if (best.score > 0) {
        best.confidence = std::min(1.0, best.score / score_scale_);
    }
    return best;
}

size_t RuleScorer::keyword_count() const {
    size_t n = 0;
    for (const auto& rule : rules_) n += rule.keywords.size();
    return n;
}

} // namespace ledgerflow
