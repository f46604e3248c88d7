#pragma once
// =============================================================================
// Budget Analyzer
//
// Aggregates categorized transactions (single currency) into spending
// statistics, and compares representative monthly spend per category with a
// share of estimated monthly income to produce recommendations and alerts.
// =============================================================================

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "../config.hpp"
#include "../model/transaction.hpp"

namespace ledgerflow {

enum class Severity { NONE, MEDIUM, HIGH };

inline const char* severity_str(Severity s) {
    switch (s) {
        case Severity::NONE:   return "none";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH:   return "high";
    }
    return "??";
}

struct BudgetRecommendation {
    Category category = Category::OTHER;
    double recommended = 0.0;          // Per month
    double current = 0.0;              // Representative monthly spend
    double difference = 0.0;           // recommended - current
    double percentage_of_income = 0.0; // Configured share, 0..1
    Severity severity = Severity::NONE;

    [[nodiscard]] bool over_budget() const { return current > recommended; }
    nlohmann::json to_json() const;
};

struct Alert {
    std::string category;   // Category name, or "overall" / "savings"
    std::string message;
    Severity severity = Severity::MEDIUM;

    nlohmann::json to_json() const {
        return {{"category", category}, {"message", message}, {"severity", severity_str(severity)}};
    }
};

struct CategoryStats {
    double total = 0.0;      // Absolute expense sum
    size_t count = 0;
    double mean = 0.0;
    double share = 0.0;      // Percent of all expenses
};

struct SpendingAnalysis {
    std::string currency;
    double total_expenses = 0.0;
    double total_income = 0.0;
    double net = 0.0;
    double avg_daily_expense = 0.0;   // Over days with at least one expense
    size_t expense_count = 0;
    size_t income_count = 0;

    std::map<Category, CategoryStats> categories;
    std::map<std::string, double> monthly_spending;   // "YYYY-MM" -> expenses
    std::array<double, 7> weekday_spending{};         // Monday first
    std::vector<std::pair<std::string, double>> top_merchants;

    Date start;
    Date end;
    long days = 0;

    nlohmann::json to_json() const;
};

struct BudgetReport {
    std::string currency;
    bool income_defined = false;
    double monthly_income = 0.0;
    size_t income_months = 0;
    size_t expense_months = 0;
    double monthly_spending = 0.0;
    double savings_rate = 0.0;

    std::vector<BudgetRecommendation> recommendations;
    std::vector<Alert> alerts;                       // High first, then by category
    std::map<Category, double> savings_potential;    // Over-budget categories only

    nlohmann::json to_json() const;
};

class BudgetAnalyzer {
public:
    explicit BudgetAnalyzer(BudgetConfig cfg = BudgetConfig()) : cfg_(std::move(cfg)) {}

    [[nodiscard]] SpendingAnalysis analyze(const std::vector<Transaction>& txs,
                                           const std::string& currency) const;

    [[nodiscard]] BudgetReport recommend(const std::vector<Transaction>& txs,
                                         const std::string& currency) const;

    // high if actual > high_severity_ratio * recommended, medium if
    // actual > recommended
    [[nodiscard]] Severity classify(double actual, double recommended) const;

private:
    BudgetConfig cfg_;
};

} // namespace ledgerflow
