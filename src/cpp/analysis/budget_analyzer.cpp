#include "budget_analyzer.hpp"
#include "../currency/currency_format.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace ledgerflow {

namespace {

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // namespace

nlohmann::json BudgetRecommendation::to_json() const {
    return {
        {"category", category_str(category)},
        {"recommended", round2(recommended)},
        {"current", round2(current)},
        {"difference", round2(difference)},
        {"percentage_of_income", percentage_of_income * 100.0},
        {"status", over_budget() ? "over_budget" : "under_budget"},
        {"severity", severity_str(severity)}
    };
}

nlohmann::json SpendingAnalysis::to_json() const {
    nlohmann::json cats = nlohmann::json::object();
    for (const auto& kv : categories) {
        cats[category_str(kv.first)] = {
            {"total", round2(kv.second.total)},
            {"count", kv.second.count},
            {"mean", round2(kv.second.mean)},
            {"share", round2(kv.second.share)}
        };
    }

    nlohmann::json weekdays = nlohmann::json::object();
    for (int w = 0; w < 7; ++w) weekdays[weekday_str(w)] = round2(weekday_spending[w]);

    nlohmann::json merchants = nlohmann::json::array();
    for (const auto& m : top_merchants) {
        merchants.push_back({{"description", m.first}, {"total", round2(m.second)}});
    }

    nlohmann::json monthly = nlohmann::json::object();
    for (const auto& kv : monthly_spending) monthly[kv.first] = round2(kv.second);

    return {
        {"currency", currency},
        {"total_expenses", round2(total_expenses)},
        {"total_income", round2(total_income)},
        {"net", round2(net)},
        {"avg_daily_expense", round2(avg_daily_expense)},
        {"expense_count", expense_count},
        {"income_count", income_count},
        {"categories", cats},
        {"monthly_spending", monthly},
        {"weekday_spending", weekdays},
        {"top_merchants", merchants},
        {"period", {
            {"start", start.valid() ? start.iso() : ""},
            {"end", end.valid() ? end.iso() : ""},
            {"days", days}
        }}
    };
}

nlohmann::json BudgetReport::to_json() const {
    nlohmann::json j = {
        {"currency", currency},
        {"income_defined", income_defined}
    };
    if (!income_defined) return j;

    j["monthly_income"] = round2(monthly_income);
    j["income_months"] = income_months;
    j["expense_months"] = expense_months;
    j["monthly_spending"] = round2(monthly_spending);
    j["savings_rate"] = round2(savings_rate * 100.0);

    j["recommendations"] = nlohmann::json::array();
    for (const auto& r : recommendations) j["recommendations"].push_back(r.to_json());
    j["alerts"] = nlohmann::json::array();
    for (const auto& a : alerts) j["alerts"].push_back(a.to_json());
    j["savings_potential"] = nlohmann::json::object();
    for (const auto& kv : savings_potential) {
        j["savings_potential"][category_str(kv.first)] = round2(kv.second);
    }
    return j;
}

Severity BudgetAnalyzer::classify(double actual, double recommended) const {
    if (actual > cfg_.high_severity_ratio * recommended) return Severity::HIGH;
    if (actual > recommended) return Severity::MEDIUM;
    return Severity::NONE;
}

SpendingAnalysis BudgetAnalyzer::analyze(const std::vector<Transaction>& txs,
                                         const std::string& currency) const {
    SpendingAnalysis a;
    a.currency = currency;
    if (txs.empty()) return a;

    std::map<std::string, double> by_merchant;
    std::set<long> expense_days;

    a.start = txs.front().date;
    a.end = txs.front().date;
    for (const auto& tx : txs) {
        if (tx.date < a.start) a.start = tx.date;
        if (a.end < tx.date) a.end = tx.date;

        if (tx.amount > 0) {
            a.total_income += tx.amount;
            a.income_count++;
            continue;
        }
        if (tx.amount == 0) continue;

        double spend = std::fabs(tx.amount);
        a.total_expenses += spend;
        a.expense_count++;

        auto& cs = a.categories[tx.category];
        cs.total += spend;
        cs.count++;

        a.monthly_spending[tx.date.month_key()] += spend;
        a.weekday_spending[static_cast<size_t>(tx.date.weekday())] += spend;
        by_merchant[tx.description] += spend;
        expense_days.insert(tx.date.days_since_epoch());
    }

    a.net = a.total_income - a.total_expenses;
    a.days = a.end.days_since_epoch() - a.start.days_since_epoch() + 1;
    if (!expense_days.empty()) {
        a.avg_daily_expense = a.total_expenses / static_cast<double>(expense_days.size());
    }

    for (auto& kv : a.categories) {
        kv.second.mean = kv.second.total / static_cast<double>(kv.second.count);
        kv.second.share = a.total_expenses > 0 ? kv.second.total / a.total_expenses * 100.0 : 0.0;
    }

    a.top_merchants.assign(by_merchant.begin(), by_merchant.end());
    std::sort(a.top_merchants.begin(), a.top_merchants.end(),
        [](const std::pair<std::string, double>& x, const std::pair<std::string, double>& y) {
            if (x.second != y.second) return x.second > y.second;
            return x.first < y.first;
        });
    if (a.top_merchants.size() > cfg_.top_merchants) a.top_merchants.resize(cfg_.top_merchants);

    return a;
}

BudgetReport BudgetAnalyzer::recommend(const std::vector<Transaction>& txs,
                                       const std::string& currency) const {
    BudgetReport r;
    r.currency = currency;

    std::set<std::string> income_months;
    std::set<std::string> expense_months;
    double income_total = 0.0;
    std::map<Category, double> spend_by_category;
    double spend_total = 0.0;

    for (const auto& tx : txs) {
        if (tx.amount > 0) {
            income_total += tx.amount;
            income_months.insert(tx.date.month_key());
        } else if (tx.amount < 0) {
            spend_by_category[tx.category] += std::fabs(tx.amount);
            spend_total += std::fabs(tx.amount);
            expense_months.insert(tx.date.month_key());
        }
    }

    r.income_months = income_months.size();
    r.expense_months = expense_months.size();
    if (r.income_months == 0) {
        LOG_INF("[budget] no income rows, income-relative recommendations skipped");
        return r;
    }

    r.income_defined = true;
    r.monthly_income = income_total / static_cast<double>(r.income_months);

    double months = r.expense_months > 0 ? static_cast<double>(r.expense_months) : 1.0;
    r.monthly_spending = spend_total / months;
    r.savings_rate = r.monthly_income > 0
        ? (r.monthly_income - r.monthly_spending) / r.monthly_income : 0.0;

    for (const auto& kv : cfg_.percentages) {
        BudgetRecommendation rec;
        rec.category = kv.first;
        rec.percentage_of_income = kv.second;
        rec.recommended = r.monthly_income * kv.second;
        auto it = spend_by_category.find(kv.first);
        rec.current = it == spend_by_category.end() ? 0.0 : it->second / months;
        rec.difference = rec.recommended - rec.current;
        rec.severity = classify(rec.current, rec.recommended);
        r.recommendations.push_back(rec);

        if (rec.over_budget()) {
            r.savings_potential[rec.category] = rec.current - rec.recommended;
        }
        if (rec.severity == Severity::NONE) continue;

        Alert alert;
        alert.category = category_str(rec.category);
        alert.severity = rec.severity;
        alert.message = "Spending on " + alert.category + " is " +
            format_currency(rec.current, currency) + " per month, " +
            format_currency(rec.current - rec.recommended, currency) +
            " over the recommended " + format_currency(rec.recommended, currency);
        r.alerts.push_back(std::move(alert));
    }

    if (r.monthly_spending > cfg_.overall_spending_ratio * r.monthly_income) {
        Alert alert;
        alert.category = "overall";
        alert.severity = Severity::HIGH;
        alert.message = "Monthly spending of " + format_currency(r.monthly_spending, currency) +
            " exceeds " + std::to_string(static_cast<int>(std::lround(cfg_.overall_spending_ratio * 100))) +
            "% of income (" + format_currency(r.monthly_income, currency) + ")";
        r.alerts.push_back(std::move(alert));
    }
    if (r.savings_rate < cfg_.min_savings_rate) {
        Alert alert;
        alert.category = "savings";
        alert.severity = Severity::MEDIUM;
        alert.message = "Savings rate is " +
            std::to_string(static_cast<int>(std::lround(r.savings_rate * 100))) +
            "%, below the " +
            std::to_string(static_cast<int>(std::lround(cfg_.min_savings_rate * 100))) +
            "% target";
        r.alerts.push_back(std::move(alert));
    }

    std::sort(r.alerts.begin(), r.alerts.end(), [](const Alert& x, const Alert& y) {
        if (x.severity != y.severity) return x.severity > y.severity;
        return x.category < y.category;
    });

    LOG_INF("[budget] monthly income %s over %zu months, %zu alerts",
        format_currency(r.monthly_income, currency).c_str(), r.income_months, r.alerts.size());
    return r;
}

} // namespace ledgerflow
