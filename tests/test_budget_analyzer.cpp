// Spending statistics, income-relative recommendations and alerts

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "analysis/budget_analyzer.hpp"
#include "utils/logger.hpp"

using namespace ledgerflow;

static Transaction row(int y, int m, int d, const std::string& description,
                       double amount, Category category) {
    Transaction tx;
    tx.date = Date{y, m, d};
    tx.description = description;
    tx.amount = amount;
    tx.type = type_for_amount(amount);
    tx.category = category;
    tx.currency = "USD";
    return tx;
}

static bool approx(double a, double b) {
    return std::fabs(a - b) < 1e-6;
}

static const BudgetRecommendation& rec_for(const BudgetReport& r, Category c) {
    for (const auto& rec : r.recommendations) {
        if (rec.category == c) return rec;
    }
    throw std::runtime_error(std::string("no recommendation for ") + category_str(c));
}

int main() {
    g_log_level = LogLevel::ERROR;
    std::cout << "Running budget analyzer tests...\n";

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: severity thresholds... ";
        try {
            BudgetAnalyzer analyzer;
            assert(analyzer.classify(151, 100) == Severity::HIGH);
            assert(analyzer.classify(150, 100) == Severity::MEDIUM);
            assert(analyzer.classify(101, 100) == Severity::MEDIUM);
            assert(analyzer.classify(100, 100) == Severity::NONE);
            assert(analyzer.classify(0, 100) == Severity::NONE);

            BudgetConfig strict;
            strict.high_severity_ratio = 1.2;
            assert(BudgetAnalyzer(strict).classify(121, 100) == Severity::HIGH);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: no income means no recommendations... ";
        try {
            std::vector<Transaction> txs = {
                row(2024, 1, 5, "STARBUCKS", -5.75, Category::FOOD),
                row(2024, 1, 9, "NETFLIX.COM", -15.99, Category::ENTERTAINMENT),
            };
            BudgetAnalyzer analyzer;
            BudgetReport r = analyzer.recommend(txs, "USD");
            assert(!r.income_defined);
            assert(r.recommendations.empty());
            assert(r.alerts.empty());
            assert(r.expense_months == 1);

            auto j = r.to_json();
            assert(j["income_defined"] == false);
            assert(!j.contains("recommendations"));

            // Expense statistics still work
            SpendingAnalysis a = analyzer.analyze(txs, "USD");
            assert(approx(a.total_expenses, 21.74));
            assert(a.income_count == 0);

            BudgetReport none = analyzer.recommend({}, "USD");
            assert(!none.income_defined);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: recommendations and alert ordering... ";
        try {
            std::vector<Transaction> txs = {
                row(2024, 1, 1, "PAYROLL", 5000, Category::OTHER),
                row(2024, 2, 1, "PAYROLL", 5000, Category::OTHER),
                row(2024, 1, 3, "WHOLE FOODS", -900, Category::FOOD),
                row(2024, 2, 3, "WHOLE FOODS", -900, Category::FOOD),
                row(2024, 1, 7, "CONCERT", -600, Category::ENTERTAINMENT),
                row(2024, 2, 7, "CONCERT", -400, Category::ENTERTAINMENT),
                row(2024, 1, 12, "BEST BUY", -1600, Category::SHOPPING),
                row(2024, 2, 14, "UBER", -200, Category::TRANSPORT),
            };

            BudgetReport r = BudgetAnalyzer().recommend(txs, "USD");
            assert(r.income_defined);
            assert(r.income_months == 2 && r.expense_months == 2);
            assert(approx(r.monthly_income, 5000));
            assert(approx(r.monthly_spending, 2300));
            assert(approx(r.savings_rate, 0.54));
            assert(r.recommendations.size() == 11);

            const auto& food = rec_for(r, Category::FOOD);
            assert(approx(food.recommended, 750));
            assert(approx(food.current, 900));
            assert(approx(food.difference, -150));
            assert(food.over_budget());
            assert(food.severity == Severity::MEDIUM);

            assert(rec_for(r, Category::ENTERTAINMENT).severity == Severity::HIGH);
            assert(rec_for(r, Category::SHOPPING).severity == Severity::HIGH);
            assert(rec_for(r, Category::TRANSPORT).severity == Severity::NONE);
            assert(!rec_for(r, Category::TRANSPORT).over_budget());
            assert(approx(rec_for(r, Category::INVESTMENT).current, 0));

            assert(r.alerts.size() == 3);
            assert(r.alerts[0].category == "entertainment" && r.alerts[0].severity == Severity::HIGH);
            assert(r.alerts[1].category == "shopping" && r.alerts[1].severity == Severity::HIGH);
            assert(r.alerts[2].category == "food" && r.alerts[2].severity == Severity::MEDIUM);
            assert(r.alerts[2].message.find("$900.00") != std::string::npos);

            assert(r.savings_potential.size() == 3);
            assert(approx(r.savings_potential.at(Category::SHOPPING), 300));

            auto j = r.to_json();
            assert(j["recommendations"].size() == 11);
            assert(j["alerts"][0]["severity"] == "high");
            assert(j["savings_rate"] == 54.0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: category spend averages over expense months... ";
        try {
            std::vector<Transaction> txs = {
                row(2024, 1, 1, "PAYROLL", 4000, Category::OTHER),
                row(2024, 1, 5, "PIZZA PLACE", -600, Category::FOOD),
                row(2024, 2, 5, "SHELL", -100, Category::TRANSPORT),
                row(2024, 3, 5, "SHELL", -100, Category::TRANSPORT),
            };
            BudgetReport r = BudgetAnalyzer().recommend(txs, "USD");
            assert(r.income_months == 1);
            assert(r.expense_months == 3);
            assert(approx(r.monthly_income, 4000));
            assert(approx(rec_for(r, Category::FOOD).current, 200));
            assert(approx(r.monthly_spending, 800.0 / 3.0));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: overall and savings alerts... ";
        try {
            std::vector<Transaction> txs = {
                row(2024, 3, 1, "SALARY", 1000, Category::OTHER),
                row(2024, 3, 2, "MISC", -900, Category::OTHER),
            };
            BudgetReport r = BudgetAnalyzer().recommend(txs, "EUR");
            assert(approx(r.savings_rate, 0.1));
            assert(r.alerts.size() == 3);
            assert(r.alerts[0].category == "other");
            assert(r.alerts[1].category == "overall" && r.alerts[1].severity == Severity::HIGH);
            assert(r.alerts[2].category == "savings" && r.alerts[2].severity == Severity::MEDIUM);
            assert(r.alerts[1].message.find("80%") != std::string::npos);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: spending statistics... ";
        try {
            std::vector<Transaction> txs = {
                row(2024, 1, 1, "STARBUCKS", -50, Category::FOOD),
                row(2024, 1, 1, "UBER", -30, Category::TRANSPORT),
                row(2024, 1, 3, "STARBUCKS", -20, Category::FOOD),
                row(2024, 1, 10, "PAYROLL", 1000, Category::OTHER),
            };
            BudgetConfig cfg;
            cfg.top_merchants = 1;
            SpendingAnalysis a = BudgetAnalyzer(cfg).analyze(txs, "USD");

            assert(approx(a.total_expenses, 100));
            assert(approx(a.total_income, 1000));
            assert(approx(a.net, 900));
            assert(a.expense_count == 3 && a.income_count == 1);
            assert(a.days == 10);
            assert(approx(a.avg_daily_expense, 50));
            assert(a.start.iso() == "2024-01-01" && a.end.iso() == "2024-01-10");

            const auto& food = a.categories.at(Category::FOOD);
            assert(approx(food.total, 70) && food.count == 2);
            assert(approx(food.mean, 35) && approx(food.share, 70));

            assert(approx(a.monthly_spending.at("2024-01"), 100));
            assert(approx(a.weekday_spending[0], 80));   // 2024-01-01 is a Monday
            assert(approx(a.weekday_spending[2], 20));

            assert(a.top_merchants.size() == 1);
            assert(a.top_merchants[0].first == "STARBUCKS");
            assert(approx(a.top_merchants[0].second, 70));

            auto j = a.to_json();
            assert(j["period"]["days"] == 10);
            assert(j["categories"]["food"]["count"] == 2);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";
    return failed == 0 ? 0 : 1;
}
