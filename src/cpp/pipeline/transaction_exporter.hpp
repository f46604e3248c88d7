#pragma once
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "statement_processor.hpp"
#include "../analysis/budget_analyzer.hpp"

namespace ledgerflow {

// Canonical CSV and JSON report writer
class TransactionExporter {
public:
    static constexpr const char* kCsvHeader = "date,description,amount,currency,category,type";

    // One row per transaction in the given order
    static void write_csv(const std::vector<Transaction>& txs, std::ostream& out);

    // Creates parent directories; false with error set on failure
    static bool export_csv(const std::vector<Transaction>& txs, const std::string& path,
                           std::string& error);

    static nlohmann::json build_report(const ProcessResult& result,
                                       const SpendingAnalysis& analysis,
                                       const BudgetReport& budget,
                                       bool include_transactions);

    static bool export_report(const nlohmann::json& report, const std::string& path,
                              std::string& error);

    // Shortest decimal text that reads back to the same double
    static std::string format_amount(double amount);

    static std::string csv_escape(const std::string& field);
};

} // namespace ledgerflow
