#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../model/status.hpp"
#include "../model/transaction.hpp"
#include "format_detector.hpp"

namespace ledgerflow {

// Row-level diagnostics. Rows that cannot be mapped are dropped and counted
// here instead of failing the statement.
struct ParseStats {
    StatementFormat format = StatementFormat::UNKNOWN;
    std::string encoding;
    std::vector<std::string> encodings_attempted;

    // CSV
    char delimiter = ',';
    size_t rows_total = 0;
    size_t dropped_bad_date = 0;
    size_t dropped_bad_amount = 0;
    size_t dropped_zero_amount = 0;
    size_t dropped_empty_description = 0;

    // PDF
    int pages_read = 0;
    size_t lines_scanned = 0;
    size_t lines_unmatched = 0;
    size_t lines_too_long = 0;     // Also counted as unmatched
    std::map<std::string, size_t> pattern_hits;

    size_t rows_parsed = 0;

    [[nodiscard]] size_t rows_dropped() const {
        return dropped_bad_date + dropped_bad_amount + dropped_zero_amount +
               dropped_empty_description;
    }

    // One line for error messages
    [[nodiscard]] std::string summary() const {
        std::string s = std::string("format=") + statement_format_str(format);
        if (!encoding.empty()) s += " encoding=" + encoding;
        if (format == StatementFormat::PDF) {
            s += " pages=" + std::to_string(pages_read) +
                 " lines=" + std::to_string(lines_scanned) +
                 " unmatched=" + std::to_string(lines_unmatched) +
                 " too_long=" + std::to_string(lines_too_long);
        } else {
            s += " rows=" + std::to_string(rows_total) +
                 " bad_date=" + std::to_string(dropped_bad_date) +
                 " bad_amount=" + std::to_string(dropped_bad_amount) +
                 " zero_amount=" + std::to_string(dropped_zero_amount) +
                 " empty_description=" + std::to_string(dropped_empty_description);
        }
        return s;
    }

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"format", statement_format_str(format)},
            {"encoding", encoding},
            {"encodings_attempted", encodings_attempted},
            {"rows_parsed", rows_parsed}
        };
        if (format == StatementFormat::PDF) {
            j["pages_read"] = pages_read;
            j["lines_scanned"] = lines_scanned;
            j["lines_unmatched"] = lines_unmatched;
            j["lines_too_long"] = lines_too_long;
            j["pattern_hits"] = pattern_hits;
        } else {
            j["delimiter"] = std::string(1, delimiter);
            j["rows_total"] = rows_total;
            j["dropped"] = {
                {"bad_date", dropped_bad_date},
                {"bad_amount", dropped_bad_amount},
                {"zero_amount", dropped_zero_amount},
                {"empty_description", dropped_empty_description}
            };
        }
        return j;
    }
};

struct ParseResult {
    std::vector<Transaction> transactions;
    ParseStats stats;
    Status status;
};

} // namespace ledgerflow
