#pragma once
// =============================================================================
// CSV statement normalizer
//
// Decodes the file, sniffs the delimiter, maps bank-specific header names onto
// the canonical fields and turns each data row into a Transaction. Required
// fields: date, description, amount (or a debit and/or credit column).
// =============================================================================

#include <cstddef>
#include <string>
#include <vector>
#include "parse_result.hpp"

namespace ledgerflow {

// Canonical column indices for one header row, -1 when absent
struct ColumnMap {
    int date = -1;
    int description = -1;
    int amount = -1;
    int debit = -1;
    int credit = -1;
    int category = -1;
    int currency = -1;
    int type = -1;

    [[nodiscard]] bool has_amount() const { return amount >= 0 || debit >= 0 || credit >= 0; }
    [[nodiscard]] std::vector<std::string> missing_required() const;
};

class CsvNormalizer {
public:
    explicit CsvNormalizer(size_t max_rows = 10000) : max_rows_(max_rows) {}

    // Full path: encoding ladder, then parse_text()
    ParseResult parse(const std::vector<char>& data) const;

    // Input already UTF-8 without BOM
    ParseResult parse_text(const std::string& text) const;

    // "Transaction Date" -> "date", "Payee" -> "description", "Debit" -> "debit".
    // Empty string for headers with no canonical meaning.
    static std::string canonical_column(const std::string& header);

    static ColumnMap map_columns(const std::vector<std::string>& header);

private:
    size_t max_rows_;
};

} // namespace ledgerflow
