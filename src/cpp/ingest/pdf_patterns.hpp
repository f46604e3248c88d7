#pragma once
// =============================================================================
// PDF statement line layouts
//
// Each row is a regex applied to one line of extracted text plus the capture
// groups that hold each field (0 = not present). Rows are tried in order and
// the first match wins, so more specific layouts come first. Additional bank
// layouts are supplied through the "pdf_patterns" config array.
// =============================================================================

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ledgerflow {

struct PdfPatternSpec {
    std::string name;
    std::string regex;
    int date_group = 0;
    int description_group = 0;
    int amount_group = 0;      // Signed amount column
    int debit_group = 0;       // Separate debit/credit columns, used when
    int credit_group = 0;      // amount_group is 0
    int currency_group = 0;    // Optional ISO code column
};

std::vector<PdfPatternSpec> default_pdf_patterns();

// {"name": "...", "regex": "...", "fields": {"date": 1, "description": 2, ...}}
PdfPatternSpec pdf_pattern_from_json(const nlohmann::json& j);

} // namespace ledgerflow
