#pragma once
// Date and amount parsing shared by the CSV and PDF paths
#include <string>
#include "../model/date.hpp"

namespace ledgerflow {

// Amounts beyond this magnitude are treated as parse errors
constexpr double kMaxAbsAmount = 1e9;

// Tries ISO, then US, then EU layouts, then month-name forms. Calendar
// validity is enforced (no Feb 30). When fallback_year > 0, year-less forms
// such as "01/15" or "15 Jan" are accepted and given that year.
bool parse_date(const std::string& text, Date& out, int fallback_year = 0);

// Accepts currency symbols, grouping separators, parentheses, leading or
// trailing minus, and CR/DR suffixes. The decimal separator is inferred:
// with both ',' and '.', the later one is decimal; with commas only, 3-digit
// groups mean grouping; several dots must form 3-digit groups.
bool parse_amount(const std::string& text, double& out);

} // namespace ledgerflow
