#pragma once
#include <string>
#include <vector>
#include "../model/status.hpp"

namespace ledgerflow {

enum class StatementFormat { UNKNOWN, CSV, PDF };

inline const char* statement_format_str(StatementFormat f) {
    switch (f) {
        case StatementFormat::UNKNOWN: return "unknown";
        case StatementFormat::CSV:     return "csv";
        case StatementFormat::PDF:     return "pdf";
    }
    return "??";
}

struct FormatDetection {
    StatementFormat format = StatementFormat::UNKNOWN;
    Status status;
};

// PDF by "%PDF-" signature in the first 1 KiB; CSV when the content is text
// and either the extension is .csv/.txt or the first line is delimited.
// Anything else is UNSUPPORTED_FORMAT.
FormatDetection detect_format(const std::vector<char>& data, const std::string& filename);

} // namespace ledgerflow
