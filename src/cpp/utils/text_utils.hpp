#pragma once
// String helpers shared by the CSV/PDF parsers and the categorizer
#include <string>
#include <vector>

namespace ledgerflow {

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::string to_upper(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Lowercase, every non-alphanumeric ASCII byte becomes a single space.
// Bytes >= 0x80 (UTF-8 sequences) are kept as-is.
std::string normalize_words(const std::string& s);

// Splits on runs of spaces
std::vector<std::string> split_words(const std::string& s);

// Quote-aware record splitter: handles "" escapes, embedded delimiters and
// newlines inside quoted fields, CRLF line endings. Blank lines are skipped.
std::vector<std::vector<std::string>> split_csv_records(const std::string& text, char delim);

// Picks the most frequent of , ; TAB | outside quotes on the first line
char detect_delimiter(const std::string& first_line);

// First line with any non-whitespace content, without the terminator
std::string first_nonempty_line(const std::string& text);

} // namespace ledgerflow
