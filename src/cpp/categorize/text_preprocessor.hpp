#pragma once
#include <string>
#include <vector>

namespace ledgerflow {

// Lowercase, split on non-alphanumerics, drop English stopwords, pure
// numbers and tokens shorter than two characters
std::vector<std::string> preprocess_tokens(const std::string& description);

// Tokens joined with single spaces; the classifier input
std::string preprocess_text(const std::string& description);

bool is_stopword(const std::string& token);

} // namespace ledgerflow
