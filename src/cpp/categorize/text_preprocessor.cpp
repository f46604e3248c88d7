#include "text_preprocessor.hpp"
#include "../utils/text_utils.hpp"
#include <unordered_set>

namespace ledgerflow {

bool is_stopword(const std::string& token) {
    static const std::unordered_set<std::string> words = {
        "a", "about", "above", "after", "again", "against", "all", "am", "an",
        "and", "any", "are", "as", "at", "be", "because", "been", "before",
        "being", "below", "between", "both", "but", "by", "can", "did", "do",
        "does", "doing", "down", "during", "each", "few", "for", "from",
        "further", "had", "has", "have", "having", "he", "her", "here", "hers",
        "herself", "him", "himself", "his", "how", "i", "if", "in", "into",
        "is", "it", "its", "itself", "just", "me", "more", "most", "my",
        "myself", "no", "nor", "not", "now", "of", "off", "on", "once", "only",
        "or", "other", "our", "ours", "ourselves", "out", "over", "own", "same",
        "she", "should", "so", "some", "such", "than", "that", "the", "their",
        "theirs", "them", "themselves", "then", "there", "these", "they",
        "this", "those", "through", "to", "too", "under", "until", "up", "very",
        "was", "we", "were", "what", "when", "where", "which", "while", "who",
        "whom", "why", "will", "with", "you", "your", "yours", "yourself",
        "yourselves"
    };
    return words.count(token) > 0;
}

std::vector<std::string> preprocess_tokens(const std::string& description) {
    std::vector<std::string> tokens;
    for (auto& w : split_words(normalize_words(description))) {
        if (w.size() < 2) continue;
        if (w.find_first_not_of("0123456789") == std::string::npos) continue;
        if (is_stopword(w)) continue;
        tokens.push_back(std::move(w));
    }
    return tokens;
}

std::string preprocess_text(const std::string& description) {
    std::string out;
    for (const auto& t : preprocess_tokens(description)) {
        if (!out.empty()) out += ' ';
        out += t;
    }
    return out;
}

} // namespace ledgerflow
