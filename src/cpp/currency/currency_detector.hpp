#pragma once
// =============================================================================
// Currency detection
//
// Per transaction: explicit currency column, else a precedence-ordered scan of
// the amount text and description for symbols and codes, else the default.
// Per batch: primary currency by a weighted frequency/value vote.
// =============================================================================

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../model/transaction.hpp"

namespace ledgerflow {

struct CurrencyPattern {
    std::string token;   // "HK$", "€", "RM", "EUR"
    std::string code;
    enum class Kind {
        SYMBOL,          // Matches anywhere
        PREFIX,          // Letter-led symbol ("C$", "RM"): no letter right before it
        CODE             // ISO code: word boundaries on both sides
    } kind = Kind::SYMBOL;
};

// Multi-character symbols, then single glyphs, then ISO codes, then bare "$"
const std::vector<CurrencyPattern>& default_currency_patterns();

// Three ASCII letters; returns the upper-cased code in out
bool normalize_currency_code(const std::string& s, std::string& out);

struct CurrencyVote {
    std::string primary;
    std::vector<std::string> seen_order;
    std::map<std::string, size_t> counts;
    std::map<std::string, double> abs_totals;
    std::map<std::string, double> scores;

    nlohmann::json to_json() const;
};

class CurrencyDetector {
public:
    explicit CurrencyDetector(std::string default_currency = "USD",
                              double frequency_weight = 0.7,
                              double value_weight = 0.3);

    // Highest-precedence pattern found in either text; "" when none
    [[nodiscard]] std::string scan(const std::string& amount_text,
                                   const std::string& description) const;

    [[nodiscard]] std::string detect(const std::string& explicit_code,
                                     const std::string& amount_text,
                                     const std::string& description) const;

    // Sets tx.currency from its hints
    void assign(Transaction& tx) const;

    // score = w_f * count share + w_v * absolute value share; ties keep the
    // currency seen first
    [[nodiscard]] CurrencyVote vote(const std::vector<Transaction>& txs) const;

    [[nodiscard]] const std::string& default_currency() const { return default_currency_; }

private:
    std::string default_currency_;
    double frequency_weight_;
    double value_weight_;
};

} // namespace ledgerflow
