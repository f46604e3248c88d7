#include "currency_detector.hpp"
#include "../utils/logger.hpp"
#include <cctype>
#include <cmath>

namespace ledgerflow {

namespace {

bool is_ascii_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_ascii_alnum(char c) {
    return is_ascii_alpha(c) || (c >= '0' && c <= '9');
}

bool next_is_amount(const std::string& text, size_t pos) {
    while (pos < text.size() && text[pos] == ' ') pos++;
    return pos < text.size() &&
           (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '-');
}

bool pattern_matches(const CurrencyPattern& p, const std::string& text) {
    size_t pos = text.find(p.token);
    while (pos != std::string::npos) {
        bool before_ok = pos == 0 || !is_ascii_alpha(text[pos - 1]);
        size_t after = pos + p.token.size();

        switch (p.kind) {
            case CurrencyPattern::Kind::SYMBOL:
                return true;
            case CurrencyPattern::Kind::PREFIX: {
                bool letters_only = is_ascii_alpha(p.token.back());
                // "RM 12.50" yes, "FARM" no
                if (before_ok && (!letters_only || next_is_amount(text, after))) return true;
                break;
            }
            case CurrencyPattern::Kind::CODE: {
                bool start_ok = pos == 0 || !is_ascii_alnum(text[pos - 1]);
                bool end_ok = after >= text.size() || !is_ascii_alnum(text[after]);
                if (start_ok && end_ok) return true;
                break;
            }
        }
        pos = text.find(p.token, pos + 1);
    }
    return false;
}

} // namespace

const std::vector<CurrencyPattern>& default_currency_patterns() {
    using K = CurrencyPattern::Kind;
    static const std::vector<CurrencyPattern> patterns = {
        // Prefixed dollars before bare "$"
        {"HK$", "HKD", K::PREFIX},
        {"NZ$", "NZD", K::PREFIX},
        {"US$", "USD", K::PREFIX},
        {"C$",  "CAD", K::PREFIX},
        {"A$",  "AUD", K::PREFIX},
        {"R$",  "BRL", K::PREFIX},
        {"S$",  "SGD", K::PREFIX},
        {"RM",  "MYR", K::PREFIX},
        {"Rp",  "IDR", K::PREFIX},

        {"\xE2\x82\xB9", "INR", K::SYMBOL},   // ₹
        {"\xE2\x82\xAC", "EUR", K::SYMBOL},   // €
        {"\xC2\xA3",     "GBP", K::SYMBOL},   // £
        {"\xE2\x82\xB1", "PHP", K::SYMBOL},   // ₱
        {"\xE2\x82\xBD", "RUB", K::SYMBOL},   // ₽
        {"\xE2\x82\xA9", "KRW", K::SYMBOL},   // ₩
        {"\xE0\xB8\xBF", "THB", K::SYMBOL},   // ฿
        {"\xE2\x82\xBF", "BTC", K::SYMBOL},   // ₿
        {"\xEF\xBF\xA5", "CNY", K::SYMBOL},   // ￥ (fullwidth)
        {"\xC2\xA5",     "JPY", K::SYMBOL},   // ¥

        {"USD", "USD", K::CODE}, {"EUR", "EUR", K::CODE}, {"GBP", "GBP", K::CODE},
        {"INR", "INR", K::CODE}, {"JPY", "JPY", K::CODE}, {"CAD", "CAD", K::CODE},
        {"AUD", "AUD", K::CODE}, {"CHF", "CHF", K::CODE}, {"CNY", "CNY", K::CODE},
        {"SEK", "SEK", K::CODE}, {"NOK", "NOK", K::CODE}, {"DKK", "DKK", K::CODE},
        {"PLN", "PLN", K::CODE}, {"CZK", "CZK", K::CODE}, {"HUF", "HUF", K::CODE},
        {"RUB", "RUB", K::CODE}, {"BRL", "BRL", K::CODE}, {"MXN", "MXN", K::CODE},
        {"ZAR", "ZAR", K::CODE}, {"KRW", "KRW", K::CODE}, {"SGD", "SGD", K::CODE},
        {"HKD", "HKD", K::CODE}, {"NZD", "NZD", K::CODE}, {"THB", "THB", K::CODE},
        {"MYR", "MYR", K::CODE}, {"IDR", "IDR", K::CODE}, {"PHP", "PHP", K::CODE},

        // Bare "$" only when nothing above disambiguates it
        {"$", "USD", K::SYMBOL},
    };
    return patterns;
}

bool normalize_currency_code(const std::string& s, std::string& out) {
    std::string code;
    for (char c : s) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        if (!is_ascii_alpha(c)) return false;
        code += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (code.size() != 3) return false;
    out = code;
    return true;
}

nlohmann::json CurrencyVote::to_json() const {
    nlohmann::json j = {{"primary", primary}, {"currencies", nlohmann::json::array()}};
    for (const auto& code : seen_order) {
        j["currencies"].push_back({
            {"code", code},
            {"count", counts.at(code)},
            {"abs_total", abs_totals.at(code)},
            {"score", scores.at(code)}
        });
    }
    return j;
}

CurrencyDetector::CurrencyDetector(std::string default_currency,
                                   double frequency_weight,
                                   double value_weight)
    : frequency_weight_(frequency_weight)
    , value_weight_(value_weight)
{
    if (!normalize_currency_code(default_currency, default_currency_)) {
        LOG_WRN("[currency] invalid default currency '%s', using USD", default_currency.c_str());
        default_currency_ = "USD";
    }
}

std::string CurrencyDetector::scan(const std::string& amount_text,
                                   const std::string& description) const {
    for (const auto& p : default_currency_patterns()) {
        if (pattern_matches(p, amount_text) || pattern_matches(p, description)) {
            return p.code;
        }
    }
    return "";
}

std::string CurrencyDetector::detect(const std::string& explicit_code,
                                     const std::string& amount_text,
                                     const std::string& description) const {
    std::string code;
    if (!explicit_code.empty() && normalize_currency_code(explicit_code, code)) return code;

    code = scan(amount_text, description);
    if (!code.empty()) return code;
    return default_currency_;
}

void CurrencyDetector::assign(Transaction& tx) const {
    tx.currency = detect(tx.currency_hint, tx.amount_text, tx.description);
}

CurrencyVote CurrencyDetector::vote(const std::vector<Transaction>& txs) const {
    CurrencyVote v;
    double total_abs = 0.0;
    for (const auto& tx : txs) {
        if (v.counts.find(tx.currency) == v.counts.end()) {
            v.seen_order.push_back(tx.currency);
            v.abs_totals[tx.currency] = 0.0;
        }
        v.counts[tx.currency]++;
        v.abs_totals[tx.currency] += std::fabs(tx.amount);
        total_abs += std::fabs(tx.amount);
    }

    if (txs.empty()) {
        v.primary = default_currency_;
        return v;
    }

    double best = -1.0;
    for (const auto& code : v.seen_order) {
        double freq_share = static_cast<double>(v.counts[code]) / static_cast<double>(txs.size());
        double value_share = total_abs > 0 ? v.abs_totals[code] / total_abs : 0.0;
        double score = frequency_weight_ * freq_share + value_weight_ * value_share;
        v.scores[code] = score;
        if (score > best) {
            best = score;
            v.primary = code;
        }
    }
    return v;
}

} // namespace ledgerflow
