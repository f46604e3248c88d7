#include "rate_provider.hpp"
#include "../utils/logger.hpp"

namespace ledgerflow {

std::map<std::string, double> default_units_per_usd() {
    return {
        {"USD", 1.0},    {"EUR", 0.85},   {"GBP", 0.73},   {"INR", 83.0},
        {"JPY", 110.0},  {"CAD", 1.25},   {"AUD", 1.35},   {"CHF", 0.92},
        {"CNY", 6.45},   {"SEK", 8.6},    {"NOK", 8.5},    {"DKK", 6.3},
        {"PLN", 3.9},    {"CZK", 21.5},   {"HUF", 295.0},  {"RUB", 73.5},
        {"BRL", 5.2},    {"MXN", 20.1},   {"ZAR", 14.2},   {"KRW", 1180.0},
        {"SGD", 1.35},   {"HKD", 7.8},    {"NZD", 1.42},   {"THB", 31.5},
        {"MYR", 4.15},   {"IDR", 14250.0}, {"PHP", 50.5},
    };
}

RateQuote StaticRateProvider::get_rate(const std::string& base, const std::string& quote) {
    RateQuote q;
    q.source = name();
    auto b = units_per_usd_.find(base);
    auto t = units_per_usd_.find(quote);
    if (b == units_per_usd_.end() || t == units_per_usd_.end() || b->second <= 0) {
        q.error = "no static rate for " + base + "/" + quote;
        return q;
    }
    q.ok = true;
    q.rate = t->second / b->second;
    return q;
}

RateQuote ChainedRateProvider::get_rate(const std::string& base, const std::string& quote) {
    RateQuote last;
    last.error = "no rate providers configured";
    for (const auto& p : providers_) {
        RateQuote q = p->get_rate(base, quote);
        if (q.ok) return q;
        LOG_DBG("[rates] %s has no %s/%s: %s", p->name(), base.c_str(), quote.c_str(),
            q.error.c_str());
        last = q;
    }
    return last;
}

} // namespace ledgerflow
