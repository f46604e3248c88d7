#include "currency_converter.hpp"
#include "currency_detector.hpp"
#include "../utils/logger.hpp"
#include <cmath>
#include <set>

namespace ledgerflow {

CurrencyConverter::CurrencyConverter(RateCache& cache,
                                     RateProvider* provider,
                                     std::chrono::seconds ttl,
                                     bool serve_stale,
                                     ClockFn clock)
    : cache_(cache)
    , provider_(provider)
    , ttl_(ttl)
    , serve_stale_(serve_stale)
    , clock_(std::move(clock))
{}

Conversion CurrencyConverter::rate(const std::string& from, const std::string& to) {
    Conversion c;
    std::string base;
    std::string quote;
    if (!normalize_currency_code(from, base) || !normalize_currency_code(to, quote)) {
        c.status = Status::failure(ErrorKind::RATE_UNAVAILABLE,
            "invalid currency pair " + from + "/" + to);
        return c;
    }

    if (base == quote) {
        c.rate = 1.0;
        return c;
    }

    auto t = now();
    RateLookup cached = cache_.lookup(base, quote, t);
    if (cached.found && !cached.expired) {
        c.rate = cached.rate;
        c.from_cache = true;
        return c;
    }

    std::string refresh_error = "no rate provider";
    if (provider_) {
        provider_calls_++;
        RateQuote q = provider_->get_rate(base, quote);
        if (q.ok && q.rate > 0) {
            cache_.put({base, quote, q.rate, t, ttl_});
            c.rate = q.rate;
            LOG_DBG("[currency] %s/%s = %.6f from %s", base.c_str(), quote.c_str(),
                q.rate, q.source.c_str());
            return c;
        }
        refresh_error = q.error;

        // Stale serving requires the refresh attempt above
        if (cached.found && serve_stale_) {
            LOG_WRN("[currency] refresh of %s/%s failed (%s), using expired rate %.6f",
                base.c_str(), quote.c_str(), refresh_error.c_str(), cached.rate);
            c.rate = cached.rate;
            c.from_cache = true;
            c.stale = true;
            return c;
        }
    }

    c.status = Status::failure(ErrorKind::RATE_UNAVAILABLE,
        "no rate for " + base + "/" + quote + ": " + refresh_error);
    return c;
}

Conversion CurrencyConverter::convert(double amount, const std::string& from, const std::string& to) {
    Conversion c = rate(from, to);
    if (c.status.ok()) c.amount = amount * c.rate;
    return c;
}

size_t CurrencyConverter::convert_all(std::vector<Transaction>& txs, const std::string& target,
                                      std::vector<std::string>& warnings) {
    std::string to;
    if (!normalize_currency_code(target, to)) {
        warnings.push_back("invalid target currency '" + target + "', conversion skipped");
        return 0;
    }

    size_t converted = 0;
    std::set<std::string> failed_pairs;
    for (auto& tx : txs) {
        if (tx.currency == to) continue;
        std::string pair = tx.currency + "/" + to;
        if (failed_pairs.count(pair)) continue;

        Conversion c = convert(tx.amount, tx.currency, to);
        if (!c.status.ok()) {
            failed_pairs.insert(pair);
            LOG_WRN("[currency] %s; %s amounts left unconverted",
                c.status.message.c_str(), tx.currency.c_str());
            warnings.push_back(std::string(error_kind_str(c.status.kind)) + ": " + c.status.message);
            continue;
        }

        tx.converted = true;
        tx.original_amount = tx.amount;
        tx.original_currency = tx.currency;
        tx.conversion_rate = c.rate;
        tx.amount = std::round(c.amount * 100.0) / 100.0;
        tx.currency = to;
        converted++;
    }

    if (converted > 0) {
        LOG_INF("[currency] converted %zu transactions to %s", converted, to.c_str());
    }
    return converted;
}

} // namespace ledgerflow
