#pragma once
// =============================================================================
// Currency conversion over a TTL-bounded rate cache
//
// Lookup order: cache (direct, then inverse) -> provider refresh on miss or
// expiry -> stale cached rate if the refresh failed and stale serving is on.
// An expired rate is never used without a refresh attempt.
// =============================================================================

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "rate_cache.hpp"
#include "rate_provider.hpp"
#include "../model/status.hpp"
#include "../model/transaction.hpp"

namespace ledgerflow {

struct Conversion {
    double amount = 0.0;
    double rate = 0.0;
    bool from_cache = false;
    bool stale = false;
    Status status;
};

class CurrencyConverter {
public:
    using ClockFn = std::function<RateClock::time_point()>;

    // provider may be null (cache only)
    CurrencyConverter(RateCache& cache,
                      RateProvider* provider,
                      std::chrono::seconds ttl,
                      bool serve_stale,
                      ClockFn clock = ClockFn());

    Conversion rate(const std::string& from, const std::string& to);
    Conversion convert(double amount, const std::string& from, const std::string& to);

    // Converts every transaction not already in target. Failed pairs keep
    // their original currency and add one warning per pair. Returns the
    // number converted.
    size_t convert_all(std::vector<Transaction>& txs, const std::string& target,
                       std::vector<std::string>& warnings);

    [[nodiscard]] size_t provider_calls() const { return provider_calls_; }

private:
    RateClock::time_point now() const { return clock_ ? clock_() : RateClock::now(); }

    RateCache& cache_;
    RateProvider* provider_;
    std::chrono::seconds ttl_;
    bool serve_stale_;
    ClockFn clock_;
    size_t provider_calls_ = 0;
};

} // namespace ledgerflow
