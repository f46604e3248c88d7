#include "rate_cache.hpp"
#include <mutex>

namespace ledgerflow {

void RateCache::put(const CurrencyRate& rate) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    rates_[key(rate.base, rate.quote)] = rate;
}

RateLookup RateCache::lookup(const std::string& base, const std::string& quote,
                             RateClock::time_point now) const {
    std::shared_lock<std::shared_mutex> lock(mu_);

    RateLookup direct;
    auto it = rates_.find(key(base, quote));
    if (it != rates_.end() && it->second.rate > 0) {
        direct.found = true;
        direct.rate = it->second.rate;
        direct.expired = it->second.expired(now);
        if (!direct.expired) return direct;
    }

    RateLookup inverse;
    auto inv = rates_.find(key(quote, base));
    if (inv != rates_.end() && inv->second.rate > 0) {
        inverse.found = true;
        inverse.inverse = true;
        inverse.rate = 1.0 / inv->second.rate;
        inverse.expired = inv->second.expired(now);
        if (!inverse.expired) return inverse;
    }

    if (direct.found) return direct;
    return inverse;
}

size_t RateCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return rates_.size();
}

void RateCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mu_);
    rates_.clear();
}

} // namespace ledgerflow
