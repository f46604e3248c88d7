#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <shared_mutex>
#include <string>

namespace ledgerflow {

using RateClock = std::chrono::system_clock;

struct CurrencyRate {
    std::string base;
    std::string quote;
    double rate = 0.0;                 // 1 base = rate quote
    RateClock::time_point fetched_at{};
    std::chrono::seconds ttl{3600};

    [[nodiscard]] bool expired(RateClock::time_point now) const {
        return now - fetched_at >= ttl;
    }
};

struct RateLookup {
    bool found = false;
    bool expired = false;
    bool inverse = false;   // Derived from the stored quote->base rate
    double rate = 0.0;
};

// Process-wide rate store. Read-mostly: lookups take a shared lock,
// put() an exclusive one.
class RateCache {
public:
    void put(const CurrencyRate& rate);

    // Fresh direct, then fresh inverse, then expired direct, then expired
    // inverse. found=false when neither pair is stored.
    [[nodiscard]] RateLookup lookup(const std::string& base, const std::string& quote,
                                    RateClock::time_point now) const;

    [[nodiscard]] size_t size() const;
    void clear();

private:
    static std::string key(const std::string& base, const std::string& quote) {
        return base + "/" + quote;
    }

    mutable std::shared_mutex mu_;
    std::map<std::string, CurrencyRate> rates_;
};

} // namespace ledgerflow
