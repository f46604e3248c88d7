#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ledgerflow {

struct RateQuote {
    bool ok = false;
    double rate = 0.0;       // 1 base = rate quote
    std::string source;      // Provider that answered
    std::string error;       // Empty on success
};

// Abstract exchange-rate source
class RateProvider {
public:
    virtual ~RateProvider() = default;

    // Must return within the provider's own timeout
    virtual RateQuote get_rate(const std::string& base, const std::string& quote) = 0;

    [[nodiscard]] virtual const char* name() const = 0;
};

// Units of each currency per 1 USD; approximate reference values
std::map<std::string, double> default_units_per_usd();

// Offline table, cross rates derived through USD
class StaticRateProvider : public RateProvider {
public:
    explicit StaticRateProvider(std::map<std::string, double> units_per_usd = default_units_per_usd())
        : units_per_usd_(std::move(units_per_usd)) {}

    RateQuote get_rate(const std::string& base, const std::string& quote) override;
    [[nodiscard]] const char* name() const override { return "static"; }

private:
    std::map<std::string, double> units_per_usd_;
};

// Asks each provider in order; the first successful quote wins
class ChainedRateProvider : public RateProvider {
public:
    void add(std::shared_ptr<RateProvider> provider) { providers_.push_back(std::move(provider)); }

    RateQuote get_rate(const std::string& base, const std::string& quote) override;
    [[nodiscard]] const char* name() const override { return "chain"; }

    [[nodiscard]] size_t size() const { return providers_.size(); }

private:
    std::vector<std::shared_ptr<RateProvider>> providers_;
};

} // namespace ledgerflow
