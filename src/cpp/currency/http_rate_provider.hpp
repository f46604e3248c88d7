#pragma once
#include <string>
#include "rate_provider.hpp"

namespace ledgerflow {

// exchangerate.host style endpoint:
//   GET {base_url}/convert?from=EUR&to=USD&amount=1
//   -> {"success": true, "result": 1.08, ...}
// Also accepts {"rates": {"USD": 1.08}} and {"info": {"rate": 1.08}} bodies.
// Requests are bounded by timeout_sec; a timeout is reported as !ok.
class HttpRateProvider : public RateProvider {
public:
    HttpRateProvider(std::string base_url, int timeout_sec, std::string access_key = "");

    RateQuote get_rate(const std::string& base, const std::string& quote) override;
    [[nodiscard]] const char* name() const override { return "http"; }

    // Extracts the rate from a response body; exposed for tests
    static RateQuote parse_response(const std::string& body, const std::string& quote);

    // Query values are percent-encoded; empty when no curl handle is available
    [[nodiscard]] std::string request_url(const std::string& base, const std::string& quote) const;

private:
    std::string base_url_;
    long timeout_sec_;
    std::string access_key_;
};

} // namespace ledgerflow
