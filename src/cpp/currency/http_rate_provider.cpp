#include "http_rate_provider.hpp"
#include "../utils/logger.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace ledgerflow {

static size_t write_cb(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

static std::string escape(CURL* curl, const std::string& value) {
    char* out = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    if (!out) return "";
    std::string s(out);
    curl_free(out);
    return s;
}

HttpRateProvider::HttpRateProvider(std::string base_url, int timeout_sec, std::string access_key)
    : base_url_(std::move(base_url))
    , timeout_sec_(timeout_sec > 0 ? timeout_sec : 10)
    , access_key_(std::move(access_key))
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

RateQuote HttpRateProvider::parse_response(const std::string& body, const std::string& quote) {
    RateQuote q;
    q.source = "http";
    try {
        auto j = nlohmann::json::parse(body);
        if (j.contains("success") && j["success"].is_boolean() && !j["success"].get<bool>()) {
            q.error = "provider reported failure";
            if (j.contains("error")) q.error += ": " + j["error"].dump();
            return q;
        }

        double rate = 0.0;
        if (j.contains("result") && j["result"].is_number()) {
            rate = j["result"].get<double>();
        } else if (j.contains("info") && j["info"].contains("rate") && j["info"]["rate"].is_number()) {
            rate = j["info"]["rate"].get<double>();
        } else if (j.contains("rates") && j["rates"].contains(quote) && j["rates"][quote].is_number()) {
            rate = j["rates"][quote].get<double>();
        }

        if (rate <= 0.0) {
            q.error = "response carries no usable rate";
            return q;
        }
        q.ok = true;
        q.rate = rate;
    } catch (const nlohmann::json::exception& e) {
        q.error = std::string("JSON parse error: ") + e.what();
    }
    return q;
}

std::string HttpRateProvider::request_url(const std::string& base, const std::string& quote) const {
    CURL* curl = curl_easy_init();
    if (!curl) return "";
    std::string url = base_url_ + "/convert?from=" + escape(curl, base) +
        "&to=" + escape(curl, quote) + "&amount=1";
    if (!access_key_.empty()) url += "&access_key=" + escape(curl, access_key_);
    curl_easy_cleanup(curl);
    return url;
}

RateQuote HttpRateProvider::get_rate(const std::string& base, const std::string& quote) {
    RateQuote q;
    q.source = name();

    std::string url = request_url(base, quote);
    CURL* curl = url.empty() ? nullptr : curl_easy_init();
    if (!curl) {
        q.error = "curl_easy_init failed";
        return q;
    }

    std::string response;
    long http_code = 0;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout_sec_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        q.error = curl_easy_strerror(res);
        LOG_WRN("[rates] %s/%s fetch failed: %s", base.c_str(), quote.c_str(), q.error.c_str());
        return q;
    }
    if (http_code != 200) {
        q.error = "HTTP " + std::to_string(http_code);
        LOG_WRN("[rates] %s/%s fetch returned %s", base.c_str(), quote.c_str(), q.error.c_str());
        return q;
    }

    q = parse_response(response, quote);
    if (q.ok) {
        LOG_DBG("[rates] fetched %s/%s = %.6f", base.c_str(), quote.c_str(), q.rate);
    } else {
        LOG_WRN("[rates] %s/%s: %s", base.c_str(), quote.c_str(), q.error.c_str());
    }
    return q;
}

} // namespace ledgerflow
