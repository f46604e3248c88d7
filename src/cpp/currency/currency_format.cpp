#include "currency_format.hpp"
#include <cmath>
#include <cstdio>
#include <map>

namespace ledgerflow {

CurrencyFormat currency_format(const std::string& code) {
    static const std::map<std::string, CurrencyFormat> formats = {
        {"USD", {"$", true, 2}},
        {"EUR", {"\xE2\x82\xAC", true, 2}},
        {"GBP", {"\xC2\xA3", true, 2}},
        {"INR", {"\xE2\x82\xB9", true, 2}},
        {"JPY", {"\xC2\xA5", true, 0}},
        {"CNY", {"\xC2\xA5", true, 2}},
        {"KRW", {"\xE2\x82\xA9", true, 0}},
        {"CAD", {"C$", true, 2}},
        {"AUD", {"A$", true, 2}},
        {"NZD", {"NZ$", true, 2}},
        {"HKD", {"HK$", true, 2}},
        {"SGD", {"S$", true, 2}},
        {"BRL", {"R$", true, 2}},
        {"CHF", {"CHF ", true, 2}},
        {"SEK", {" kr", false, 2}},
        {"NOK", {" kr", false, 2}},
        {"DKK", {" kr", false, 2}},
        {"PLN", {" z\xC5\x82", false, 2}},
        {"RUB", {"\xE2\x82\xBD", true, 2}},
        {"MXN", {"MX$", true, 2}},
        {"ZAR", {"R", true, 2}},
        {"THB", {"\xE0\xB8\xBF", true, 2}},
        {"MYR", {"RM", true, 2}},
        {"IDR", {"Rp", true, 0}},
        {"PHP", {"\xE2\x82\xB1", true, 2}},
        {"BTC", {"\xE2\x82\xBF", true, 8}},
    };
    auto it = formats.find(code);
    if (it != formats.end()) return it->second;
    return {code + " ", true, 2};
}

std::string format_currency(double amount, const std::string& code) {
    CurrencyFormat f = currency_format(code);

    char digits[64];
    std::snprintf(digits, sizeof(digits), "%.*f", f.decimals, std::fabs(amount));
    std::string num(digits);

    size_t dot = num.find('.');
    std::string int_part = dot == std::string::npos ? num : num.substr(0, dot);
    std::string frac_part = dot == std::string::npos ? "" : num.substr(dot);

    std::string grouped;
    int count = 0;
    for (auto it = int_part.rbegin(); it != int_part.rend(); ++it) {
        if (count > 0 && count % 3 == 0) grouped.insert(grouped.begin(), ',');
        grouped.insert(grouped.begin(), *it);
        count++;
    }

    std::string body = grouped + frac_part;
    std::string sign = (amount < 0 && std::fabs(amount) >= 0.5 * std::pow(10.0, -f.decimals)) ? "-" : "";
    return f.symbol_before ? sign + f.symbol + body : sign + body + f.symbol;
}

} // namespace ledgerflow
