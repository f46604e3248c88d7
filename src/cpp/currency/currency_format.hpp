#pragma once
#include <string>

namespace ledgerflow {

struct CurrencyFormat {
    std::string symbol;
    bool symbol_before = true;
    int decimals = 2;
};

// Unknown codes fall back to "<CODE> " before the amount with 2 decimals
CurrencyFormat currency_format(const std::string& code);

// "$1,234.56", "-£12.00", "¥1,500", "1,234.56 kr"
std::string format_currency(double amount, const std::string& code);

} // namespace ledgerflow
