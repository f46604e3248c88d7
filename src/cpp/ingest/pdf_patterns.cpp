#include "pdf_patterns.hpp"

namespace ledgerflow {

namespace {

// Money token: optional sign/parentheses, optional symbol or prefix like
// "C$", two decimals required so reference numbers are not taken for amounts
const std::string kAmount =
    "\\(?-?(?:[A-Z]{1,3}\\$|\\$|€|£|¥|₹)?\\s?-?\\d[\\d,.]*[.,]\\d{2}\\)?(?:\\s?(?:CR|DR)|-)?";

const std::string kNumericDate =
    "\\d{4}-\\d{2}-\\d{2}|\\d{1,2}[/.-]\\d{1,2}[/.-]\\d{2,4}";

const std::string kNamedDate =
    "\\d{1,2}[ -][A-Za-z]{3}[ -]\\d{4}|[A-Za-z]{3} \\d{1,2},? \\d{4}";

const std::string kCurrencyCode =
    "USD|EUR|GBP|INR|JPY|CAD|AUD|CHF|CNY|SEK|NOK|DKK|PLN|CZK|HUF|RUB|BRL|MXN|"
    "ZAR|KRW|SGD|HKD|NZD|THB|MYR|IDR|PHP";

// Trailing running-balance column, ignored
const std::string kBalance = "(?:\\s+" + kAmount + ")?";

} // namespace

std::vector<PdfPatternSpec> default_pdf_patterns() {
    std::vector<PdfPatternSpec> rows;

    // 2024-01-15  HOTEL PARIS  EUR  120.00
    rows.push_back({"date_desc_code_amount",
        "^\\s*(" + kNumericDate + ")\\s+(.+?)\\s+(" + kCurrencyCode + ")\\s+(" + kAmount + ")" +
            kBalance + "\\s*$",
        1, 2, 4, 0, 0, 3});

    // 01/15/2024  STARBUCKS STORE 123  -5.75  1,204.25
    rows.push_back({"numeric_date_desc_amount",
        "^\\s*(" + kNumericDate + ")\\s+(.+?)\\s+(" + kAmount + ")" + kBalance + "\\s*$",
        1, 2, 3, 0, 0, 0});

    // 15 Jan 2024  NETFLIX.COM  15.99
    rows.push_back({"named_date_desc_amount",
        "^\\s*(" + kNamedDate + ")\\s+(.+?)\\s+(" + kAmount + ")" + kBalance + "\\s*$",
        1, 2, 3, 0, 0, 0});

    // 01/15  UBER TRIP  23.10   (statement year implied)
    rows.push_back({"short_date_desc_amount",
        "^\\s*(\\d{1,2}/\\d{1,2})\\s+(.+?)\\s+(" + kAmount + ")" + kBalance + "\\s*$",
        1, 2, 3, 0, 0, 0});

    return rows;
}

PdfPatternSpec pdf_pattern_from_json(const nlohmann::json& j) {
    PdfPatternSpec p;
    p.name = j.value("name", "custom");
    p.regex = j.value("regex", "");
    if (j.contains("fields")) {
        const auto& f = j["fields"];
        p.date_group = f.value("date", 0);
        p.description_group = f.value("description", 0);
        p.amount_group = f.value("amount", 0);
        p.debit_group = f.value("debit", 0);
        p.credit_group = f.value("credit", 0);
        p.currency_group = f.value("currency", 0);
    }
    return p;
}

} // namespace ledgerflow
