#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "category.hpp"
#include "date.hpp"

namespace ledgerflow {

enum class TransactionType { DEBIT, CREDIT };

inline const char* transaction_type_str(TransactionType t) {
    return t == TransactionType::CREDIT ? "credit" : "debit";
}

inline TransactionType type_for_amount(double amount) {
    return amount > 0 ? TransactionType::CREDIT : TransactionType::DEBIT;
}

// Which categorization strategy produced the label
enum class CategorySource { NONE, PROVIDED, CLASSIFIER, RULES, DEFAULT };

inline const char* category_source_str(CategorySource s) {
    switch (s) {
        case CategorySource::NONE:       return "none";
        case CategorySource::PROVIDED:   return "provided";
        case CategorySource::CLASSIFIER: return "classifier";
        case CategorySource::RULES:      return "rules";
        case CategorySource::DEFAULT:    return "default";
    }
    return "??";
}

// One canonical statement line. Created by a parser, enriched in place by
// currency detection and categorization, read-only afterwards.
struct Transaction {
    Date date;
    std::string description;
    double amount = 0.0;                 // Debit negative, credit positive
    std::string currency = "USD";        // ISO 4217
    Category category = Category::OTHER;
    double confidence = 0.0;             // [0,1]
    TransactionType type = TransactionType::DEBIT;
    size_t source_row = 0;               // 1-based data row / PDF line index

    // Parser hints consumed by detection and categorization
    std::string amount_text;
    std::string currency_hint;           // Explicit currency column
    std::string category_hint;           // Explicit category column
    CategorySource category_source = CategorySource::NONE;

    // Set by conversion to a target currency
    bool converted = false;
    double original_amount = 0.0;
    std::string original_currency;
    double conversion_rate = 1.0;

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"date", date.iso()},
            {"description", description},
            {"amount", amount},
            {"currency", currency},
            {"category", category_str(category)},
            {"confidence", confidence},
            {"type", transaction_type_str(type)},
            {"category_source", category_source_str(category_source)},
            {"source_row", source_row}
        };
        if (converted) {
            j["original_amount"] = original_amount;
            j["original_currency"] = original_currency;
            j["conversion_rate"] = conversion_rate;
        }
        return j;
    }
};

} // namespace ledgerflow
