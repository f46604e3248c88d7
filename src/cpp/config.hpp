#pragma once
#include <cstddef>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "model/category.hpp"
#include "categorize/category_rules.hpp"
#include "ingest/pdf_patterns.hpp"
#include "utils/logger.hpp"

namespace ledgerflow {

// Share of monthly income recommended per category
inline std::map<Category, double> default_budget_percentages() {
    return {
        {Category::FOOD,          0.15},
        {Category::TRANSPORT,     0.10},
        {Category::ENTERTAINMENT, 0.05},
        {Category::SHOPPING,      0.10},
        {Category::UTILITIES,     0.08},
        {Category::HEALTHCARE,    0.08},
        {Category::EDUCATION,     0.05},
        {Category::TRAVEL,        0.05},
        {Category::INSURANCE,     0.08},
        {Category::INVESTMENT,    0.20},
        {Category::OTHER,         0.06},
    };
}

// Exchange-rate source
struct RateConfig {
    std::string provider_url = "https://api.exchangerate.host";
    std::string access_key;        // Appended as access_key= when set
    int timeout_sec = 10;
    int ttl_sec = 3600;
    bool use_fallback_rates = true;
    bool serve_stale_rates = true;
};

// Budget thresholds
struct BudgetConfig {
    std::map<Category, double> percentages = default_budget_percentages();
    double high_severity_ratio = 1.5;      // actual > ratio * recommended -> high
    double overall_spending_ratio = 0.8;   // spend > ratio * income -> overall alert
    double min_savings_rate = 0.2;         // below -> savings alert
    size_t top_merchants = 10;
};

// Full pipeline configuration
struct PipelineConfig {
    // Chunking
    size_t chunk_size = 1000;
    size_t max_rows = 10000;
    size_t max_workers = 4;
    size_t max_file_bytes = 16 * 1024 * 1024;   // Checked before the file is read

    // Ingest
    int pdf_max_pages = 50;
    size_t pdf_max_line_length = 512;
    std::vector<PdfPatternSpec> pdf_patterns = default_pdf_patterns();

    // Categorization
    std::string model_path = "models/categorization_model.json";
    double confidence_threshold = 0.4;
    double provided_category_confidence = 0.9;
    double rule_score_scale = 5.0;
    std::vector<CategoryRule> category_rules = default_category_rules();
    std::vector<Category> category_priority = default_category_priority();

    // Currency
    std::string default_currency = "USD";
    std::string target_currency;   // Empty: no conversion
    double vote_frequency_weight = 0.7;
    double vote_value_weight = 0.3;
    RateConfig rates;

    BudgetConfig budget;

    // Logging
    std::string log_level = "info";
    std::string log_file;

    static PipelineConfig from_json(const std::string& path);
};

inline std::vector<CategoryRule> parse_category_rules(const nlohmann::json& j) {
    std::vector<CategoryRule> rules;
    for (auto it = j.begin(); it != j.end(); ++it) {
        CategoryRule rule;
        if (!parse_category(it.key(), rule.category)) {
            LOG_WRN("[config] Unknown category in category_rules: %s", it.key().c_str());
            continue;
        }
        for (auto kw = it.value().begin(); kw != it.value().end(); ++kw) {
            rule.keywords.push_back({kw.key(), kw.value().get<double>()});
        }
        rules.push_back(std::move(rule));
    }
    return rules;
}

inline PipelineConfig PipelineConfig::from_json(const std::string& path) {
    PipelineConfig cfg;

    std::ifstream f(path);
    if (!f.is_open()) {
        LOG_WRN("[config] Cannot open %s, using defaults", path.c_str());
        return cfg;
    }

    try {
        nlohmann::json j;
        f >> j;

        cfg.chunk_size = j.value("chunk_size", cfg.chunk_size);
        cfg.max_rows = j.value("max_rows", cfg.max_rows);
        cfg.max_workers = j.value("max_workers", cfg.max_workers);
        cfg.max_file_bytes = j.value("max_file_bytes", cfg.max_file_bytes);
        cfg.pdf_max_pages = j.value("pdf_max_pages", cfg.pdf_max_pages);
        cfg.pdf_max_line_length = j.value("pdf_max_line_length", cfg.pdf_max_line_length);
        cfg.model_path = j.value("model_path", cfg.model_path);
        cfg.confidence_threshold = j.value("confidence_threshold", cfg.confidence_threshold);
        cfg.provided_category_confidence =
            j.value("provided_category_confidence", cfg.provided_category_confidence);
        cfg.rule_score_scale = j.value("rule_score_scale", cfg.rule_score_scale);
        cfg.default_currency = j.value("default_currency", cfg.default_currency);
        cfg.target_currency = j.value("target_currency", cfg.target_currency);
        cfg.vote_frequency_weight = j.value("vote_frequency_weight", cfg.vote_frequency_weight);
        cfg.vote_value_weight = j.value("vote_value_weight", cfg.vote_value_weight);
        cfg.log_level = j.value("log_level", cfg.log_level);
        cfg.log_file = j.value("log_file", cfg.log_file);

        if (j.contains("rates")) {
            const auto& r = j["rates"];
            cfg.rates.provider_url = r.value("provider_url", cfg.rates.provider_url);
            cfg.rates.access_key = r.value("access_key", cfg.rates.access_key);
            cfg.rates.timeout_sec = r.value("timeout_sec", cfg.rates.timeout_sec);
            cfg.rates.ttl_sec = r.value("ttl_sec", cfg.rates.ttl_sec);
            cfg.rates.use_fallback_rates = r.value("use_fallback_rates", cfg.rates.use_fallback_rates);
            cfg.rates.serve_stale_rates = r.value("serve_stale_rates", cfg.rates.serve_stale_rates);
        }

        if (j.contains("budget")) {
            const auto& b = j["budget"];
            cfg.budget.high_severity_ratio = b.value("high_severity_ratio", cfg.budget.high_severity_ratio);
            cfg.budget.overall_spending_ratio =
                b.value("overall_spending_ratio", cfg.budget.overall_spending_ratio);
            cfg.budget.min_savings_rate = b.value("min_savings_rate", cfg.budget.min_savings_rate);
            cfg.budget.top_merchants = b.value("top_merchants", cfg.budget.top_merchants);
            if (b.contains("percentages")) {
                for (auto it = b["percentages"].begin(); it != b["percentages"].end(); ++it) {
                    Category c;
                    if (parse_category(it.key(), c)) {
                        cfg.budget.percentages[c] = it.value().get<double>();
                    } else {
                        LOG_WRN("[config] Unknown category in budget.percentages: %s",
                            it.key().c_str());
                    }
                }
            }
        }

        if (j.contains("category_rules")) {
            auto rules = parse_category_rules(j["category_rules"]);
            // "replace_default_rules": false merges on top of the built-in table
            if (j.value("replace_default_rules", false)) {
                cfg.category_rules = std::move(rules);
            } else {
                cfg.category_rules.insert(cfg.category_rules.end(), rules.begin(), rules.end());
            }
        }

        if (j.contains("category_priority")) {
            cfg.category_priority.clear();
            for (const auto& name : j["category_priority"]) {
                Category c;
                if (parse_category(name.get<std::string>(), c)) cfg.category_priority.push_back(c);
            }
        }

        if (j.contains("pdf_patterns")) {
            std::vector<PdfPatternSpec> custom;
            for (const auto& p : j["pdf_patterns"]) custom.push_back(pdf_pattern_from_json(p));
            // Custom layouts take precedence over the built-in rows
            custom.insert(custom.end(), cfg.pdf_patterns.begin(), cfg.pdf_patterns.end());
            cfg.pdf_patterns = std::move(custom);
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERR("[config] Invalid config %s: %s", path.c_str(), e.what());
        return PipelineConfig{};
    }

    if (cfg.chunk_size == 0) cfg.chunk_size = 1;
    if (cfg.max_workers == 0) cfg.max_workers = 1;
    return cfg;
}

} // namespace ledgerflow
