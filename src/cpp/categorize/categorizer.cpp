#include "categorizer.hpp"
#include "text_preprocessor.hpp"
#include "../config.hpp"
#include "../utils/logger.hpp"
#include <algorithm>

namespace ledgerflow {

CategoryDecision ProvidedCategoryStrategy::evaluate(const Transaction& tx) const {
    CategoryDecision d;
    Category c;
    if (tx.category_hint.empty() || !parse_category(tx.category_hint, c) || c == Category::OTHER) {
        return d;
    }
    d.resolved = true;
    d.category = c;
    d.confidence = std::min(1.0, std::max(0.0, confidence_));
    d.source = CategorySource::PROVIDED;
    return d;
}

CategoryDecision ClassifierStrategy::evaluate(const Transaction& tx) const {
    CategoryDecision d;
    if (!model_) return d;

    std::string text = preprocess_text(tx.description);
    if (text.empty()) return d;

    Prediction p;
    try {
        p = model_->predict(text);
    } catch (const std::exception& e) {
        LOG_DBG("[categorizer] %s failed on row %zu: %s", model_->name(), tx.source_row, e.what());
        return d;
    }
    if (!p.ok || p.probability < threshold_) return d;

    d.resolved = true;
    d.category = p.category;
    d.confidence = std::min(1.0, std::max(0.0, p.probability));
    d.source = CategorySource::CLASSIFIER;
    return d;
}

CategoryDecision RuleStrategy::evaluate(const Transaction& tx) const {
    CategoryDecision d;
    RuleScore s = scorer_.score(tx.description);
    if (s.score <= 0) return d;
    d.resolved = true;
    d.category = s.category;
    d.confidence = s.confidence;
    d.source = CategorySource::RULES;
    return d;
}

CategoryDecision DefaultStrategy::evaluate(const Transaction&) const {
    CategoryDecision d;
    d.resolved = true;
    d.category = Category::OTHER;
    d.confidence = 0.0;
    d.source = CategorySource::DEFAULT;
    return d;
}

void Categorizer::add_strategy(std::unique_ptr<CategorizationStrategy> strategy) {
    strategies_.push_back(std::move(strategy));
}

CategoryDecision Categorizer::categorize(const Transaction& tx) const {
    for (const auto& s : strategies_) {
        CategoryDecision d = s->evaluate(tx);
        if (d.resolved) return d;
    }
    return DefaultStrategy().evaluate(tx);
}

void Categorizer::apply(Transaction& tx) const {
    CategoryDecision d = categorize(tx);
    tx.category = d.category;
    tx.confidence = d.confidence;
    tx.category_source = d.source;
}

std::vector<std::string> Categorizer::strategy_names() const {
    std::vector<std::string> names;
    for (const auto& s : strategies_) names.push_back(s->name());
    return names;
}

std::unique_ptr<Categorizer> Categorizer::build(const PipelineConfig& cfg,
                                                std::shared_ptr<const ClassifierModel> model) {
    auto cat = std::make_unique<Categorizer>();
    cat->add_strategy(std::make_unique<ProvidedCategoryStrategy>(cfg.provided_category_confidence));
    if (model) {
        cat->add_strategy(std::make_unique<ClassifierStrategy>(model, cfg.confidence_threshold));
    }
    cat->add_strategy(std::make_unique<RuleStrategy>(
        RuleScorer(cfg.category_rules, cfg.category_priority, cfg.rule_score_scale)));
    cat->add_strategy(std::make_unique<DefaultStrategy>());
    return cat;
}

} // namespace ledgerflow
