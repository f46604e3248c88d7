#pragma once
// =============================================================================
// Categorizer: ordered chain of strategies
//
//   provided column -> classifier (>= threshold) -> keyword rules -> other
//
// Each strategy either resolves the transaction or passes. The chain always
// ends in DefaultStrategy, so categorize() never fails.
// =============================================================================

#include <memory>
#include <string>
#include <vector>
#include "category_rules.hpp"
#include "classifier_model.hpp"
#include "../model/transaction.hpp"

namespace ledgerflow {

struct PipelineConfig;

struct CategoryDecision {
    bool resolved = false;
    Category category = Category::OTHER;
    double confidence = 0.0;
    CategorySource source = CategorySource::NONE;
};

class CategorizationStrategy {
public:
    virtual ~CategorizationStrategy() = default;

    [[nodiscard]] virtual CategoryDecision evaluate(const Transaction& tx) const = 0;
    [[nodiscard]] virtual const char* name() const = 0;
};

// Keeps a category column value naming a known category other than "other"
class ProvidedCategoryStrategy : public CategorizationStrategy {
public:
    explicit ProvidedCategoryStrategy(double confidence) : confidence_(confidence) {}

    [[nodiscard]] CategoryDecision evaluate(const Transaction& tx) const override;
    [[nodiscard]] const char* name() const override { return "provided"; }

private:
    double confidence_;
};

class ClassifierStrategy : public CategorizationStrategy {
public:
    ClassifierStrategy(std::shared_ptr<const ClassifierModel> model, double threshold)
        : model_(std::move(model)), threshold_(threshold) {}

    [[nodiscard]] CategoryDecision evaluate(const Transaction& tx) const override;
    [[nodiscard]] const char* name() const override { return "classifier"; }

private:
    std::shared_ptr<const ClassifierModel> model_;
    double threshold_;
};

class RuleStrategy : public CategorizationStrategy {
public:
    explicit RuleStrategy(RuleScorer scorer) : scorer_(std::move(scorer)) {}

    [[nodiscard]] CategoryDecision evaluate(const Transaction& tx) const override;
    [[nodiscard]] const char* name() const override { return "rules"; }

private:
    RuleScorer scorer_;
};

class DefaultStrategy : public CategorizationStrategy {
public:
    [[nodiscard]] CategoryDecision evaluate(const Transaction& tx) const override;
    [[nodiscard]] const char* name() const override { return "default"; }
};

class Categorizer {
public:
    void add_strategy(std::unique_ptr<CategorizationStrategy> strategy);

    [[nodiscard]] CategoryDecision categorize(const Transaction& tx) const;

    // Writes category, confidence and category_source into tx
    void apply(Transaction& tx) const;

    [[nodiscard]] std::vector<std::string> strategy_names() const;

    // provided -> classifier (when model is non-null) -> rules -> default
    static std::unique_ptr<Categorizer> build(const PipelineConfig& cfg,
                                              std::shared_ptr<const ClassifierModel> model);

private:
    std::vector<std::unique_ptr<CategorizationStrategy>> strategies_;
};

} // namespace ledgerflow
