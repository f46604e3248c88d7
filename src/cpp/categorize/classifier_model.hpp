#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "../model/category.hpp"
#include "../model/status.hpp"

namespace ledgerflow {

struct Prediction {
    bool ok = false;
    Category category = Category::OTHER;
    double probability = 0.0;
    std::string error;   // Empty on success
};

// Opaque statistical classifier. Immutable once loaded; predict() must be
// safe to call from several chunk workers at once.
class ClassifierModel {
public:
    virtual ~ClassifierModel() = default;

    // text is the preprocessed description (see text_preprocessor.hpp)
    [[nodiscard]] virtual Prediction predict(const std::string& text) const = 0;

    [[nodiscard]] virtual const char* name() const = 0;
};

// Multinomial naive Bayes exported by the offline trainer:
// {
//   "format": "multinomial_nb",
//   "classes": ["food", "transport", ...],
//   "class_log_prior": [-2.1, ...],
//   "feature_log_prob": {"coffee": [-3.2, ...], ...}
// }
class NaiveBayesModel : public ClassifierModel {
public:
    // nullptr and a message in error when the artifact is malformed
    static std::shared_ptr<const NaiveBayesModel> from_json(const nlohmann::json& j,
                                                            std::string& error);

    [[nodiscard]] Prediction predict(const std::string& text) const override;
    [[nodiscard]] const char* name() const override { return "multinomial_nb"; }

    [[nodiscard]] size_t vocabulary_size() const { return log_prob_.size(); }
    [[nodiscard]] const std::vector<Category>& classes() const { return classes_; }

private:
    std::vector<Category> classes_;
    std::vector<double> log_prior_;
    std::unordered_map<std::string, std::vector<double>> log_prob_;
};

struct LoadedModel {
    std::shared_ptr<const ClassifierModel> model;   // Null when unavailable
    Status status;                                  // MODEL_UNAVAILABLE on failure
};

LoadedModel load_classifier(const std::string& path);

} // namespace ledgerflow
