#include "classifier_model.hpp"
#include "../utils/logger.hpp"
#include "../utils/text_utils.hpp"
#include <cmath>
#include <fstream>

namespace ledgerflow {

std::shared_ptr<const NaiveBayesModel> NaiveBayesModel::from_json(const nlohmann::json& j,
                                                                   std::string& error) {
    try {
        if (j.value("format", "") != "multinomial_nb") {
            error = "unsupported model format '" + j.value("format", "") + "'";
            return nullptr;
        }

        auto model = std::make_shared<NaiveBayesModel>();
        for (const auto& c : j.at("classes")) {
            Category cat;
            if (!parse_category(c.get<std::string>(), cat)) {
                error = "unknown class '" + c.get<std::string>() + "'";
                return nullptr;
            }
            model->classes_.push_back(cat);
        }
        model->log_prior_ = j.at("class_log_prior").get<std::vector<double>>();

        size_t n = model->classes_.size();
        if (n == 0 || model->log_prior_.size() != n) {
            error = "class_log_prior does not match classes";
            return nullptr;
        }

        const auto& features = j.at("feature_log_prob");
        for (auto it = features.begin(); it != features.end(); ++it) {
            auto probs = it.value().get<std::vector<double>>();
            if (probs.size() != n) {
                error = "feature '" + it.key() + "' has " + std::to_string(probs.size()) +
                        " weights, expected " + std::to_string(n);
                return nullptr;
            }
            model->log_prob_.emplace(it.key(), std::move(probs));
        }
        return model;
    } catch (const nlohmann::json::exception& e) {
        error = std::string("malformed model: ") + e.what();
        return nullptr;
    }
}

Prediction NaiveBayesModel::predict(const std::string& text) const {
    Prediction p;
    std::vector<double> scores = log_prior_;

    size_t known = 0;
    for (const auto& token : split_words(text)) {
        auto it = log_prob_.find(token);
        if (it == log_prob_.end()) continue;
        known++;
        for (size_t k = 0; k < scores.size(); ++k) scores[k] += it->second[k];
    }
    if (known == 0) {
        p.error = "no known features";
        return p;
    }

    size_t best = 0;
    for (size_t k = 1; k < scores.size(); ++k) {
        if (scores[k] > scores[best]) best = k;
    }
    double denom = 0.0;
    for (double s : scores) denom += std::exp(s - scores[best]);

    p.ok = true;
    p.category = classes_[best];
    p.probability = 1.0 / denom;
    return p;
}

LoadedModel load_classifier(const std::string& path) {
    LoadedModel out;
    if (path.empty()) {
        out.status = Status::failure(ErrorKind::MODEL_UNAVAILABLE, "no model path configured");
        return out;
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        out.status = Status::failure(ErrorKind::MODEL_UNAVAILABLE,
            "cannot open model artifact " + path);
        return out;
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        out.status = Status::failure(ErrorKind::MODEL_UNAVAILABLE,
            "cannot parse model artifact " + path + ": " + e.what());
        return out;
    }

    std::string error;
    auto model = NaiveBayesModel::from_json(j, error);
    if (!model) {
        out.status = Status::failure(ErrorKind::MODEL_UNAVAILABLE, path + ": " + error);
        return out;
    }

    LOG_INF("[categorizer] loaded %s model from %s (%zu classes, %zu features)",
        model->name(), path.c_str(), model->classes().size(), model->vocabulary_size());
    out.model = model;
    return out;
}

} // namespace ledgerflow
