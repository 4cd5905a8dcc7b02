#include "purged_cv.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace validation {

    namespace {

        int signOf(double value) {
            return (value > 0.0) - (value < 0.0);
        }

        template <typename T>
        std::vector<T> selectRows(const std::vector<T>& rows, const std::vector<std::size_t>& indices) {
            std::vector<T> selected;
            selected.reserve(indices.size());
            for (std::size_t idx : indices) {
                selected.push_back(rows[idx]);
            }
            return selected;
        }

    } // end anonymous namespace

    double directionalAccuracy(const std::vector<double>& y_true, const std::vector<double>& y_pred) {
        if (y_true.size() != y_pred.size()) {
            throw core::ValidationException(fmt::format(
                "directionalAccuracy: {} targets vs {} predictions", y_true.size(), y_pred.size()));
        }
        if (y_true.empty()) {
            throw core::ValidationException("directionalAccuracy: no samples to score");
        }
        std::size_t hits = 0;
        for (std::size_t i = 0; i < y_true.size(); ++i) {
            if (signOf(y_true[i]) == signOf(y_pred[i])) {
                ++hits;
            }
        }
        return static_cast<double>(hits) / static_cast<double>(y_true.size());
    }

    CrossValidationResult purgedCrossValidate(const ModelFactoryFn& model_factory,
                                              const FeatureMatrix& X,
                                              const std::vector<double>& y,
                                              const PurgedCvConfig& config,
                                              const ScoreFn& score_fn)
    {
        auto logger = core::logging::getLogger();
        if (!model_factory || !score_fn) {
            throw core::ValidationException("purgedCrossValidate requires a model factory and a score function");
        }
        if (X.size() != y.size()) {
            throw core::ValidationException(fmt::format(
                "Feature matrix has {} rows but target has {} values", X.size(), y.size()));
        }

        const auto folds = purgedWalkForwardSplits(X.size(), config.n_splits, config.train_frac,
                                                   config.window_type, config.purge_bars);
        if (folds.empty()) {
            throw core::NoValidWindowsException(
                fmt::format("No fold kept {} training samples after purging {} bars ({} samples, n_splits={})",
                            kMinPurgedTrainBars, config.purge_bars, X.size(), config.n_splits),
                config.n_splits, X.size());
        }

        CrossValidationResult result;
        for (const PurgedFold& fold : folds) {
            const int k = fold.fold_idx;

            auto model = model_factory();
            if (!model) {
                throw core::ValidationException(fmt::format("model_factory returned no model for fold {}", k));
            }
            model->fit(selectRows(X, fold.train_indices), selectRows(y, fold.train_indices));

            const auto y_test = selectRows(y, fold.test_indices);
            const auto y_pred = model->predict(selectRows(X, fold.test_indices));
            if (y_pred.size() != y_test.size()) {
                throw core::ValidationException(fmt::format(
                    "Model returned {} predictions for {} test samples in fold {}", y_pred.size(), y_test.size(), k));
            }

            FoldScore score;
            score.fold_idx = k;
            score.n_train = fold.train_indices.size();
            score.n_test = fold.test_indices.size();
            score.score = score_fn(y_test, y_pred);
            logger->debug("CV fold {}: {} train / {} test samples, score {:.4f}",
                          k, score.n_train, score.n_test, score.score);
            result.folds.push_back(score);
        }

        double sum = 0.0;
        for (const auto& fold : result.folds) sum += fold.score;
        result.mean_score = sum / static_cast<double>(result.folds.size());

        double sq = 0.0;
        for (const auto& fold : result.folds) sq += (fold.score - result.mean_score) * (fold.score - result.mean_score);
        result.std_score = std::sqrt(sq / static_cast<double>(result.folds.size()));

        logger->info("Purged CV: {} folds, mean score {:.4f} (std {:.4f})",
                     result.folds.size(), result.mean_score, result.std_score);
        return result;
    }

} // namespace validation
