#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include "purger.hpp"
#include "window_planner.hpp"

namespace validation {

    // One row per sample, in chronological order
    using FeatureMatrix = std::vector<std::vector<double>>;

    // --- Model Contract ---
    // Any learner that can be fit on a block of rows and predict another block.
    class IModel {
    public:
        virtual ~IModel() = default;

        virtual void fit(const FeatureMatrix& X, const std::vector<double>& y) = 0;

        // One prediction per row of X
        virtual std::vector<double> predict(const FeatureMatrix& X) const = 0;
    };

    // Builds a fresh, unfitted model for every fold
    using ModelFactoryFn = std::function<std::unique_ptr<IModel>()>;

    // Higher is better
    using ScoreFn = std::function<double(const std::vector<double>& y_true, const std::vector<double>& y_pred)>;

    // Fraction of samples where prediction and target have the same sign
    double directionalAccuracy(const std::vector<double>& y_true, const std::vector<double>& y_pred);

    struct PurgedCvConfig {
        int n_splits = 5;
        double train_frac = 0.6;
        WindowType window_type = WindowType::Rolling;
        std::size_t purge_bars = 1;   // label horizon in bars
    };

    struct FoldScore {
        int fold_idx = 0;             // planned window index (PurgedFold::fold_idx)
        std::size_t n_train = 0;
        std::size_t n_test = 0;
        double score = 0.0;
    };

    struct CrossValidationResult {
        std::vector<FoldScore> folds;
        double mean_score = 0.0;
        double std_score = 0.0;       // population standard deviation across folds
    };

    // Fit and score a model on every purged walk-forward fold of (X, y).
    // Throws ValidationException when X and y disagree in length or the model returns
    // the wrong number of predictions, and NoValidWindowsException when purging leaves
    // no fold with enough training samples.
    CrossValidationResult purgedCrossValidate(const ModelFactoryFn& model_factory,
                                              const FeatureMatrix& X,
                                              const std::vector<double>& y,
                                              const PurgedCvConfig& config = PurgedCvConfig{},
                                              const ScoreFn& score_fn = directionalAccuracy);

} // namespace validation
