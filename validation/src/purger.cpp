#include "purger.hpp"
#include "logging.hpp"

#include <numeric>

namespace validation {

    namespace {

        std::vector<std::size_t> indexRange(std::size_t begin, std::size_t end) {
            std::vector<std::size_t> indices(end - begin);
            std::iota(indices.begin(), indices.end(), begin);
            return indices;
        }

    } // end anonymous namespace

    std::vector<PurgedFold> purgeWindows(const std::vector<WindowSpec>& windows, std::size_t purge_bars) {
        auto logger = core::logging::getLogger();
        std::vector<PurgedFold> folds;
        folds.reserve(windows.size());

        for (std::size_t k = 0; k < windows.size(); ++k) {
            const WindowSpec& spec = windows[k];

            // Unsigned arithmetic: a purge longer than the training range leaves nothing
            const std::size_t kept = spec.trainSize() > purge_bars ? spec.trainSize() - purge_bars : 0;
            if (kept < kMinPurgedTrainBars) {
                logger->debug("Fold {} skipped: {} training bars left after purging {} (minimum {})",
                              k, kept, purge_bars, kMinPurgedTrainBars);
                continue;
            }

            PurgedFold fold;
            fold.fold_idx = static_cast<int>(k);
            fold.train_indices = indexRange(spec.train_start, spec.train_start + kept);
            fold.test_indices = indexRange(spec.test_start, spec.test_end);
            folds.push_back(std::move(fold));
        }

        logger->debug("Purge of {} bars kept {} of {} folds", purge_bars, folds.size(), windows.size());
        return folds;
    }

    std::vector<PurgedFold> purgedWalkForwardSplits(std::size_t n, int n_splits, double train_frac,
                                                    WindowType window_type, std::size_t purge_bars) {
        return purgeWindows(planWindows(n, n_splits, train_frac, window_type), purge_bars);
    }

} // namespace validation
