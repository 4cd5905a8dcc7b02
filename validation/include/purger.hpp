#pragma once

#include <cstddef>
#include <vector>

#include "window_planner.hpp"

namespace validation {

    // Minimum number of training samples a fold must keep after purging
    constexpr std::size_t kMinPurgedTrainBars = 20;

    // Bar positions of one purged fold, ready for sample-level selection
    struct PurgedFold {
        int fold_idx = 0;   // index of the planned window, gaps mark skipped folds
        std::vector<std::size_t> train_indices;
        std::vector<std::size_t> test_indices;
    };

    // Drop the last purge_bars training bars of every window: their labels look
    // purge_bars ahead and would overlap the test range. Set purge_bars to the label
    // horizon. Folds left with fewer than kMinPurgedTrainBars training bars are
    // skipped without error; the number of returned folds reports how many survived.
    std::vector<PurgedFold> purgeWindows(const std::vector<WindowSpec>& windows, std::size_t purge_bars);

    // planWindows() followed by purgeWindows()
    std::vector<PurgedFold> purgedWalkForwardSplits(std::size_t n, int n_splits, double train_frac,
                                                    WindowType window_type, std::size_t purge_bars = 1);

} // namespace validation
