#include <gtest/gtest.h>

#include "purger.hpp"
#include "window_planner.hpp"

using validation::WindowType;

TEST(PurgerTest, DropsTheLastPurgeBarsOfEveryTrainingRange) {
    const auto windows = validation::planWindows(600, 5, 0.6, WindowType::Rolling);
    const auto folds = validation::purgeWindows(windows, 1);
    ASSERT_EQ(folds.size(), 5u);

    // Fold 0 trains on [0, 100) minus one bar
    EXPECT_EQ(folds[0].train_indices.size(), 99u);
    EXPECT_EQ(folds[0].train_indices.front(), 0u);
    EXPECT_EQ(folds[0].train_indices.back(), 98u);
    EXPECT_EQ(folds[0].test_indices.front(), 100u);
    EXPECT_EQ(folds[0].test_indices.back(), 199u);

    // Fold 1 trains on [50, 200) minus one bar
    EXPECT_EQ(folds[1].train_indices.size(), 149u);
    EXPECT_EQ(folds[1].train_indices.front(), 50u);
}

TEST(PurgerTest, GapBetweenTrainingAndTestIsAtLeastThePurge) {
    const std::size_t purge = 10;
    for (WindowType type : {WindowType::Rolling, WindowType::Anchored}) {
        const auto folds = validation::purgedWalkForwardSplits(900, 8, 0.6, type, purge);
        ASSERT_FALSE(folds.empty());
        for (const auto& fold : folds) {
            ASSERT_FALSE(fold.train_indices.empty());
            ASSERT_FALSE(fold.test_indices.empty());
            EXPECT_GE(fold.test_indices.front(), fold.train_indices.back() + purge + 1);
        }
    }
}

TEST(PurgerTest, FoldsBelowMinimumTrainingSizeAreSkipped) {
    const auto windows = validation::planWindows(600, 5, 0.6, WindowType::Rolling);

    // Fold 0 keeps exactly 20 bars
    EXPECT_EQ(validation::purgeWindows(windows, 80).size(), 5u);

    // Fold 0 keeps 19 and is dropped, the 150-bar folds survive
    const auto folds = validation::purgeWindows(windows, 81);
    ASSERT_EQ(folds.size(), 4u);
    EXPECT_EQ(folds.front().test_indices.front(), 200u);
    EXPECT_EQ(folds.front().train_indices.size(), 69u);
}

TEST(PurgerTest, PurgeCoveringTheWholeTrainingRangeLeavesNoFolds) {
    EXPECT_TRUE(validation::purgedWalkForwardSplits(600, 5, 0.6, WindowType::Rolling, 150).empty());
    EXPECT_TRUE(validation::purgedWalkForwardSplits(600, 5, 0.6, WindowType::Rolling, 10000).empty());
}

TEST(PurgerTest, ZeroPurgeKeepsWholeTrainingRange) {
    const auto folds = validation::purgedWalkForwardSplits(600, 5, 0.6, WindowType::Anchored, 0);
    ASSERT_EQ(folds.size(), 5u);
    EXPECT_EQ(folds[4].train_indices.size(), 500u);
    EXPECT_EQ(folds[4].train_indices.back() + 1, folds[4].test_indices.front());
}

TEST(PurgerTest, LongerPurgeNeverYieldsMoreFolds) {
    for (WindowType type : {WindowType::Rolling, WindowType::Anchored}) {
        const auto windows = validation::planWindows(600, 5, 0.6, type);
        std::size_t previous = windows.size();
        for (std::size_t purge = 0; purge <= 520; purge += 5) {
            const std::size_t count = validation::purgeWindows(windows, purge).size();
            EXPECT_LE(count, previous) << "purge_bars=" << purge;
            previous = count;
        }
        EXPECT_EQ(previous, 0u);
    }
}

TEST(PurgerTest, FoldsRememberTheirPlannedWindow) {
    const auto windows = validation::planWindows(600, 5, 0.6, WindowType::Rolling);
    const auto all = validation::purgeWindows(windows, 1);
    for (std::size_t k = 0; k < all.size(); ++k) {
        EXPECT_EQ(all[k].fold_idx, static_cast<int>(k));
    }

    const auto survivors = validation::purgeWindows(windows, 81);
    ASSERT_EQ(survivors.size(), 4u);
    EXPECT_EQ(survivors.front().fold_idx, 1);
}
