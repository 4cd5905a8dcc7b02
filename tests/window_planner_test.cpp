#include <gtest/gtest.h>

#include "window_planner.hpp"
#include "exceptions.hpp"

using validation::WindowSpec;
using validation::WindowType;
using validation::planWindows;

TEST(WindowPlannerTest, RollingWindowsOverSixHundredBars) {
    const auto windows = planWindows(600, 5, 0.6, WindowType::Rolling);
    ASSERT_EQ(windows.size(), 5u);

    // test_size = 600 / 6 = 100, train_bars = round(0.6 / 0.4 * 100) = 150
    EXPECT_EQ(windows[0], (WindowSpec{0, 100, 100, 200}));
    EXPECT_EQ(windows[1], (WindowSpec{50, 200, 200, 300}));
    EXPECT_EQ(windows[2], (WindowSpec{150, 300, 300, 400}));
    EXPECT_EQ(windows[3], (WindowSpec{250, 400, 400, 500}));
    EXPECT_EQ(windows[4], (WindowSpec{350, 500, 500, 600}));
}

TEST(WindowPlannerTest, AnchoredWindowsAlwaysTrainFromBarZero) {
    const auto windows = planWindows(600, 5, 0.6, WindowType::Anchored);
    ASSERT_EQ(windows.size(), 5u);
    for (std::size_t k = 0; k < windows.size(); ++k) {
        EXPECT_EQ(windows[k].train_start, 0u);
        EXPECT_EQ(windows[k].train_end, windows[k].test_start);
        EXPECT_EQ(windows[k].trainSize(), (k + 1) * 100);
    }
}

TEST(WindowPlannerTest, TestRangesAreContiguousAndNeverOverlapTraining) {
    for (WindowType type : {WindowType::Rolling, WindowType::Anchored}) {
        const auto windows = planWindows(1237, 7, 0.7, type);
        ASSERT_EQ(windows.size(), 7u);
        for (std::size_t k = 0; k < windows.size(); ++k) {
            EXPECT_LE(windows[k].train_end, windows[k].test_start);
            EXPECT_LT(windows[k].test_start, windows[k].test_end);
            if (k > 0) {
                EXPECT_EQ(windows[k - 1].test_end, windows[k].test_start);
            }
        }
    }
}

TEST(WindowPlannerTest, RollingTrainStartIsClippedAtZero) {
    // train_bars = round(0.9 / 0.1 * 10) = 90 exceeds every test_start below 90
    const auto windows = planWindows(60, 5, 0.9, WindowType::Rolling);
    for (const auto& spec : windows) {
        EXPECT_EQ(spec.train_start, 0u);
    }
}

TEST(WindowPlannerTest, TrailingRemainderIsNotTested) {
    const auto windows = planWindows(605, 5, 0.6, WindowType::Rolling);
    ASSERT_EQ(windows.size(), 5u);
    EXPECT_EQ(windows.back().test_end, 600u);
    EXPECT_EQ(windows.back().testSize(), 100u);
}

TEST(WindowPlannerTest, TooFewBarsForTheSplitCount) {
    EXPECT_THROW(planWindows(3, 5, 0.6, WindowType::Rolling), core::InsufficientDataException);
    EXPECT_THROW(planWindows(0, 1, 0.6, WindowType::Anchored), core::InsufficientDataException);
    EXPECT_NO_THROW(planWindows(6, 5, 0.6, WindowType::Rolling));
}

TEST(WindowPlannerTest, RejectsInvalidParameters) {
    EXPECT_THROW(planWindows(600, 0, 0.6, WindowType::Rolling), core::ValidationException);
    EXPECT_THROW(planWindows(600, -2, 0.6, WindowType::Rolling), core::ValidationException);
    EXPECT_THROW(planWindows(600, 5, 0.0, WindowType::Rolling), core::ValidationException);
    EXPECT_THROW(planWindows(600, 5, 1.0, WindowType::Rolling), core::ValidationException);
    EXPECT_THROW(planWindows(600, 5, 1.5, WindowType::Anchored), core::ValidationException);
}

TEST(WindowPlannerTest, WindowTypeNames) {
    EXPECT_EQ(validation::windowTypeFromString("rolling"), WindowType::Rolling);
    EXPECT_EQ(validation::windowTypeFromString("anchored"), WindowType::Anchored);
    EXPECT_EQ(validation::windowTypeToString(WindowType::Anchored), "anchored");
    EXPECT_THROW(validation::windowTypeFromString("expanding"), core::ValidationException);
    EXPECT_THROW(validation::windowTypeFromString("Rolling"), core::ValidationException);
}

TEST(WindowPlannerTest, TrainBarsRoundHalfToEven) {
    // test_size = 10, train_bars = 0.25 * 10 = 2.5 -> 2
    const auto even_down = planWindows(60, 5, 0.2, WindowType::Rolling);
    EXPECT_EQ(even_down[0], (WindowSpec{8, 10, 10, 20}));
    EXPECT_EQ(even_down[4].trainSize(), 2u);

    // test_size = 14, train_bars = 0.25 * 14 = 3.5 -> 4
    const auto even_up = planWindows(84, 5, 0.2, WindowType::Rolling);
    EXPECT_EQ(even_up[0], (WindowSpec{10, 14, 14, 28}));
}
