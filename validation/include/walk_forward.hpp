#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "interfaces.hpp"   // IStrategy, StrategyFactoryFn, ParameterMap
#include "metrics.hpp"
#include "window_planner.hpp"

namespace validation {

    using strategy_engine::ParameterMap;
    using strategy_engine::StrategyFactoryFn;

    // Chooses parameters for one window using the training slice only
    using OptimizeFn = std::function<ParameterMap(const StrategyFactoryFn& strategy_factory,
                                                  const core::TimeSeries<core::Candle>& train_slice,
                                                  const ParameterMap& default_params)>;

    // Metrics function applied to every window's curve and to the stitched curve
    using MetricsFn = std::function<MetricsMap(const core::EquityCurve& equity)>;

    // computeMetrics() with periods_per_year detected from the curve
    MetricsMap defaultMetrics(const core::EquityCurve& equity);

    // Test slices shorter than this are skipped (too short for any metric)
    constexpr std::size_t kMinTestBars = 2;

    struct WalkForwardConfig {
        int n_splits = 5;
        double train_frac = 0.6;      // only shapes rolling windows
        WindowType window_type = WindowType::Rolling;
    };

    struct WindowResult {
        int window_idx = 0;           // fold index as planned, gaps mark skipped folds
        core::Timestamp train_start;  // first training bar
        core::Timestamp train_end;    // last training bar (inclusive)
        core::Timestamp test_start;   // first test bar
        core::Timestamp test_end;     // last test bar (inclusive)
        ParameterMap params;
        core::EquityCurve equity;     // starts at 1.0
        MetricsMap metrics;
    };

    // One row of the per-window table
    struct WindowSummaryRow {
        core::Timestamp test_start;
        core::Timestamp test_end;
        std::size_t n_bars = 0;
        double total_return = 0.0;
        double sharpe_ratio = 0.0;
        double sortino_ratio = 0.0;
        double max_drawdown = 0.0;
        double win_rate = 0.0;
    };

    struct WalkForwardResult {
        std::vector<WindowResult> windows;
        core::EquityCurve oos_equity;  // all windows stitched, starts at 1.0
        MetricsMap oos_metrics;
        std::vector<WindowSummaryRow> summary;
    };

    class WalkForwardValidator {
    public:
        explicit WalkForwardValidator(WalkForwardConfig config = WalkForwardConfig{},
                                      MetricsFn metrics_fn = defaultMetrics);

        // Plan windows over 'series', then per window: resolve parameters (optimize_fn on
        // the training slice, or default_params), build a fresh strategy, generate
        // signals on the test slice, build and score that window's equity. Finally stitch
        // all window curves and score the result.
        //
        // Windows with fewer than kMinTestBars test bars are skipped. Throws
        // ValidationException / InsufficientDataException from planning and
        // NoValidWindowsException when every window was skipped.
        WalkForwardResult run(const StrategyFactoryFn& strategy_factory,
                              const core::TimeSeries<core::Candle>& series,
                              const ParameterMap& default_params,
                              const OptimizeFn& optimize_fn = nullptr) const;

        const WalkForwardConfig& getConfig() const { return config_; }

    private:
        WalkForwardConfig config_;
        MetricsFn metrics_fn_;

        WindowResult runWindow(int window_idx,
                               const WindowSpec& spec,
                               const StrategyFactoryFn& strategy_factory,
                               const core::TimeSeries<core::Candle>& series,
                               const core::TimeSeries<double>& bar_returns,
                               const ParameterMap& default_params,
                               const OptimizeFn& optimize_fn) const;
    };

    // Per-window table rows; missing metrics are reported as NaN
    std::vector<WindowSummaryRow> buildSummary(const std::vector<WindowResult>& windows);

} // namespace validation
