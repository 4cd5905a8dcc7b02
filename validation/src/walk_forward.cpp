#include "walk_forward.hpp"
#include "equity_builder.hpp"
#include "equity_stitcher.hpp"
#include "strategy_params.hpp"  // formatParameters
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <limits>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace validation {

    namespace {

        double metricOrNaN(const MetricsMap& metrics, const char* key) {
            auto it = metrics.find(key);
            return it == metrics.end() ? std::numeric_limits<double>::quiet_NaN() : it->second;
        }

    } // end anonymous namespace

    MetricsMap defaultMetrics(const core::EquityCurve& equity) {
        return computeMetrics(equity).toMap();
    }

    WalkForwardValidator::WalkForwardValidator(WalkForwardConfig config, MetricsFn metrics_fn)
        : config_(config), metrics_fn_(std::move(metrics_fn))
    {
        if (!metrics_fn_) {
            throw core::ValidationException("WalkForwardValidator requires a metrics function");
        }
    }

    WalkForwardResult WalkForwardValidator::run(const StrategyFactoryFn& strategy_factory,
                                                const core::TimeSeries<core::Candle>& series,
                                                const ParameterMap& default_params,
                                                const OptimizeFn& optimize_fn) const
    {
        auto logger = core::logging::getLogger();
        if (!strategy_factory) {
            throw core::ValidationException("strategy_factory must be callable");
        }

        logger->info("Walk-forward: {} bars, n_splits={}, train_frac={}, window_type={}, optimizer={}",
                     series.size(), config_.n_splits, config_.train_frac,
                     windowTypeToString(config_.window_type), optimize_fn ? "yes" : "no");

        const auto windows = planWindows(series.size(), config_.n_splits, config_.train_frac, config_.window_type);
        const auto bar_returns = computeBarReturns(series);

        // Folds run in chronological order; stitching below depends on it
        std::vector<WindowResult> results;
        std::vector<core::EquityCurve> pieces;
        for (size_t k = 0; k < windows.size(); ++k) {
            if (windows[k].testSize() < kMinTestBars) {
                logger->warn("Window {} skipped: test slice has {} bars (minimum {})",
                             k, windows[k].testSize(), kMinTestBars);
                continue;
            }
            results.push_back(runWindow(static_cast<int>(k), windows[k], strategy_factory, series,
                                        bar_returns, default_params, optimize_fn));
            pieces.push_back(results.back().equity);
        }

        if (results.empty()) {
            throw core::NoValidWindowsException(
                fmt::format("No valid windows produced from {} bars with n_splits={}; "
                            "increase data length or reduce n_splits", series.size(), config_.n_splits),
                config_.n_splits, series.size());
        }

        WalkForwardResult result;
        result.oos_equity = stitchEquityCurves(pieces);
        result.oos_metrics = metrics_fn_(result.oos_equity);
        result.summary = buildSummary(results);
        result.windows = std::move(results);

        logger->info("Walk-forward complete: {} of {} windows, {} OOS bars, total return {:.4f}",
                     result.windows.size(), windows.size(), result.oos_equity.size(),
                     metricOrNaN(result.oos_metrics, "total_return"));
        return result;
    }

    WindowResult WalkForwardValidator::runWindow(int window_idx,
                                                 const WindowSpec& spec,
                                                 const StrategyFactoryFn& strategy_factory,
                                                 const core::TimeSeries<core::Candle>& series,
                                                 const core::TimeSeries<double>& bar_returns,
                                                 const ParameterMap& default_params,
                                                 const OptimizeFn& optimize_fn) const
    {
        auto logger = core::logging::getLogger();
        const auto first = series.begin();

        // The optimizer only ever sees the training slice
        ParameterMap params = default_params;
        if (optimize_fn) {
            core::TimeSeries<core::Candle> train_slice(first + spec.train_start, first + spec.train_end);
            params = optimize_fn(strategy_factory, train_slice, default_params);
        }

        auto strategy = strategy_factory(params);
        if (!strategy) {
            throw core::StrategyException(fmt::format("strategy_factory returned no strategy for window {}", window_idx));
        }

        core::TimeSeries<core::Candle> test_slice(first + spec.test_start, first + spec.test_end);
        core::PositionSignal signal = strategy->generateSignals(test_slice);
        if (signal.size() != test_slice.size()) {
            throw core::StrategyException(fmt::format(
                "Strategy '{}' produced {} signals for {} bars in window {}",
                strategy->getName(), signal.size(), test_slice.size(), window_idx));
        }

        core::TimeSeries<double> test_returns(bar_returns.begin() + spec.test_start,
                                              bar_returns.begin() + spec.test_end);
        core::TimeSeries<core::Timestamp> timestamps;
        timestamps.reserve(test_slice.size());
        for (const auto& candle : test_slice) {
            timestamps.push_back(candle.timestamp);
        }

        WindowResult window;
        window.window_idx = window_idx;
        window.train_start = series[spec.train_start].timestamp;
        window.train_end = series[spec.train_end - 1].timestamp;
        window.test_start = series[spec.test_start].timestamp;
        window.test_end = series[spec.test_end - 1].timestamp;
        window.params = std::move(params);
        window.equity = buildEquityCurve(signal, test_returns, timestamps);
        window.metrics = metrics_fn_(window.equity);

        logger->debug("Window {}: train [{} .. {}] test [{} .. {}] params {} -> total return {:.4f}",
                      window_idx,
                      core::utils::timestampToString(window.train_start),
                      core::utils::timestampToString(window.train_end),
                      core::utils::timestampToString(window.test_start),
                      core::utils::timestampToString(window.test_end),
                      strategy_engine::formatParameters(strategy->getName(), window.params),
                      metricOrNaN(window.metrics, "total_return"));
        return window;
    }

    std::vector<WindowSummaryRow> buildSummary(const std::vector<WindowResult>& windows) {
        std::vector<WindowSummaryRow> rows;
        rows.reserve(windows.size());
        for (const auto& window : windows) {
            WindowSummaryRow row;
            row.test_start = window.test_start;
            row.test_end = window.test_end;
            row.n_bars = window.equity.size();
            row.total_return = metricOrNaN(window.metrics, "total_return");
            row.sharpe_ratio = metricOrNaN(window.metrics, "sharpe_ratio");
            row.sortino_ratio = metricOrNaN(window.metrics, "sortino_ratio");
            row.max_drawdown = metricOrNaN(window.metrics, "max_drawdown");
            row.win_rate = metricOrNaN(window.metrics, "win_rate");
            rows.push_back(row);
        }
        return rows;
    }

} // namespace validation
