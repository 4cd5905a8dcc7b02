#include "report.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cmath>
#include <fstream>
#include <spdlog/fmt/fmt.h>

namespace validation {

    using json = nlohmann::json;

    namespace {

        json numberOrNull(double value) {
            return std::isfinite(value) ? json(value) : json(nullptr);
        }

        std::string formatCell(double value, int precision, const char* suffix = "") {
            if (!std::isfinite(value)) return "n/a";
            return fmt::format("{:.{}f}{}", value, precision, suffix);
        }

        json curveToJson(const core::EquityCurve& curve) {
            json timestamps = json::array();
            json values = json::array();
            for (size_t i = 0; i < curve.size(); ++i) {
                timestamps.push_back(core::utils::timestampToString(curve.timestamps[i]));
                values.push_back(numberOrNull(curve.values[i]));
            }
            return json{{"timestamps", timestamps}, {"values", values}};
        }

    } // end anonymous namespace

    void logSummaryTable(const WalkForwardResult& result) {
        auto logger = core::logging::getLogger();
        logger->info("--- Walk-Forward Windows ({}) ---", result.summary.size());
        logger->info("{:<22} {:<22} {:>6} {:>10} {:>8} {:>8} {:>9} {:>8}",
                     "test_start", "test_end", "bars", "return", "sharpe", "sortino", "max_dd", "win");
        for (const auto& row : result.summary) {
            logger->info("{:<22} {:<22} {:>6} {:>10} {:>8} {:>8} {:>9} {:>8}",
                         core::utils::timestampToString(row.test_start),
                         core::utils::timestampToString(row.test_end),
                         row.n_bars,
                         formatCell(row.total_return * 100.0, 2, "%"),
                         formatCell(row.sharpe_ratio, 2),
                         formatCell(row.sortino_ratio, 2),
                         formatCell(row.max_drawdown * 100.0, 2, "%"),
                         formatCell(row.win_rate * 100.0, 1, "%"));
        }
        logger->info("------------------------");
    }

    void logMetrics(const std::string& title, const MetricsMap& metrics) {
        auto logger = core::logging::getLogger();
        logger->info("--- {} ---", title);
        for (const auto& [name, value] : metrics) {
            logger->info("{:<16}: {}", name, formatCell(value, 6));
        }
        logger->info("------------------------");
    }

    json toJson(const MetricsMap& metrics) {
        json out = json::object();
        for (const auto& [name, value] : metrics) {
            out[name] = numberOrNull(value);
        }
        return out;
    }

    json toJson(const WalkForwardResult& result) {
        json windows = json::array();
        for (const auto& window : result.windows) {
            json params = json::object();
            for (const auto& [name, value] : window.params) {
                params[name] = numberOrNull(value);
            }
            windows.push_back({
                {"window_idx", window.window_idx},
                {"train_start", core::utils::timestampToString(window.train_start)},
                {"train_end", core::utils::timestampToString(window.train_end)},
                {"test_start", core::utils::timestampToString(window.test_start)},
                {"test_end", core::utils::timestampToString(window.test_end)},
                {"n_bars", window.equity.size()},
                {"params", params},
                {"metrics", toJson(window.metrics)}
            });
        }

        json summary = json::array();
        for (const auto& row : result.summary) {
            summary.push_back({
                {"test_start", core::utils::timestampToString(row.test_start)},
                {"test_end", core::utils::timestampToString(row.test_end)},
                {"n_bars", row.n_bars},
                {"total_return", numberOrNull(row.total_return)},
                {"sharpe_ratio", numberOrNull(row.sharpe_ratio)},
                {"sortino_ratio", numberOrNull(row.sortino_ratio)},
                {"max_drawdown", numberOrNull(row.max_drawdown)},
                {"win_rate", numberOrNull(row.win_rate)}
            });
        }

        return json{
            {"windows", windows},
            {"summary", summary},
            {"oos_metrics", toJson(result.oos_metrics)},
            {"oos_equity", curveToJson(result.oos_equity)}
        };
    }

    json toJson(const CrossValidationResult& result) {
        json folds = json::array();
        for (const auto& fold : result.folds) {
            folds.push_back({
                {"fold_idx", fold.fold_idx},
                {"n_train", fold.n_train},
                {"n_test", fold.n_test},
                {"score", numberOrNull(fold.score)}
            });
        }
        return json{
            {"folds", folds},
            {"mean_score", numberOrNull(result.mean_score)},
            {"std_score", numberOrNull(result.std_score)}
        };
    }

    void writeReport(const WalkForwardResult& result, const std::string& path) {
        std::ofstream out(path);
        if (!out.is_open()) {
            throw core::PlatformException("Could not open report file for writing: " + path);
        }
        out << toJson(result).dump(2) << '\n';
        if (!out) {
            throw core::PlatformException("Failed while writing report file: " + path);
        }
        core::logging::getLogger()->info("Walk-forward report written to {}", path);
    }

} // namespace validation
