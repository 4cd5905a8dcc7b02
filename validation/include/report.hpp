#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "metrics.hpp"
#include "purged_cv.hpp"
#include "walk_forward.hpp"

namespace validation {

    // --- Log output ---
    // Per-window table (test range, bars, total return, Sharpe, Sortino, drawdown, win rate)
    void logSummaryTable(const WalkForwardResult& result);

    // One line per metric under a '--- <title> ---' banner; NaN prints as "n/a"
    void logMetrics(const std::string& title, const MetricsMap& metrics);

    // --- JSON output ---
    // Non-finite numbers are written as null.
    nlohmann::json toJson(const MetricsMap& metrics);
    nlohmann::json toJson(const WalkForwardResult& result);
    nlohmann::json toJson(const CrossValidationResult& result);

    // Write toJson(result) to 'path' (pretty-printed). Throws PlatformException on I/O failure.
    void writeReport(const WalkForwardResult& result, const std::string& path);

} // namespace validation
