#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <limits>

#include "datatypes.hpp"

namespace validation {

    // Named scalar metrics, e.g. {"sharpe_ratio": 1.2, ...}
    using MetricsMap = std::map<std::string, double>;

    // Annualisation factor used when the bar spacing cannot be measured
    constexpr std::int64_t kFallbackPeriodsPerYear = 365;

    // Risk/return summary of one equity curve. Ratios that are undefined for the
    // curve (zero volatility, no losing bars, no drawdown) are NaN.
    struct PerformanceMetrics {
        double total_return = std::numeric_limits<double>::quiet_NaN();
        double mean_return = std::numeric_limits<double>::quiet_NaN();
        double std_return = std::numeric_limits<double>::quiet_NaN();
        double sharpe_ratio = std::numeric_limits<double>::quiet_NaN();
        double sortino_ratio = std::numeric_limits<double>::quiet_NaN();
        double mean_neg_return = std::numeric_limits<double>::quiet_NaN();
        double std_neg_return = std::numeric_limits<double>::quiet_NaN();
        double return_p05 = std::numeric_limits<double>::quiet_NaN();
        double return_p25 = std::numeric_limits<double>::quiet_NaN();
        double return_p75 = std::numeric_limits<double>::quiet_NaN();
        double return_p95 = std::numeric_limits<double>::quiet_NaN();
        double max_drawdown = std::numeric_limits<double>::quiet_NaN();
        double calmar_ratio = std::numeric_limits<double>::quiet_NaN();
        double win_rate = std::numeric_limits<double>::quiet_NaN();

        MetricsMap toMap() const;
    };

    // 365 days / median spacing between consecutive timestamps (at least 1).
    // Falls back to kFallbackPeriodsPerYear with fewer than 2 timestamps.
    // 64-bit because sub-second bars give more periods than an int holds.
    std::int64_t detectPeriodsPerYear(const core::TimeSeries<core::Timestamp>& timestamps);

    // Metrics of an equity curve with at least 2 points (ValidationException otherwise).
    // periods_per_year is detected from the curve's timestamps when not given.
    PerformanceMetrics computeMetrics(const core::EquityCurve& equity,
                                      std::optional<std::int64_t> periods_per_year = std::nullopt);

} // namespace validation
