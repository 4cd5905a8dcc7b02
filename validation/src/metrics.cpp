#include "metrics.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <iterator>
#include <cmath>
#include <numeric>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace validation {

    namespace {

        const double kNaN = std::numeric_limits<double>::quiet_NaN();

        double mean(const std::vector<double>& values) {
            if (values.empty()) return kNaN;
            return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
        }

        // Sample standard deviation (n - 1 denominator)
        double sampleStd(const std::vector<double>& values) {
            if (values.size() < 2) return kNaN;
            const double m = mean(values);
            double sq_sum = 0.0;
            for (double v : values) {
                sq_sum += (v - m) * (v - m);
            }
            return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
        }

        // Linear interpolation between closest ranks; 'sorted' must be ascending and non-empty
        double percentile(const std::vector<double>& sorted, double pct) {
            const double rank = pct / 100.0 * static_cast<double>(sorted.size() - 1);
            const size_t lower = static_cast<size_t>(std::floor(rank));
            const size_t upper = std::min(lower + 1, sorted.size() - 1);
            const double fraction = rank - static_cast<double>(lower);
            return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
        }

        double median(std::vector<double> values) {
            std::sort(values.begin(), values.end());
            const size_t mid = values.size() / 2;
            if (values.size() % 2 == 1) {
                return values[mid];
            }
            return 0.5 * (values[mid - 1] + values[mid]);
        }

    } // end anonymous namespace

    MetricsMap PerformanceMetrics::toMap() const {
        return {
            {"total_return", total_return},
            {"mean_return", mean_return},
            {"std_return", std_return},
            {"sharpe_ratio", sharpe_ratio},
            {"sortino_ratio", sortino_ratio},
            {"mean_neg_return", mean_neg_return},
            {"std_neg_return", std_neg_return},
            {"return_p05", return_p05},
            {"return_p25", return_p25},
            {"return_p75", return_p75},
            {"return_p95", return_p95},
            {"max_drawdown", max_drawdown},
            {"calmar_ratio", calmar_ratio},
            {"win_rate", win_rate},
        };
    }

    std::int64_t detectPeriodsPerYear(const core::TimeSeries<core::Timestamp>& timestamps) {
        if (timestamps.size() < 2) {
            return kFallbackPeriodsPerYear;
        }
        std::vector<double> deltas;
        deltas.reserve(timestamps.size() - 1);
        for (size_t i = 1; i < timestamps.size(); ++i) {
            deltas.push_back(core::utils::secondsBetween(timestamps[i - 1], timestamps[i]));
        }
        const double median_seconds = median(std::move(deltas));
        if (!(median_seconds > 0.0)) {
            return kFallbackPeriodsPerYear;
        }
        const double per_year = 365.0 * 24.0 * 3600.0 / median_seconds;
        if (per_year >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        return std::max<std::int64_t>(1, static_cast<std::int64_t>(per_year));
    }

    PerformanceMetrics computeMetrics(const core::EquityCurve& equity, std::optional<std::int64_t> periods_per_year) {
        const auto& values = equity.values;
        if (values.size() < 2) {
            throw core::ValidationException(fmt::format(
                "equity must have at least 2 data points, got {}", values.size()));
        }

        const std::int64_t ppy = periods_per_year ? *periods_per_year : detectPeriodsPerYear(equity.timestamps);
        if (ppy <= 0) {
            throw core::ValidationException(fmt::format("periods_per_year must be positive, got {}", ppy));
        }

        std::vector<double> returns;
        returns.reserve(values.size() - 1);
        for (size_t i = 1; i < values.size(); ++i) {
            returns.push_back(values[i] / values[i - 1] - 1.0);
        }

        PerformanceMetrics m;

        // --- Return summary ---
        m.total_return = values.back() / values.front() - 1.0;
        m.mean_return = mean(returns);
        m.std_return = sampleStd(returns);

        // --- Risk-adjusted ---
        const double ann_factor = std::sqrt(static_cast<double>(ppy));
        if (m.std_return > 0.0) {
            m.sharpe_ratio = m.mean_return / m.std_return * ann_factor;
        }

        std::vector<double> negative;
        std::copy_if(returns.begin(), returns.end(), std::back_inserter(negative),
                     [](double r) { return r < 0.0; });
        m.mean_neg_return = mean(negative);
        m.std_neg_return = sampleStd(negative);
        if (m.std_neg_return > 0.0) {
            m.sortino_ratio = m.mean_return / m.std_neg_return * ann_factor;
        }

        // --- Distribution percentiles ---
        std::vector<double> sorted = returns;
        std::sort(sorted.begin(), sorted.end());
        m.return_p05 = percentile(sorted, 5.0);
        m.return_p25 = percentile(sorted, 25.0);
        m.return_p75 = percentile(sorted, 75.0);
        m.return_p95 = percentile(sorted, 95.0);

        // --- Drawdown (most negative value, 0 when the curve never falls) ---
        double running_max = values.front();
        double max_drawdown = 0.0;
        for (double v : values) {
            running_max = std::max(running_max, v);
            max_drawdown = std::min(max_drawdown, (v - running_max) / running_max);
        }
        m.max_drawdown = max_drawdown;

        const double n_bars = static_cast<double>(returns.size());
        const double annualised_return = std::pow(1.0 + m.total_return, static_cast<double>(ppy) / n_bars) - 1.0;
        if (m.max_drawdown < 0.0) {
            m.calmar_ratio = annualised_return / std::abs(m.max_drawdown);
        }

        // --- Win rate ---
        const auto wins = std::count_if(returns.begin(), returns.end(), [](double r) { return r > 0.0; });
        m.win_rate = static_cast<double>(wins) / n_bars;

        return m;
    }

} // namespace validation
