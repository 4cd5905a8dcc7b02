#include "strategy_params.hpp"
#include "exceptions.hpp"

#include <cmath>
#include <initializer_list>
#include <limits>
#include <string>
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

    namespace { // File-local helpers

        void rejectUnknownKeys(const ParameterMap& params,
                               std::initializer_list<const char*> allowed,
                               const char* owner)
        {
            for (const auto& entry : params) {
                bool known = false;
                for (const char* key : allowed) {
                    if (entry.first == key) {
                        known = true;
                        break;
                    }
                }
                if (!known) {
                    throw core::StrategyException(
                        fmt::format("Unknown parameter '{}' for {}", entry.first, owner));
                }
            }
        }

        int readInt(const ParameterMap& params, const char* key, int fallback, const char* owner) {
            auto it = params.find(key);
            if (it == params.end()) {
                return fallback;
            }
            double value = it->second;
            if (!std::isfinite(value) || std::floor(value) != value ||
                value < static_cast<double>(std::numeric_limits<int>::min()) ||
                value > static_cast<double>(std::numeric_limits<int>::max())) {
                throw core::StrategyException(
                    fmt::format("Parameter '{}' for {} must be an integer, got {}", key, owner, value));
            }
            return static_cast<int>(value);
        }

        double readDouble(const ParameterMap& params, const char* key, double fallback, const char* owner) {
            auto it = params.find(key);
            if (it == params.end()) {
                return fallback;
            }
            if (!std::isfinite(it->second)) {
                throw core::StrategyException(
                    fmt::format("Parameter '{}' for {} must be finite, got {}", key, owner, it->second));
            }
            return it->second;
        }

    } // end anonymous namespace

    // --- MaCrossoverParams ---

    void MaCrossoverParams::validate() const {
        if (fast_period <= 0 || slow_period <= 0) {
            throw core::StrategyException(fmt::format(
                "MACrossover periods must be positive (fast_period={}, slow_period={})", fast_period, slow_period));
        }
        if (fast_period >= slow_period) {
            throw core::StrategyException(fmt::format(
                "MACrossover fast_period ({}) must be less than slow_period ({})", fast_period, slow_period));
        }
    }

    ParameterMap MaCrossoverParams::toParameterMap() const {
        return {{"fast_period", static_cast<double>(fast_period)}, {"slow_period", static_cast<double>(slow_period)}};
    }

    MaCrossoverParams MaCrossoverParams::fromParameterMap(const ParameterMap& params) {
        const char* owner = "MACrossover";
        rejectUnknownKeys(params, {"fast_period", "slow_period"}, owner);
        MaCrossoverParams result;
        result.fast_period = readInt(params, "fast_period", result.fast_period, owner);
        result.slow_period = readInt(params, "slow_period", result.slow_period, owner);
        result.validate();
        return result;
    }

    // --- RsiParams ---

    void RsiParams::validate() const {
        // TA_RSI needs at least one prior change to smooth
        if (period < 2) {
            throw core::StrategyException(fmt::format("RSIMeanReversion period must be at least 2, got {}", period));
        }
        if (oversold < 0.0 || overbought > 100.0 || oversold >= overbought) {
            throw core::StrategyException(fmt::format(
                "RSIMeanReversion thresholds must satisfy 0 <= oversold < overbought <= 100 (oversold={}, overbought={})",
                oversold, overbought));
        }
    }

    ParameterMap RsiParams::toParameterMap() const {
        return {{"period", static_cast<double>(period)}, {"oversold", oversold}, {"overbought", overbought}};
    }

    RsiParams RsiParams::fromParameterMap(const ParameterMap& params) {
        const char* owner = "RSIMeanReversion";
        rejectUnknownKeys(params, {"period", "oversold", "overbought"}, owner);
        RsiParams result;
        result.period = readInt(params, "period", result.period, owner);
        result.oversold = readDouble(params, "oversold", result.oversold, owner);
        result.overbought = readDouble(params, "overbought", result.overbought, owner);
        result.validate();
        return result;
    }

    // --- BollingerParams ---

    void BollingerParams::validate() const {
        if (period < 2) {
            throw core::StrategyException(fmt::format("Bollinger period must be at least 2, got {}", period));
        }
        if (!(num_std > 0.0)) {
            throw core::StrategyException(fmt::format("Bollinger num_std must be positive, got {}", num_std));
        }
    }

    ParameterMap BollingerParams::toParameterMap() const {
        return {{"period", static_cast<double>(period)}, {"num_std", num_std}};
    }

    BollingerParams BollingerParams::fromParameterMap(const ParameterMap& params) {
        const char* owner = "Bollinger";
        rejectUnknownKeys(params, {"period", "num_std"}, owner);
        BollingerParams result;
        result.period = readInt(params, "period", result.period, owner);
        result.num_std = readDouble(params, "num_std", result.num_std, owner);
        result.validate();
        return result;
    }

    // --- AdxTrendParams ---

    void AdxTrendParams::validate() const {
        if (period < 2) {
            throw core::StrategyException(fmt::format("ADXTrend period must be at least 2, got {}", period));
        }
        if (trend_threshold < 0.0 || trend_threshold > 100.0) {
            throw core::StrategyException(fmt::format(
                "ADXTrend trend_threshold must be within [0, 100], got {}", trend_threshold));
        }
    }

    ParameterMap AdxTrendParams::toParameterMap() const {
        return {{"period", static_cast<double>(period)}, {"trend_threshold", trend_threshold}};
    }

    AdxTrendParams AdxTrendParams::fromParameterMap(const ParameterMap& params) {
        const char* owner = "ADXTrend";
        rejectUnknownKeys(params, {"period", "trend_threshold"}, owner);
        AdxTrendParams result;
        result.period = readInt(params, "period", result.period, owner);
        result.trend_threshold = readDouble(params, "trend_threshold", result.trend_threshold, owner);
        result.validate();
        return result;
    }

    // --- MaSlopeParams ---

    void MaSlopeParams::validate() const {
        if (ma_period <= 0 || slope_window <= 0) {
            throw core::StrategyException(fmt::format(
                "MASlopeTrend windows must be positive (ma_period={}, slope_window={})", ma_period, slope_window));
        }
        if (flat_threshold < 0.0) {
            throw core::StrategyException(fmt::format(
                "MASlopeTrend flat_threshold must be non-negative, got {}", flat_threshold));
        }
    }

    ParameterMap MaSlopeParams::toParameterMap() const {
        return {{"ma_period", static_cast<double>(ma_period)}, {"slope_window", static_cast<double>(slope_window)}, {"flat_threshold", flat_threshold}};
    }

    MaSlopeParams MaSlopeParams::fromParameterMap(const ParameterMap& params) {
        const char* owner = "MASlopeTrend";
        rejectUnknownKeys(params, {"ma_period", "slope_window", "flat_threshold"}, owner);
        MaSlopeParams result;
        result.ma_period = readInt(params, "ma_period", result.ma_period, owner);
        result.slope_window = readInt(params, "slope_window", result.slope_window, owner);
        result.flat_threshold = readDouble(params, "flat_threshold", result.flat_threshold, owner);
        result.validate();
        return result;
    }

    std::string formatParameters(const std::string& name, const ParameterMap& params) {
        std::string out = name + "(";
        bool first = true;
        for (const auto& entry : params) {
            if (!first) {
                out += ", ";
            }
            first = false;
            if (std::floor(entry.second) == entry.second && std::abs(entry.second) < 1e15) {
                out += fmt::format("{}={}", entry.first, static_cast<long long>(entry.second));
            } else {
                out += fmt::format("{}={}", entry.first, entry.second);
            }
        }
        out += ")";
        return out;
    }

} // namespace strategy_engine
