#include "labels.hpp"
#include "exceptions.hpp"

#include <cmath>
#include <limits>
#include <spdlog/fmt/fmt.h>

namespace validation {

    core::TimeSeries<double> forwardReturn(const core::TimeSeries<core::Candle>& candles, int horizon) {
        if (horizon < 1) {
            throw core::ValidationException(fmt::format("horizon must be at least 1, got {}", horizon));
        }
        const size_t h = static_cast<size_t>(horizon);
        core::TimeSeries<double> returns(candles.size(), std::numeric_limits<double>::quiet_NaN());
        for (size_t t = 0; t + h < candles.size(); ++t) {
            returns[t] = std::log(candles[t + h].close / candles[t].close);
        }
        return returns;
    }

    core::TimeSeries<int> directionLabel(const core::TimeSeries<core::Candle>& candles, int horizon, double threshold) {
        if (!(threshold >= 0.0)) {
            throw core::ValidationException(fmt::format("threshold must be non-negative, got {}", threshold));
        }
        const auto returns = forwardReturn(candles, horizon);

        core::TimeSeries<int> labels(returns.size(), 0);
        for (size_t t = 0; t < returns.size(); ++t) {
            // NaN compares false both ways and stays flat
            if (returns[t] > threshold) {
                labels[t] = 1;
            } else if (returns[t] < -threshold) {
                labels[t] = -1;
            }
        }
        return labels;
    }

} // namespace validation
