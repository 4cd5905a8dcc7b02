#pragma once
#include "datatypes.hpp"

#include <map>
#include <string>

namespace strategy_engine {

    // Named numeric strategy parameters, e.g. {"fast_period": 20, "slow_period": 50}.
    // Ordered so that logs and reports list parameters deterministically.
    using ParameterMap = std::map<std::string, double>;

    // Named indicator columns, each index-aligned with the input candles (NaN in warm-up)
    using SignalFrame = std::map<std::string, core::TimeSeries<double>>;

    enum class StrategyType {
        MACrossover,
        RSIMeanReversion,
        BollingerMeanReversion,
        BollingerBreakout
    };

} // namespace strategy_engine
