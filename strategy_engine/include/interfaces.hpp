#pragma once

#include <functional>
#include <memory>
#include <string>

#include "datatypes.hpp" // Provides Candle, PositionSignal, TimeSeries
#include "common_types.hpp"

namespace strategy_engine {

    // --- Strategy Interface ---
    // Turns a slice of candles into one position decision per candle. The decision at
    // bar t may only use candles up to and including t; applying it one bar later is
    // the caller's job.
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        // Strategy type name, e.g. "MACrossover"
        virtual std::string getName() const = 0;

        // Name plus parameters, e.g. "MACrossover(fast_period=20, slow_period=50)"
        virtual std::string describe() const = 0;

        // The parameters this instance was built with
        virtual ParameterMap getParameters() const = 0;

        // One value in {-1, 0, +1} per input candle; warm-up bars are flat (0)
        virtual core::PositionSignal generateSignals(const core::TimeSeries<core::Candle>& candles) const = 0;
    };

    // Builds a fresh strategy instance from a parameter set
    using StrategyFactoryFn = std::function<std::unique_ptr<IStrategy>(const ParameterMap&)>;

    // --- Signal Interface ---
    // Describes market conditions (trend strength, direction) rather than positions.
    class ISignal {
    public:
        virtual ~ISignal() = default;

        virtual std::string getName() const = 0;

        // Name of the primary column in the frame returned by compute()
        virtual std::string getOutputName() const = 0;

        virtual SignalFrame compute(const core::TimeSeries<core::Candle>& candles) const = 0;
    };

} // namespace strategy_engine
