#pragma once

#include "interfaces.hpp"
#include "strategy_params.hpp"

namespace strategy_engine {

    // Dual moving average crossover: long while the fast SMA is above the slow SMA,
    // short while it is below, flat when equal or during warm-up.
    class MaCrossoverStrategy : public IStrategy {
    public:
        explicit MaCrossoverStrategy(MaCrossoverParams params = MaCrossoverParams{});

        std::string getName() const override;
        std::string describe() const override;
        ParameterMap getParameters() const override;
        core::PositionSignal generateSignals(const core::TimeSeries<core::Candle>& candles) const override;

    private:
        MaCrossoverParams params_;
    };

} // namespace strategy_engine
