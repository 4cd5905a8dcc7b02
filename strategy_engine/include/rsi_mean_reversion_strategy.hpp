#pragma once

#include "interfaces.hpp"
#include "strategy_params.hpp"

namespace strategy_engine {

    // Long when RSI is below 'oversold', short when above 'overbought', flat otherwise.
    class RsiMeanReversionStrategy : public IStrategy {
    public:
        explicit RsiMeanReversionStrategy(RsiParams params = RsiParams{});

        std::string getName() const override;
        std::string describe() const override;
        ParameterMap getParameters() const override;
        core::PositionSignal generateSignals(const core::TimeSeries<core::Candle>& candles) const override;

    private:
        RsiParams params_;
    };

} // namespace strategy_engine
