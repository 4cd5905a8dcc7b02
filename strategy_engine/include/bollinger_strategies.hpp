#pragma once

#include "interfaces.hpp"
#include "strategy_params.hpp"

namespace strategy_engine {

    // Fades moves outside the bands: long below the lower band, short above the upper band.
    class BollingerMeanReversionStrategy : public IStrategy {
    public:
        explicit BollingerMeanReversionStrategy(BollingerParams params = BollingerParams{});

        std::string getName() const override;
        std::string describe() const override;
        ParameterMap getParameters() const override;
        core::PositionSignal generateSignals(const core::TimeSeries<core::Candle>& candles) const override;

    private:
        BollingerParams params_;
    };

    // Follows moves outside the bands: long above the upper band, short below the lower band.
    class BollingerBreakoutStrategy : public IStrategy {
    public:
        explicit BollingerBreakoutStrategy(BollingerParams params = BollingerParams{});

        std::string getName() const override;
        std::string describe() const override;
        ParameterMap getParameters() const override;
        core::PositionSignal generateSignals(const core::TimeSeries<core::Candle>& candles) const override;

    private:
        BollingerParams params_;
    };

} // namespace strategy_engine
