#pragma once

#include "interfaces.hpp"
#include "strategy_params.hpp"

namespace strategy_engine {

    // Trend strength and direction from Wilder's ADX.
    // Columns: adx, plus_di, minus_di, trend_dir (+1 / -1 only when adx >= trend_threshold).
    class AdxTrendSignal : public ISignal {
    public:
        explicit AdxTrendSignal(AdxTrendParams params = AdxTrendParams{});

        std::string getName() const override;
        std::string getOutputName() const override;
        SignalFrame compute(const core::TimeSeries<core::Candle>& candles) const override;

    private:
        AdxTrendParams params_;
    };

} // namespace strategy_engine
