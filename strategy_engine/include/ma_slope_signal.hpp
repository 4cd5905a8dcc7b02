#pragma once

#include "interfaces.hpp"
#include "strategy_params.hpp"

namespace strategy_engine {

    // Slope of an SMA over 'slope_window' bars, normalised by the SMA level.
    // Columns: ma, ma_slope (price units per bar), ma_slope_pct (% of ma per bar),
    // trend_dir (+1 above flat_threshold, -1 below -flat_threshold, else 0).
    class MaSlopeSignal : public ISignal {
    public:
        explicit MaSlopeSignal(MaSlopeParams params = MaSlopeParams{});

        std::string getName() const override;
        std::string getOutputName() const override;
        SignalFrame compute(const core::TimeSeries<core::Candle>& candles) const override;

    private:
        MaSlopeParams params_;
    };

} // namespace strategy_engine
