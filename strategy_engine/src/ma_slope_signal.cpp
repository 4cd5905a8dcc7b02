#include "ma_slope_signal.hpp"
#include "sma_indicator.hpp"

#include <limits>

namespace strategy_engine {

MaSlopeSignal::MaSlopeSignal(MaSlopeParams params) : params_(params) {
    params_.validate();
}

std::string MaSlopeSignal::getName() const { return formatParameters("MASlopeTrend", params_.toParameterMap()); }
std::string MaSlopeSignal::getOutputName() const { return "ma_slope_pct"; }

SignalFrame MaSlopeSignal::compute(const core::TimeSeries<core::Candle>& candles) const {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const size_t n = candles.size();
    const size_t window = static_cast<size_t>(params_.slope_window);

    indicators::SmaIndicator sma(params_.ma_period);
    sma.calculate(candles);
    core::TimeSeries<double> ma = indicators::alignResult(sma.getResult(), n);

    core::TimeSeries<double> slope(n, nan);
    core::TimeSeries<double> slope_pct(n, nan);
    core::TimeSeries<double> trend_dir(n, 0.0);

    for (size_t i = window; i < n; ++i) {
        slope[i] = (ma[i] - ma[i - window]) / static_cast<double>(window);
        slope_pct[i] = slope[i] / ma[i] * 100.0;
        if (slope_pct[i] > params_.flat_threshold) {
            trend_dir[i] = 1.0;
        } else if (slope_pct[i] < -params_.flat_threshold) {
            trend_dir[i] = -1.0;
        }
    }

    SignalFrame frame;
    frame["ma"] = std::move(ma);
    frame["ma_slope"] = std::move(slope);
    frame["ma_slope_pct"] = std::move(slope_pct);
    frame["trend_dir"] = std::move(trend_dir);
    return frame;
}

} // namespace strategy_engine
