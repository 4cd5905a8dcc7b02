#include "adx_trend_signal.hpp"
#include "adx_indicator.hpp"
#include "logging.hpp"

namespace strategy_engine {

AdxTrendSignal::AdxTrendSignal(AdxTrendParams params) : params_(params) {
    params_.validate();
}

std::string AdxTrendSignal::getName() const { return formatParameters("ADXTrend", params_.toParameterMap()); }
std::string AdxTrendSignal::getOutputName() const { return "adx"; }

SignalFrame AdxTrendSignal::compute(const core::TimeSeries<core::Candle>& candles) const {
    indicators::AdxIndicator adx(params_.period);
    adx.calculate(candles);

    SignalFrame frame;
    frame["adx"] = indicators::alignResult(adx.getResult(), candles.size());
    frame["plus_di"] = indicators::alignResult(adx.getPlusDi(), candles.size());
    frame["minus_di"] = indicators::alignResult(adx.getMinusDi(), candles.size());

    const auto& adx_line = frame["adx"];
    const auto& plus_di = frame["plus_di"];
    const auto& minus_di = frame["minus_di"];

    core::TimeSeries<double> trend_dir(candles.size(), 0.0);
    for (size_t i = 0; i < candles.size(); ++i) {
        if (!(adx_line[i] >= params_.trend_threshold)) {
            continue; // ranging market or warm-up
        }
        if (plus_di[i] > minus_di[i]) {
            trend_dir[i] = 1.0;
        } else if (plus_di[i] < minus_di[i]) {
            trend_dir[i] = -1.0;
        }
    }
    frame["trend_dir"] = std::move(trend_dir);

    core::logging::getLogger()->trace("{} computed over {} bars", getName(), candles.size());
    return frame;
}

} // namespace strategy_engine
