#include "rsi_mean_reversion_strategy.hpp"
#include "rsi_indicator.hpp"
#include "logging.hpp"

namespace strategy_engine {

RsiMeanReversionStrategy::RsiMeanReversionStrategy(RsiParams params) : params_(params) {
    params_.validate();
    core::logging::getLogger()->trace("Strategy '{}' created.", describe());
}

std::string RsiMeanReversionStrategy::getName() const { return "RSIMeanReversion"; }
std::string RsiMeanReversionStrategy::describe() const { return formatParameters(getName(), getParameters()); }
ParameterMap RsiMeanReversionStrategy::getParameters() const { return params_.toParameterMap(); }

core::PositionSignal RsiMeanReversionStrategy::generateSignals(const core::TimeSeries<core::Candle>& candles) const {
    indicators::RsiIndicator rsi(params_.period);
    rsi.calculate(candles);
    const auto rsi_values = indicators::alignResult(rsi.getResult(), candles.size());

    core::PositionSignal signal(candles.size(), 0);
    for (size_t i = 0; i < candles.size(); ++i) {
        if (rsi_values[i] < params_.oversold) {
            signal[i] = 1;
        } else if (rsi_values[i] > params_.overbought) {
            signal[i] = -1;
        }
    }
    return signal;
}

} // namespace strategy_engine
