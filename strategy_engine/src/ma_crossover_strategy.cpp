#include "ma_crossover_strategy.hpp"
#include "sma_indicator.hpp"
#include "logging.hpp"

namespace strategy_engine {

MaCrossoverStrategy::MaCrossoverStrategy(MaCrossoverParams params) : params_(params) {
    params_.validate();
    core::logging::getLogger()->trace("Strategy '{}' created.", describe());
}

std::string MaCrossoverStrategy::getName() const { return "MACrossover"; }
std::string MaCrossoverStrategy::describe() const { return formatParameters(getName(), getParameters()); }
ParameterMap MaCrossoverStrategy::getParameters() const { return params_.toParameterMap(); }

core::PositionSignal MaCrossoverStrategy::generateSignals(const core::TimeSeries<core::Candle>& candles) const {
    indicators::SmaIndicator fast(params_.fast_period);
    indicators::SmaIndicator slow(params_.slow_period);
    fast.calculate(candles);
    slow.calculate(candles);

    const auto fast_ma = indicators::alignResult(fast.getResult(), candles.size());
    const auto slow_ma = indicators::alignResult(slow.getResult(), candles.size());

    // NaN comparisons are false, so warm-up bars stay flat
    core::PositionSignal signal(candles.size(), 0);
    for (size_t i = 0; i < candles.size(); ++i) {
        if (fast_ma[i] > slow_ma[i]) {
            signal[i] = 1;
        } else if (fast_ma[i] < slow_ma[i]) {
            signal[i] = -1;
        }
    }
    return signal;
}

} // namespace strategy_engine
