#include "bollinger_strategies.hpp"
#include "bollinger_bands_indicator.hpp"
#include "logging.hpp"

namespace strategy_engine {

namespace {

    // +1 where the close is above the upper band, -1 below the lower band, 0 otherwise
    core::PositionSignal bandBreaches(const BollingerParams& params, const core::TimeSeries<core::Candle>& candles) {
        indicators::BollingerBandsIndicator bands(params.period, params.num_std);
        bands.calculate(candles);
        const auto upper = indicators::alignResult(bands.getUpperBand(), candles.size());
        const auto lower = indicators::alignResult(bands.getLowerBand(), candles.size());

        core::PositionSignal breaches(candles.size(), 0);
        for (size_t i = 0; i < candles.size(); ++i) {
            if (candles[i].close > upper[i]) {
                breaches[i] = 1;
            } else if (candles[i].close < lower[i]) {
                breaches[i] = -1;
            }
        }
        return breaches;
    }

} // end anonymous namespace

// --- BollingerMeanReversionStrategy ---

BollingerMeanReversionStrategy::BollingerMeanReversionStrategy(BollingerParams params) : params_(params) {
    params_.validate();
    core::logging::getLogger()->trace("Strategy '{}' created.", describe());
}

std::string BollingerMeanReversionStrategy::getName() const { return "BollingerMeanReversion"; }
std::string BollingerMeanReversionStrategy::describe() const { return formatParameters(getName(), getParameters()); }
ParameterMap BollingerMeanReversionStrategy::getParameters() const { return params_.toParameterMap(); }

core::PositionSignal BollingerMeanReversionStrategy::generateSignals(const core::TimeSeries<core::Candle>& candles) const {
    core::PositionSignal signal = bandBreaches(params_, candles);
    for (auto& value : signal) {
        value = -value; // overbought -> short, oversold -> long
    }
    return signal;
}

// --- BollingerBreakoutStrategy ---

BollingerBreakoutStrategy::BollingerBreakoutStrategy(BollingerParams params) : params_(params) {
    params_.validate();
    core::logging::getLogger()->trace("Strategy '{}' created.", describe());
}

std::string BollingerBreakoutStrategy::getName() const { return "BollingerBreakout"; }
std::string BollingerBreakoutStrategy::describe() const { return formatParameters(getName(), getParameters()); }
ParameterMap BollingerBreakoutStrategy::getParameters() const { return params_.toParameterMap(); }

core::PositionSignal BollingerBreakoutStrategy::generateSignals(const core::TimeSeries<core::Candle>& candles) const {
    return bandBreaches(params_, candles);
}

} // namespace strategy_engine
