#include "equity_builder.hpp"
#include "exceptions.hpp"

#include <spdlog/fmt/fmt.h>

namespace validation {

    core::TimeSeries<double> computeBarReturns(const core::TimeSeries<core::Candle>& candles) {
        core::TimeSeries<double> returns(candles.size(), 0.0);
        for (size_t i = 1; i < candles.size(); ++i) {
            returns[i] = candles[i].close / candles[i - 1].close - 1.0;
        }
        return returns;
    }

    core::TimeSeries<double> buildEquityValues(const core::PositionSignal& signal,
                                               const core::TimeSeries<double>& bar_returns) {
        if (signal.size() != bar_returns.size()) {
            throw core::ValidationException(fmt::format(
                "Signal length ({}) does not match bar_returns length ({})", signal.size(), bar_returns.size()));
        }
        if (signal.size() < 2) {
            throw core::ValidationException(fmt::format(
                "Equity needs at least 2 bars, got {}", signal.size()));
        }

        core::TimeSeries<double> equity(signal.size());
        double running = 1.0;
        int position = 0; // flat until the first decision is known

        for (size_t t = 0; t < signal.size(); ++t) {
            running *= 1.0 + static_cast<double>(position) * bar_returns[t];
            equity[t] = running;

            if (!core::isValidPosition(signal[t])) {
                throw core::ValidationException(fmt::format(
                    "Signal value {} at bar {} is not one of -1, 0, +1", signal[t], t));
            }
            position = signal[t]; // applied from bar t + 1 onwards
        }

        const double first = equity.front();
        for (auto& value : equity) {
            value /= first;
        }
        return equity;
    }

    core::EquityCurve buildEquityCurve(const core::PositionSignal& signal,
                                       const core::TimeSeries<double>& bar_returns,
                                       const core::TimeSeries<core::Timestamp>& timestamps) {
        if (timestamps.size() != signal.size()) {
            throw core::ValidationException(fmt::format(
                "Timestamp count ({}) does not match signal length ({})", timestamps.size(), signal.size()));
        }
        core::EquityCurve curve;
        curve.values = buildEquityValues(signal, bar_returns);
        curve.timestamps = timestamps;
        return curve;
    }

} // namespace validation
