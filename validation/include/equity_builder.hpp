#pragma once

#include <vector>

#include "datatypes.hpp"

namespace validation {

    // Close-to-close simple returns, index-aligned with the candles.
    // The first bar has no prior close and gets 0.
    core::TimeSeries<double> computeBarReturns(const core::TimeSeries<core::Candle>& candles);

    // Bar-by-bar equity of trading 'signal' over 'bar_returns' (same length, >= 2).
    //
    // The position held during bar t is signal[t - 1]: a decision made on bar t's close
    // is never applied to bar t's own return. Bar 0 is held flat. Equity compounds
    // (1 + position * return) and is normalised so the first value is exactly 1.0.
    //
    // Throws ValidationException on mismatched lengths, fewer than 2 bars, or signal
    // values outside {-1, 0, +1}.
    core::TimeSeries<double> buildEquityValues(const core::PositionSignal& signal,
                                               const core::TimeSeries<double>& bar_returns);

    // Same as buildEquityValues(), attaching the bar timestamps of the slice.
    core::EquityCurve buildEquityCurve(const core::PositionSignal& signal,
                                       const core::TimeSeries<double>& bar_returns,
                                       const core::TimeSeries<core::Timestamp>& timestamps);

} // namespace validation
