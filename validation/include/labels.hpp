#pragma once

#include "datatypes.hpp"

namespace validation {

    // Targets for forecasting models. Row t is anchored on bar t's close and looks
    // 'horizon' bars ahead, so a label is only known 'horizon' bars later. Purge at
    // least 'horizon' bars when cross-validating on these labels.

    // log(close[t + horizon] / close[t]); the last 'horizon' rows are NaN.
    // Throws ValidationException when horizon < 1.
    core::TimeSeries<double> forwardReturn(const core::TimeSeries<core::Candle>& candles, int horizon = 1);

    // +1 when forwardReturn > threshold, -1 when below -threshold, 0 otherwise.
    // Rows without a forward return (the tail) are 0. A threshold of 0 leaves only
    // exact-zero moves flat. Throws ValidationException when horizon < 1 or threshold < 0.
    core::TimeSeries<int> directionLabel(const core::TimeSeries<core::Candle>& candles,
                                         int horizon = 1,
                                         double threshold = 0.0);

} // namespace validation
