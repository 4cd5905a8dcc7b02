#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries
#include <string>
#include <vector>
#include <cstddef>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "SMA(20)", "RSI(14)")
    virtual std::string getName() const = 0;

    // Number of leading input bars consumed before the first valid output.
    virtual int getLookback() const = 0;

    // Calculate the indicator based on input candle data and store the result internally.
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    // The calculated results, input.size() - lookback values long.
    // Use alignResult() to get a series index-aligned with the input.
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

// Left-pad 'result' with NaN so that element i corresponds to input bar i.
core::TimeSeries<double> alignResult(const core::TimeSeries<double>& result, std::size_t input_size);

// Close prices of 'input' in bar order (TA-Lib works on plain double arrays).
std::vector<double> closePrices(const core::TimeSeries<core::Candle>& input);

} // namespace indicators
