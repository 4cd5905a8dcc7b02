#include "indicators.hpp"
#include "exceptions.hpp"

#include <limits>
#include <string>

namespace indicators {

core::TimeSeries<double> alignResult(const core::TimeSeries<double>& result, std::size_t input_size) {
    if (result.size() > input_size) {
        throw core::IndicatorCalculationException(
            "Indicator result (" + std::to_string(result.size()) + " values) is longer than its input ("
            + std::to_string(input_size) + " bars)");
    }
    core::TimeSeries<double> aligned(input_size - result.size(), std::numeric_limits<double>::quiet_NaN());
    aligned.insert(aligned.end(), result.begin(), result.end());
    return aligned;
}

std::vector<double> closePrices(const core::TimeSeries<core::Candle>& input) {
    std::vector<double> close_prices;
    close_prices.reserve(input.size());
    for (const auto& candle : input) {
        close_prices.push_back(candle.close);
    }
    return close_prices;
}

} // namespace indicators
