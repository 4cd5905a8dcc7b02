#include "adx_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

namespace {

    // All three TA-Lib directional functions share this signature
    using DirectionalFn = TA_RetCode (*)(int, int, const double[], const double[], const double[],
                                         int, int*, int*, double[]);

    core::TimeSeries<double> runDirectional(DirectionalFn fn, const char* fn_name, int lookback, int period,
                                            const std::vector<double>& high,
                                            const std::vector<double>& low,
                                            const std::vector<double>& close)
    {
        core::TimeSeries<double> out;
        if (close.size() <= static_cast<size_t>(lookback)) {
            return out;
        }
        out.resize(close.size() - static_cast<size_t>(lookback));

        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = fn(0, static_cast<int>(close.size()) - 1,
                                 high.data(), low.data(), close.data(),
                                 period, &out_begin_idx, &out_nb_element, out.data());
        if (ret_code != TA_SUCCESS) {
            throw core::IndicatorCalculationException(
                fmt::format("{} failed for period {} with code {}", fn_name, period, static_cast<int>(ret_code)));
        }
        out.resize(static_cast<size_t>(out_nb_element));
        return out;
    }

} // end anonymous namespace

AdxIndicator::AdxIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument(fmt::format("ADX period must be positive, got {}.", period_));
    }

    lookback_ = TA_ADX_Lookback(period_);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_ADX_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("ADX({})", period_);
    core::logging::getLogger()->trace("AdxIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string AdxIndicator::getName() const {
    return name_;
}

int AdxIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& AdxIndicator::getResult() const {
    return adx_;
}

void AdxIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);

    std::vector<double> high;
    std::vector<double> low;
    high.reserve(input.size());
    low.reserve(input.size());
    for (const auto& candle : input) {
        high.push_back(candle.high);
        low.push_back(candle.low);
    }
    std::vector<double> close = closePrices(input);

    adx_ = runDirectional(TA_ADX, "TA_ADX", lookback_, period_, high, low, close);
    plus_di_ = runDirectional(TA_PLUS_DI, "TA_PLUS_DI", TA_PLUS_DI_Lookback(period_), period_, high, low, close);
    minus_di_ = runDirectional(TA_MINUS_DI, "TA_MINUS_DI", TA_MINUS_DI_Lookback(period_), period_, high, low, close);

    logger->trace("Successfully calculated {} ADX values for {}", adx_.size(), name_);
}

} // namespace indicators
