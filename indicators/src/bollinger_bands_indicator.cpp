#include "bollinger_bands_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <cmath>
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

BollingerBandsIndicator::BollingerBandsIndicator(int period, double num_std)
    : period_(period), num_std_(num_std), ta_deviations_(0.0), lookback_(0)
{
    if (period_ < 2) {
        throw std::invalid_argument(fmt::format("Bollinger period must be at least 2, got {}.", period_));
    }
    if (!(num_std_ > 0.0)) {
        throw std::invalid_argument(fmt::format("Bollinger num_std must be positive, got {}.", num_std_));
    }

    // TA_BBANDS measures population deviation; the bands are defined on the sample
    // deviation, which is larger by sqrt(n / (n - 1)).
    ta_deviations_ = num_std_ * std::sqrt(static_cast<double>(period_) / static_cast<double>(period_ - 1));

    lookback_ = TA_BBANDS_Lookback(period_, ta_deviations_, ta_deviations_, TA_MAType_SMA);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_BBANDS_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("BBANDS({},{})", period_, num_std_);
    core::logging::getLogger()->trace("BollingerBandsIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string BollingerBandsIndicator::getName() const {
    return name_;
}

int BollingerBandsIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& BollingerBandsIndicator::getResult() const {
    return middle_;
}

void BollingerBandsIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    upper_.clear();
    middle_.clear();
    lower_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> close_prices = closePrices(input);
    int output_size = static_cast<int>(close_prices.size()) - lookback_;
    upper_.resize(output_size);
    middle_.resize(output_size);
    lower_.resize(output_size);

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_BBANDS(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        ta_deviations_,                        // optInNbDevUp
        ta_deviations_,                        // optInNbDevDn
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        upper_.data(),
        middle_.data(),
        lower_.data()
    );

    if (ret_code != TA_SUCCESS) {
        upper_.clear();
        middle_.clear();
        lower_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_BBANDS failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }

    if (out_nb_element != output_size) {
        logger->warn("TA_BBANDS out_nb_element ({}) does not match expected output size ({}) for {}. Resizing results.",
                     out_nb_element, output_size, name_);
        upper_.resize(out_nb_element);
        middle_.resize(out_nb_element);
        lower_.resize(out_nb_element);
    }

    logger->trace("Successfully calculated {} results for {}", middle_.size(), name_);
}

} // namespace indicators
