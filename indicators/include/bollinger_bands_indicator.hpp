#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Bollinger Bands on close prices: SMA(period) +/- num_std sample standard deviations.
// getResult() returns the middle band; all three bands share the same lookback.
class BollingerBandsIndicator : public IIndicator {
public:
    BollingerBandsIndicator(int period, double num_std);

    virtual ~BollingerBandsIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    const core::TimeSeries<double>& getUpperBand() const { return upper_; }
    const core::TimeSeries<double>& getLowerBand() const { return lower_; }

private:
    const int period_;
    const double num_std_;
    double ta_deviations_;      // num_std rescaled for TA-Lib's population deviation
    int lookback_;
    std::string name_;
    core::TimeSeries<double> upper_;
    core::TimeSeries<double> middle_;
    core::TimeSeries<double> lower_;
};

} // namespace indicators
