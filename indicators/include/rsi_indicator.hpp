#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Wilder's Relative Strength Index on close prices, in [0, 100]
class RsiIndicator : public IIndicator {
public:
    explicit RsiIndicator(int period);

    virtual ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    // RSI of an arbitrary value series; values[i] is treated as the close of bar i
    void calculate(const std::vector<double>& values);

    int getPeriod() const { return period_; }

private:
    const int period_;
    int lookback_;              // equals period_: the first change needs one prior close
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
