#pragma once

#include "indicators.hpp" // Base interface
#include <vector>
#include <string>

namespace indicators {

class SmaIndicator : public IIndicator {
public:
    // Constructor: Requires the period for the SMA
    explicit SmaIndicator(int period);

    virtual ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    // Same computation over an arbitrary value series (e.g. an indicator output)
    void calculate(const std::vector<double>& values);

private:
    const int period_;          // SMA period (e.g., 20, 50)
    int lookback_;              // TA-Lib lookback
    std::string name_;          // Indicator name (e.g., "SMA(50)")
    core::TimeSeries<double> results_;
};

} // namespace indicators
