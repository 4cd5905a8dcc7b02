#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Wilder's Average Directional Index with the +DI / -DI lines.
// getResult() is the ADX line. The DI lines need fewer warm-up bars than ADX,
// so each line has its own length; align them with alignResult().
class AdxIndicator : public IIndicator {
public:
    explicit AdxIndicator(int period);

    virtual ~AdxIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    const core::TimeSeries<double>& getPlusDi() const { return plus_di_; }
    const core::TimeSeries<double>& getMinusDi() const { return minus_di_; }

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> adx_;
    core::TimeSeries<double> plus_di_;
    core::TimeSeries<double> minus_di_;
};

} // namespace indicators
