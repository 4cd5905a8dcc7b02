#pragma once

#include <cstddef>
#include <cstdint>

#include "datatypes.hpp"

namespace data {

    struct SyntheticSeriesConfig {
        std::size_t bars = 1000;
        core::Timestamp start{};             // defaults to the epoch
        std::int64_t interval_seconds = 86400;
        double start_price = 100.0;
        double annual_drift = 0.05;
        double annual_volatility = 0.20;
        std::uint64_t seed = 42;
    };

    // Geometric Brownian motion OHLCV bars. The same config always yields the same
    // series, which makes it the data source for demos and tests.
    class SyntheticSeriesGenerator {
    public:
        // Throws ConfigException for zero bars, a non-positive interval or start price,
        // or a negative volatility.
        explicit SyntheticSeriesGenerator(SyntheticSeriesConfig config);

        core::TimeSeries<core::Candle> generate() const;

        const SyntheticSeriesConfig& getConfig() const { return config_; }

    private:
        SyntheticSeriesConfig config_;
    };

} // namespace data
