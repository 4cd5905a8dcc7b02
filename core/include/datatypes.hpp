#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <cstddef>

namespace core {

    // Using system_clock for time points, all values are UTC
    using Timestamp = std::chrono::system_clock::time_point;

    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0; // Fractional volumes are common for crypto pairs

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Ordered sequence addressed by integer bar position
    template<typename T>
    using TimeSeries = std::vector<T>;

    // Per-bar position decision: -1 short, 0 flat, +1 long
    using PositionSignal = TimeSeries<int>;

    inline bool isValidPosition(int value) {
        return value == -1 || value == 0 || value == 1;
    }

    // Equity values index-aligned with the bars they were computed over.
    // timestamps and values always have the same length.
    struct EquityCurve {
        TimeSeries<Timestamp> timestamps;
        TimeSeries<double> values;

        std::size_t size() const { return values.size(); }
        bool empty() const { return values.empty(); }
        double front() const { return values.front(); }
        double back() const { return values.back(); }
    };

} // namespace core
