#pragma once

#include <string>

#include "common_types.hpp"

namespace strategy_engine {

    // Each record is the full, typed parameter set of one strategy or signal.
    // fromParameterMap() rejects unknown keys and non-integral values for integer
    // fields, then validates; missing keys keep their defaults.

    struct MaCrossoverParams {
        int fast_period = 20;
        int slow_period = 50;

        void validate() const;
        ParameterMap toParameterMap() const;
        static MaCrossoverParams fromParameterMap(const ParameterMap& params);
    };

    struct RsiParams {
        int period = 14;
        double oversold = 30.0;
        double overbought = 70.0;

        void validate() const;
        ParameterMap toParameterMap() const;
        static RsiParams fromParameterMap(const ParameterMap& params);
    };

    struct BollingerParams {
        int period = 20;
        double num_std = 2.0;

        void validate() const;
        ParameterMap toParameterMap() const;
        static BollingerParams fromParameterMap(const ParameterMap& params);
    };

    struct AdxTrendParams {
        int period = 14;
        double trend_threshold = 25.0;

        void validate() const;
        ParameterMap toParameterMap() const;
        static AdxTrendParams fromParameterMap(const ParameterMap& params);
    };

    struct MaSlopeParams {
        int ma_period = 20;
        int slope_window = 5;
        double flat_threshold = 0.05;

        void validate() const;
        ParameterMap toParameterMap() const;
        static MaSlopeParams fromParameterMap(const ParameterMap& params);
    };

    // "name(k1=v1, k2=v2)" with integral values printed without decimals
    std::string formatParameters(const std::string& name, const ParameterMap& params);

} // namespace strategy_engine
