#pragma once

#include <string>
#include <memory>
#include <nlohmann/json.hpp>

#include "interfaces.hpp"
#include "common_types.hpp"

namespace strategy_engine {

    using json = nlohmann::json;

    class StrategyFactory {
    public:
        // "MACrossover", "RSIMeanReversion", "BollingerMeanReversion", "BollingerBreakout"
        static StrategyType typeFromString(const std::string& name);
        static std::string typeToString(StrategyType type);

        static std::unique_ptr<IStrategy> createStrategy(StrategyType type, const ParameterMap& params);

        // Config shape: {"type": "MACrossover", "params": {"fast_period": 20, "slow_period": 50}}
        static std::unique_ptr<IStrategy> createStrategy(const json& config);

        // Callable handed to the walk-forward validator, one fresh instance per window
        static StrategyFactoryFn makeFactory(StrategyType type);

        // Market signals: "ADXTrend", "MASlopeTrend"
        static std::unique_ptr<ISignal> createSignal(const std::string& name, const ParameterMap& params);

        // JSON object of numbers -> ParameterMap
        static ParameterMap parseParameters(const json& params_config);
    };

} // namespace strategy_engine
