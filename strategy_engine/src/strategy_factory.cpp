#include "strategy_factory.hpp"
#include "strategy_params.hpp"
#include "ma_crossover_strategy.hpp"
#include "rsi_mean_reversion_strategy.hpp"
#include "bollinger_strategies.hpp"
#include "adx_trend_signal.hpp"
#include "ma_slope_signal.hpp"
#include "logging.hpp"
#include "exceptions.hpp"

#include <string>
#include <memory>
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

    StrategyType StrategyFactory::typeFromString(const std::string& name) {
        if (name == "MACrossover") return StrategyType::MACrossover;
        if (name == "RSIMeanReversion") return StrategyType::RSIMeanReversion;
        if (name == "BollingerMeanReversion") return StrategyType::BollingerMeanReversion;
        if (name == "BollingerBreakout") return StrategyType::BollingerBreakout;
        throw core::StrategyException("Unknown strategy type: " + name);
    }

    std::string StrategyFactory::typeToString(StrategyType type) {
        switch (type) {
            case StrategyType::MACrossover: return "MACrossover";
            case StrategyType::RSIMeanReversion: return "RSIMeanReversion";
            case StrategyType::BollingerMeanReversion: return "BollingerMeanReversion";
            case StrategyType::BollingerBreakout: return "BollingerBreakout";
        }
        throw core::StrategyException(fmt::format("Unhandled strategy type value: {}", static_cast<int>(type)));
    }

    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(StrategyType type, const ParameterMap& params) {
        switch (type) {
            case StrategyType::MACrossover:
                return std::make_unique<MaCrossoverStrategy>(MaCrossoverParams::fromParameterMap(params));
            case StrategyType::RSIMeanReversion:
                return std::make_unique<RsiMeanReversionStrategy>(RsiParams::fromParameterMap(params));
            case StrategyType::BollingerMeanReversion:
                return std::make_unique<BollingerMeanReversionStrategy>(BollingerParams::fromParameterMap(params));
            case StrategyType::BollingerBreakout:
                return std::make_unique<BollingerBreakoutStrategy>(BollingerParams::fromParameterMap(params));
        }
        throw core::StrategyException(fmt::format("Unhandled strategy type value: {}", static_cast<int>(type)));
    }

    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const json& config) {
        if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) {
            throw core::StrategyException("Strategy config must be an object with a 'type' (string).");
        }
        StrategyType type = typeFromString(config["type"].get<std::string>());

        ParameterMap params;
        if (config.contains("params")) {
            params = parseParameters(config["params"]);
        }

        auto strategy = createStrategy(type, params);
        core::logging::getLogger()->debug("Strategy '{}' loaded from config.", strategy->describe());
        return strategy;
    }

    StrategyFactoryFn StrategyFactory::makeFactory(StrategyType type) {
        return [type](const ParameterMap& params) {
            return createStrategy(type, params);
        };
    }

    std::unique_ptr<ISignal> StrategyFactory::createSignal(const std::string& name, const ParameterMap& params) {
        if (name == "ADXTrend") {
            return std::make_unique<AdxTrendSignal>(AdxTrendParams::fromParameterMap(params));
        }
        if (name == "MASlopeTrend") {
            return std::make_unique<MaSlopeSignal>(MaSlopeParams::fromParameterMap(params));
        }
        throw core::StrategyException("Unknown signal type: " + name);
    }

    ParameterMap StrategyFactory::parseParameters(const json& params_config) {
        if (params_config.is_null()) {
            return {};
        }
        if (!params_config.is_object()) {
            throw core::StrategyException("Strategy 'params' must be a JSON object.");
        }
        ParameterMap params;
        for (auto it = params_config.begin(); it != params_config.end(); ++it) {
            if (!it.value().is_number()) {
                throw core::StrategyException(
                    fmt::format("Strategy parameter '{}' must be a number, got {}", it.key(), it.value().dump()));
            }
            params[it.key()] = it.value().get<double>();
        }
        return params;
    }

} // namespace strategy_engine
