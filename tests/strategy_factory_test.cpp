#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "strategy_factory.hpp"
#include "strategy_params.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using namespace strategy_engine;
using json = nlohmann::json;

TEST(StrategyFactoryTest, TypeNames) {
    for (StrategyType type : {StrategyType::MACrossover, StrategyType::RSIMeanReversion,
                              StrategyType::BollingerMeanReversion, StrategyType::BollingerBreakout}) {
        EXPECT_EQ(StrategyFactory::typeFromString(StrategyFactory::typeToString(type)), type);
    }
    EXPECT_THROW(StrategyFactory::typeFromString("Momentum"), core::StrategyException);
}

TEST(StrategyFactoryTest, CreatesStrategiesFromJson) {
    const json config = {{"type", "BollingerBreakout"}, {"params", {{"period", 30}, {"num_std", 2.5}}}};
    auto strategy = StrategyFactory::createStrategy(config);
    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->getName(), "BollingerBreakout");
    EXPECT_EQ(strategy->describe(), "BollingerBreakout(num_std=2.5, period=30)");

    auto defaults = StrategyFactory::createStrategy(json{{"type", "RSIMeanReversion"}});
    EXPECT_EQ(defaults->getParameters(), RsiParams{}.toParameterMap());
}

TEST(StrategyFactoryTest, ParameterRecordsRejectTyposAndFractions) {
    EXPECT_THROW(StrategyFactory::createStrategy(StrategyType::MACrossover, {{"fast_periods", 10}}),
                 core::StrategyException);
    EXPECT_THROW(StrategyFactory::createStrategy(StrategyType::RSIMeanReversion, {{"period", 14.5}}),
                 core::StrategyException);
    EXPECT_THROW(StrategyFactory::createStrategy(StrategyType::BollingerMeanReversion, {{"num_std", 0.0}}),
                 core::StrategyException);
    EXPECT_NO_THROW(StrategyFactory::createStrategy(StrategyType::MACrossover, {{"fast_period", 10.0}}));
}

TEST(StrategyFactoryTest, SinglePeriodRsiAndAdxAreRejectedUpFront) {
    EXPECT_THROW(StrategyFactory::createStrategy(StrategyType::RSIMeanReversion, {{"period", 1}}),
                 core::StrategyException);
    EXPECT_THROW(StrategyFactory::createSignal("ADXTrend", {{"period", 1}}), core::StrategyException);
    EXPECT_NO_THROW(StrategyFactory::createStrategy(StrategyType::RSIMeanReversion, {{"period", 2}}));
    EXPECT_NO_THROW(StrategyFactory::createSignal("ADXTrend", {{"period", 2}}));
}

TEST(StrategyFactoryTest, ParseParametersRequiresNumbers) {
    const auto params = StrategyFactory::parseParameters(json{{"fast_period", 5}, {"slow_period", 15}});
    EXPECT_EQ(params.at("fast_period"), 5.0);
    EXPECT_EQ(params.at("slow_period"), 15.0);
    EXPECT_TRUE(StrategyFactory::parseParameters(json()).empty());

    EXPECT_THROW(StrategyFactory::parseParameters(json{{"fast_period", "5"}}), core::StrategyException);
    EXPECT_THROW(StrategyFactory::parseParameters(json::array({1, 2})), core::StrategyException);
}

TEST(StrategyFactoryTest, FactoryBuildsAFreshInstancePerCall) {
    auto factory = StrategyFactory::makeFactory(StrategyType::MACrossover);
    auto first = factory({{"fast_period", 5}, {"slow_period", 10}});
    auto second = factory({{"fast_period", 8}, {"slow_period", 21}});
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(first.get(), second.get());
    EXPECT_EQ(first->getParameters().at("fast_period"), 5.0);
    EXPECT_EQ(second->getParameters().at("fast_period"), 8.0);
}

TEST(StrategyFactoryTest, CreatesSignalsByName) {
    auto adx = StrategyFactory::createSignal("ADXTrend", {{"period", 10}});
    EXPECT_EQ(adx->getName(), "ADXTrend(period=10, trend_threshold=25)");
    auto slope = StrategyFactory::createSignal("MASlopeTrend", {});
    EXPECT_EQ(slope->getOutputName(), "ma_slope_pct");

    EXPECT_THROW(StrategyFactory::createSignal("VolatilityRegime", {}), core::StrategyException);
    EXPECT_THROW(StrategyFactory::createSignal("MASlopeTrend", {{"window", 5}}), core::StrategyException);
}

TEST(StrategyFactoryTest, FormatParametersPrintsIntegralValuesWithoutDecimals) {
    EXPECT_EQ(formatParameters("X", {{"a", 2.0}, {"b", 0.25}}), "X(a=2, b=0.25)");
    EXPECT_EQ(formatParameters("Empty", {}), "Empty()");
}
