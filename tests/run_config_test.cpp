#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "run_config.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

using json = nlohmann::json;

namespace {

json sampleDocument() {
    return json::parse(R"({
        "logging": { "console_level": "warn", "file_level": "trace", "log_to_file": false },
        "data": {
            "source": "synthetic",
            "synthetic": { "bars": 750, "start": "2021-03-01", "interval_seconds": 3600, "seed": 5 }
        },
        "strategy": { "type": "RSIMeanReversion", "params": { "period": 10, "oversold": 25 } },
        "walk_forward": { "n_splits": 4, "train_frac": 0.7, "window_type": "anchored" },
        "signals": [ { "name": "ADXTrend", "params": { "period": 20 } }, { "name": "MASlopeTrend" } ],
        "report": { "path": "out/report.json" }
    })");
}

} // namespace

TEST(RunConfigTest, ParsesEverySection) {
    const auto config = cli::parseRunConfig(sampleDocument());

    EXPECT_EQ(config.logging.console_level, spdlog::level::warn);
    EXPECT_EQ(config.logging.file_level, spdlog::level::trace);
    EXPECT_FALSE(config.logging.log_to_file);

    EXPECT_EQ(config.data.source, cli::DataSource::Synthetic);
    EXPECT_EQ(config.data.synthetic.bars, 750u);
    EXPECT_EQ(config.data.synthetic.start, core::utils::stringToTimestamp("2021-03-01"));
    EXPECT_EQ(config.data.synthetic.interval_seconds, 3600);
    EXPECT_EQ(config.data.synthetic.seed, 5u);
    EXPECT_DOUBLE_EQ(config.data.synthetic.start_price, data::SyntheticSeriesConfig{}.start_price);

    EXPECT_EQ(config.strategy.type, strategy_engine::StrategyType::RSIMeanReversion);
    EXPECT_EQ(config.strategy.params.at("period"), 10.0);
    EXPECT_EQ(config.strategy.params.at("oversold"), 25.0);

    EXPECT_EQ(config.walk_forward.n_splits, 4);
    EXPECT_DOUBLE_EQ(config.walk_forward.train_frac, 0.7);
    EXPECT_EQ(config.walk_forward.window_type, validation::WindowType::Anchored);

    ASSERT_EQ(config.signals.size(), 2u);
    EXPECT_EQ(config.signals[0].name, "ADXTrend");
    EXPECT_EQ(config.signals[0].params.at("period"), 20.0);
    EXPECT_TRUE(config.signals[1].params.empty());

    EXPECT_EQ(config.report_path, "out/report.json");
}

TEST(RunConfigTest, OptionalSectionsFallBackToDefaults) {
    const auto config = cli::parseRunConfig(json::parse(R"({
        "data": { "source": "synthetic" },
        "strategy": { "type": "MACrossover" }
    })"));
    EXPECT_EQ(config.walk_forward.n_splits, 5);
    EXPECT_DOUBLE_EQ(config.walk_forward.train_frac, 0.6);
    EXPECT_EQ(config.walk_forward.window_type, validation::WindowType::Rolling);
    EXPECT_TRUE(config.strategy.params.empty());
    EXPECT_TRUE(config.signals.empty());
    EXPECT_TRUE(config.report_path.empty());
    EXPECT_EQ(config.data.synthetic.bars, data::SyntheticSeriesConfig{}.bars);
}

TEST(RunConfigTest, SqliteSource) {
    const auto config = cli::parseRunConfig(json::parse(R"({
        "data": { "source": "sqlite", "sqlite": {
            "db_path": "candles.db", "instrument_key": "NSE_EQ|INE002A01018",
            "start": "2016-01-01", "end": "2016-12-31T23:59:59+05:30" } },
        "strategy": { "type": "BollingerBreakout" }
    })"));
    EXPECT_EQ(config.data.source, cli::DataSource::Sqlite);
    EXPECT_EQ(config.data.sqlite.db_path, "candles.db");
    EXPECT_EQ(config.data.sqlite.interval, "day");
    EXPECT_EQ(config.data.sqlite.end, core::utils::stringToTimestamp("2016-12-31T18:29:59Z"));
}

TEST(RunConfigTest, MissingOrIllTypedFieldsThrowConfigException) {
    auto without = [](const char* section) {
        json doc = sampleDocument();
        doc.erase(section);
        return doc;
    };
    EXPECT_THROW(cli::parseRunConfig(without("data")), core::ConfigException);
    EXPECT_THROW(cli::parseRunConfig(without("strategy")), core::ConfigException);
    EXPECT_THROW(cli::parseRunConfig(json::array()), core::ConfigException);

    json doc = sampleDocument();
    doc["walk_forward"]["n_splits"] = "four";
    EXPECT_THROW(cli::parseRunConfig(doc), core::ConfigException);

    doc = sampleDocument();
    doc["walk_forward"]["window_type"] = "expanding";
    EXPECT_THROW(cli::parseRunConfig(doc), core::ConfigException);

    doc = sampleDocument();
    doc["data"]["source"] = "csv";
    EXPECT_THROW(cli::parseRunConfig(doc), core::ConfigException);

    doc = sampleDocument();
    doc["strategy"]["type"] = "Momentum";
    EXPECT_THROW(cli::parseRunConfig(doc), core::ConfigException);

    doc = sampleDocument();
    doc["strategy"]["params"]["period"] = "ten";
    EXPECT_THROW(cli::parseRunConfig(doc), core::ConfigException);

    doc = sampleDocument();
    doc["signals"] = json::object();
    EXPECT_THROW(cli::parseRunConfig(doc), core::ConfigException);

    doc = sampleDocument();
    doc["data"] = json::parse(R"({ "source": "sqlite", "sqlite": { "db_path": "x.db" } })");
    EXPECT_THROW(cli::parseRunConfig(doc), core::ConfigException);

    doc = sampleDocument();
    doc["data"]["synthetic"]["start"] = "yesterday";
    EXPECT_THROW(cli::parseRunConfig(doc), core::ConfigException);
}

TEST(RunConfigTest, IntegerFieldsOutOfRangeAreRejected) {
    auto with = [](const char* section, const char* sub, const char* key, const json& value) {
        json doc = sampleDocument();
        if (sub) {
            doc[section][sub][key] = value;
        } else {
            doc[section][key] = value;
        }
        return doc;
    };
    EXPECT_THROW(cli::parseRunConfig(with("data", "synthetic", "bars", -1)), core::ConfigException);
    EXPECT_THROW(cli::parseRunConfig(with("data", "synthetic", "bars", 0)), core::ConfigException);
    EXPECT_THROW(cli::parseRunConfig(with("data", "synthetic", "bars", 2.5)), core::ConfigException);
    EXPECT_THROW(cli::parseRunConfig(with("data", "synthetic", "interval_seconds", -60)), core::ConfigException);
    EXPECT_THROW(cli::parseRunConfig(with("data", "synthetic", "seed", -3)), core::ConfigException);
    EXPECT_THROW(cli::parseRunConfig(with("walk_forward", nullptr, "n_splits", 0)), core::ConfigException);
    EXPECT_THROW(cli::parseRunConfig(with("walk_forward", nullptr, "n_splits", 5000000000LL)), core::ConfigException);

    const auto config = cli::parseRunConfig(with("data", "synthetic", "seed", 18446744073709551615ULL));
    EXPECT_EQ(config.data.synthetic.seed, 18446744073709551615ULL);
}

TEST(RunConfigTest, StrategyAndSignalParametersAreCheckedAtLoadTime) {
    json doc = sampleDocument();
    doc["strategy"] = json::parse(R"({ "type": "MACrossover", "params": { "fast_period": 50, "slow_period": 20 } })");
    EXPECT_THROW(cli::parseRunConfig(doc), core::StrategyException);

    doc = sampleDocument();
    doc["signals"] = json::parse(R"([ { "name": "Volatility" } ])");
    EXPECT_THROW(cli::parseRunConfig(doc), core::StrategyException);

    doc = sampleDocument();
    doc["strategy"]["params"]["period"] = 1;
    EXPECT_THROW(cli::parseRunConfig(doc), core::StrategyException);

    doc = sampleDocument();
    doc["signals"][0]["params"]["period"] = 1;
    EXPECT_THROW(cli::parseRunConfig(doc), core::StrategyException);
}

TEST(RunConfigTest, LoadFromMissingFileThrows) {
    EXPECT_THROW(cli::loadRunConfig("/nonexistent/walk_forward.json"), core::ConfigException);
}
