#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common_types.hpp"
#include "logging.hpp"
#include "synthetic_data.hpp"
#include "walk_forward.hpp"

namespace cli {

    using json = nlohmann::json;

    enum class DataSource {
        Sqlite,
        Synthetic
    };

    struct SqliteSourceConfig {
        std::string db_path;
        std::string instrument_key;
        std::string interval = "day";
        core::Timestamp start;
        core::Timestamp end;
    };

    struct DataConfig {
        DataSource source = DataSource::Synthetic;
        SqliteSourceConfig sqlite;               // used when source == Sqlite
        data::SyntheticSeriesConfig synthetic;   // used when source == Synthetic
    };

    struct StrategyConfig {
        strategy_engine::StrategyType type = strategy_engine::StrategyType::MACrossover;
        strategy_engine::ParameterMap params;    // empty means the strategy's defaults
    };

    struct SignalConfig {
        std::string name;                        // "ADXTrend" or "MASlopeTrend"
        strategy_engine::ParameterMap params;
    };

    struct RunConfig {
        core::logging::LoggingConfig logging;
        DataConfig data;
        StrategyConfig strategy;
        validation::WalkForwardConfig walk_forward;
        std::vector<SignalConfig> signals;
        std::string report_path;                 // empty: no JSON report
    };

    // Build a RunConfig from a parsed document. Every section except "data" and
    // "strategy" is optional. Throws ConfigException for missing or ill-typed fields
    // and unknown enum names; strategy and signal parameters are checked by building
    // them once (StrategyException).
    RunConfig parseRunConfig(const json& document);

    // loadJsonFile() + parseRunConfig()
    RunConfig loadRunConfig(const std::string& path);

} // namespace cli
