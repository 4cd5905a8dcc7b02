#include "run_config.hpp"
#include "config.hpp"
#include "exceptions.hpp"
#include "strategy_factory.hpp"
#include "utils.hpp"

#include <cstdint>

namespace cli {

    namespace {

        using core::config::getIntegerOr;
        using core::config::getOr;
        using core::config::requireField;

        core::Timestamp requireTimestamp(const json& object, const std::string& key, const std::string& context) {
            const auto text = requireField<std::string>(object, key, context);
            try {
                return core::utils::stringToTimestamp(text);
            } catch (const std::exception& e) {
                throw core::ConfigException("Field '" + context + "." + key + "' is not a valid timestamp: " + e.what());
            }
        }

        strategy_engine::ParameterMap parseParams(const json& object, const std::string& context) {
            if (!object.contains("params") || object.at("params").is_null()) {
                return {};
            }
            try {
                return strategy_engine::StrategyFactory::parseParameters(object.at("params"));
            } catch (const core::PlatformException& e) {
                throw core::ConfigException("Field '" + context + ".params': " + e.what());
            }
        }

        core::logging::LoggingConfig parseLogging(const json& section) {
            core::logging::LoggingConfig config;
            config.console_level = core::logging::level_from_string(getOr<std::string>(section, "console_level", "info", "logging"));
            config.file_level = core::logging::level_from_string(getOr<std::string>(section, "file_level", "debug", "logging"));
            config.log_to_file = getOr<bool>(section, "log_to_file", config.log_to_file, "logging");
            config.log_dir = getOr<std::string>(section, "log_dir", config.log_dir, "logging");
            config.base_log_filename = getOr<std::string>(section, "base_log_filename", config.base_log_filename, "logging");
            return config;
        }

        DataConfig parseData(const json& section) {
            DataConfig config;
            const auto source = requireField<std::string>(section, "source", "data");
            if (source == "sqlite") {
                config.source = DataSource::Sqlite;
                const json& sqlite = section.contains("sqlite") ? section.at("sqlite") : json::object();
                config.sqlite.db_path = requireField<std::string>(sqlite, "db_path", "data.sqlite");
                config.sqlite.instrument_key = requireField<std::string>(sqlite, "instrument_key", "data.sqlite");
                config.sqlite.interval = getOr<std::string>(sqlite, "interval", config.sqlite.interval, "data.sqlite");
                config.sqlite.start = requireTimestamp(sqlite, "start", "data.sqlite");
                config.sqlite.end = requireTimestamp(sqlite, "end", "data.sqlite");
                if (config.sqlite.end < config.sqlite.start) {
                    throw core::ConfigException("data.sqlite.end is before data.sqlite.start");
                }
            } else if (source == "synthetic") {
                config.source = DataSource::Synthetic;
                const json& synthetic = section.contains("synthetic") ? section.at("synthetic") : json::object();
                auto& out = config.synthetic;
                out.bars = getIntegerOr<std::size_t>(synthetic, "bars", out.bars, "data.synthetic", 1);
                if (synthetic.contains("start")) {
                    out.start = requireTimestamp(synthetic, "start", "data.synthetic");
                }
                out.interval_seconds = getIntegerOr<std::int64_t>(synthetic, "interval_seconds", out.interval_seconds, "data.synthetic", 1);
                out.start_price = getOr<double>(synthetic, "start_price", out.start_price, "data.synthetic");
                out.annual_drift = getOr<double>(synthetic, "annual_drift", out.annual_drift, "data.synthetic");
                out.annual_volatility = getOr<double>(synthetic, "annual_volatility", out.annual_volatility, "data.synthetic");
                out.seed = getIntegerOr<std::uint64_t>(synthetic, "seed", out.seed, "data.synthetic", 0);
            } else {
                throw core::ConfigException("Unknown data.source '" + source + "' (expected 'sqlite' or 'synthetic')");
            }
            return config;
        }

        StrategyConfig parseStrategy(const json& section) {
            StrategyConfig config;
            const auto type_name = requireField<std::string>(section, "type", "strategy");
            try {
                config.type = strategy_engine::StrategyFactory::typeFromString(type_name);
            } catch (const core::StrategyException& e) {
                throw core::ConfigException(std::string("strategy.type: ") + e.what());
            }
            config.params = parseParams(section, "strategy");
            // Fail at load time rather than inside the first window
            strategy_engine::StrategyFactory::createStrategy(config.type, config.params);
            return config;
        }

        validation::WalkForwardConfig parseWalkForward(const json& section) {
            validation::WalkForwardConfig config;
            config.n_splits = getIntegerOr<int>(section, "n_splits", config.n_splits, "walk_forward", 1);
            config.train_frac = getOr<double>(section, "train_frac", config.train_frac, "walk_forward");
            const auto window_type = getOr<std::string>(section, "window_type", "rolling", "walk_forward");
            try {
                config.window_type = validation::windowTypeFromString(window_type);
            } catch (const core::ValidationException& e) {
                throw core::ConfigException(std::string("walk_forward.window_type: ") + e.what());
            }
            return config;
        }

        std::vector<SignalConfig> parseSignals(const json& section) {
            if (!section.is_array()) {
                throw core::ConfigException("Field 'signals' must be an array");
            }
            std::vector<SignalConfig> signals;
            for (size_t i = 0; i < section.size(); ++i) {
                const std::string context = "signals[" + std::to_string(i) + "]";
                SignalConfig signal;
                signal.name = requireField<std::string>(section.at(i), "name", context);
                signal.params = parseParams(section.at(i), context);
                strategy_engine::StrategyFactory::createSignal(signal.name, signal.params);
                signals.push_back(std::move(signal));
            }
            return signals;
        }

    } // end anonymous namespace

    RunConfig parseRunConfig(const json& document) {
        if (!document.is_object()) {
            throw core::ConfigException("Run config must be a JSON object");
        }

        RunConfig config;
        if (document.contains("logging")) {
            config.logging = parseLogging(document.at("logging"));
        }
        if (!document.contains("data")) {
            throw core::ConfigException("Missing required section 'data'");
        }
        config.data = parseData(document.at("data"));
        if (!document.contains("strategy")) {
            throw core::ConfigException("Missing required section 'strategy'");
        }
        config.strategy = parseStrategy(document.at("strategy"));
        if (document.contains("walk_forward")) {
            config.walk_forward = parseWalkForward(document.at("walk_forward"));
        }
        if (document.contains("signals")) {
            config.signals = parseSignals(document.at("signals"));
        }
        if (document.contains("report")) {
            config.report_path = getOr<std::string>(document.at("report"), "path", "", "report");
        }
        return config;
    }

    RunConfig loadRunConfig(const std::string& path) {
        return parseRunConfig(core::config::loadJsonFile(path));
    }

} // namespace cli
