// cli/src/main.cpp

#include <iostream>
#include <string>
#include <exception>
#include <map>
#include <memory>
#include <cmath>

#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "run_config.hpp"
#include "candle_store.hpp"
#include "synthetic_data.hpp"
#include "strategy_factory.hpp"
#include "strategy_params.hpp"
#include "walk_forward.hpp"
#include "report.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

namespace {

    const char* kDefaultConfigPath = "config/walk_forward.json";

    core::TimeSeries<core::Candle> loadSeries(const cli::DataConfig& config) {
        auto logger = core::logging::getLogger();
        if (config.source == cli::DataSource::Sqlite) {
            const auto& sqlite = config.sqlite;
            logger->info("Loading {} ({}) from {} between {} and {}",
                         sqlite.instrument_key, sqlite.interval, sqlite.db_path,
                         core::utils::timestampToString(sqlite.start),
                         core::utils::timestampToString(sqlite.end));
            data::CandleStore store(sqlite.db_path);
            store.connect();
            logger->debug("Querying candles from {}", store.getPath());
            return store.queryCandles(sqlite.instrument_key, sqlite.interval, sqlite.start, sqlite.end);
        }

        const data::SyntheticSeriesGenerator generator(config.synthetic);
        logger->info("Generating {} synthetic bars (seed {})", generator.getConfig().bars, generator.getConfig().seed);
        return generator.generate();
    }

    // Bars and mean OOS bar return per trend_dir value of each configured signal
    void logSignalRegimes(const std::vector<cli::SignalConfig>& signals,
                          const core::TimeSeries<core::Candle>& series,
                          const core::EquityCurve& oos_equity)
    {
        auto logger = core::logging::getLogger();

        std::map<core::Timestamp, size_t> bar_index;
        for (size_t i = 0; i < series.size(); ++i) {
            bar_index.emplace(series[i].timestamp, i);
        }

        for (const auto& signal_config : signals) {
            auto signal = strategy_engine::StrategyFactory::createSignal(signal_config.name, signal_config.params);
            const auto frame = signal->compute(series);
            auto dir_it = frame.find("trend_dir");
            if (dir_it == frame.end()) {
                logger->warn("Signal '{}' has no trend_dir column; skipping regime breakdown", signal->getName());
                continue;
            }
            const auto& trend_dir = dir_it->second;

            // regime -> (bars, summed OOS return)
            std::map<std::string, std::pair<size_t, double>> regimes;
            for (size_t i = 1; i < oos_equity.size(); ++i) {
                const double bar_return = oos_equity.values[i] / oos_equity.values[i - 1] - 1.0;
                auto idx_it = bar_index.find(oos_equity.timestamps[i]);
                std::string regime = "warm-up";
                if (idx_it != bar_index.end() && std::isfinite(trend_dir[idx_it->second])) {
                    const double dir = trend_dir[idx_it->second];
                    regime = dir > 0.0 ? "up" : (dir < 0.0 ? "down" : "flat");
                }
                auto& bucket = regimes[regime];
                bucket.first += 1;
                bucket.second += bar_return;
            }

            logger->info("--- Regimes: {} ---", signal->getName());
            for (const auto& [regime, bucket] : regimes) {
                logger->info("{:<8} bars={:>6} mean OOS bar return={:.6f}",
                             regime, bucket.first, bucket.second / static_cast<double>(bucket.first));
            }
        }
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    try {
        // Console-only until the run config says otherwise
        core::logging::LoggingConfig bootstrap;
        bootstrap.log_to_file = false;
        core::logging::initialize(bootstrap);
        std::shared_ptr<spdlog::logger> logger = core::logging::getLogger();

        if (argc > 2) {
            std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
            return 1;
        }
        const std::string config_path = argc == 2 ? argv[1] : kDefaultConfigPath;

        cli::RunConfig config = cli::loadRunConfig(config_path);
        core::logging::initialize(config.logging);
        logger = core::logging::getLogger();
        logger->info("Walk-forward CLI starting with config {}", config_path);

        // --- Data ---
        const auto series = loadSeries(config.data);
        if (series.empty()) {
            throw core::DataLoadException("No candles loaded; check the data section of " + config_path);
        }
        logger->info("Series: {} bars from {} to {}", series.size(),
                     core::utils::timestampToString(series.front().timestamp),
                     core::utils::timestampToString(series.back().timestamp));

        // --- Walk-forward ---
        const auto strategy_name = strategy_engine::StrategyFactory::typeToString(config.strategy.type);
        logger->info("Strategy: {}", strategy_engine::formatParameters(strategy_name, config.strategy.params));

        validation::WalkForwardValidator validator(config.walk_forward);
        logger->debug("Validator: n_splits={}, train_frac={}, window_type={}",
                      validator.getConfig().n_splits, validator.getConfig().train_frac,
                      validation::windowTypeToString(validator.getConfig().window_type));
        const auto result = validator.run(strategy_engine::StrategyFactory::makeFactory(config.strategy.type),
                                          series, config.strategy.params);

        validation::logSummaryTable(result);
        validation::logMetrics("Out-of-Sample Metrics", result.oos_metrics);

        if (!config.signals.empty()) {
            logSignalRegimes(config.signals, series, result.oos_equity);
        }

        if (!config.report_path.empty()) {
            validation::writeReport(result, config.report_path);
        }

        logger->info("Walk-forward CLI finished.");

    } catch (const core::PlatformException& ex) {
        std::cerr << "Platform Error: " << ex.what() << std::endl;
        if (core::logging::isInitialized()) core::logging::getLogger()->critical("Platform Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (core::logging::isInitialized()) core::logging::getLogger()->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
