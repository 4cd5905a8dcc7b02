#include "synthetic_data.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace data {

    namespace {
        constexpr double kSecondsPerYear = 365.0 * 86400.0;
    }

    SyntheticSeriesGenerator::SyntheticSeriesGenerator(SyntheticSeriesConfig config)
        : config_(config)
    {
        if (config_.bars == 0) {
            throw core::ConfigException("Synthetic series needs at least one bar");
        }
        if (config_.interval_seconds <= 0) {
            throw core::ConfigException("Synthetic series interval_seconds must be positive");
        }
        if (!(config_.start_price > 0.0)) {
            throw core::ConfigException("Synthetic series start_price must be positive");
        }
        if (!(config_.annual_volatility >= 0.0)) {
            throw core::ConfigException("Synthetic series annual_volatility must be non-negative");
        }
    }

    core::TimeSeries<core::Candle> SyntheticSeriesGenerator::generate() const {
        std::mt19937_64 rng(config_.seed);
        std::normal_distribution<double> norm(0.0, 1.0);
        std::uniform_real_distribution<double> unit(0.0, 1.0);

        const double dt = static_cast<double>(config_.interval_seconds) / kSecondsPerYear;
        const double bar_sigma = config_.annual_volatility * std::sqrt(dt);
        // Ito correction keeps the expected growth rate at annual_drift
        const double bar_mu = (config_.annual_drift - 0.5 * config_.annual_volatility * config_.annual_volatility) * dt;

        core::TimeSeries<core::Candle> candles;
        candles.reserve(config_.bars);

        double price = config_.start_price;
        for (std::size_t i = 0; i < config_.bars; ++i) {
            const double next_price = price * std::exp(bar_mu + bar_sigma * norm(rng));
            const double intrabar = std::abs(bar_sigma * norm(rng));

            core::Candle candle;
            candle.timestamp = config_.start + std::chrono::seconds(config_.interval_seconds * static_cast<std::int64_t>(i));
            candle.open = price;
            candle.close = next_price;
            candle.high = std::max(price, next_price) * (1.0 + intrabar);
            candle.low = std::min(price, next_price) * (1.0 - std::min(intrabar, 0.99));
            candle.volume = 1'000'000.0 * (0.5 + unit(rng));
            candles.push_back(candle);

            price = next_price;
        }

        core::logging::getLogger()->debug("Generated {} synthetic bars (seed {}, drift {}, vol {})",
                                          candles.size(), config_.seed, config_.annual_drift, config_.annual_volatility);
        return candles;
    }

} // namespace data
