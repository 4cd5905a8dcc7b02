#include "candle_store.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp

#include <spdlog/fmt/fmt.h>

namespace data
{

    namespace
    {
        // Finalizes the statement on every exit path
        struct StatementGuard
        {
            sqlite3_stmt* stmt = nullptr;
            ~StatementGuard() { sqlite3_finalize(stmt); }
        };
    } // end anonymous namespace

    CandleStore::CandleStore(const std::string &db_path)
        : database_path_(db_path), db_(nullptr)
    {
        core::logging::getLogger()->debug("CandleStore created for path: {}", db_path);
    }

    CandleStore::~CandleStore()
    {
        disconnect();
    }

    void CandleStore::connect()
    {
        auto logger = core::logging::getLogger();
        if (isConnected())
        {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return;
        }

        logger->info("Opening SQLite database (read-only): {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            throw core::DataLoadException(fmt::format("Cannot open SQLite database '{}': {}", database_path_, message));
        }
        sqlite3_busy_timeout(db_, 5000);
    }

    void CandleStore::disconnect()
    {
        if (!db_)
        {
            return;
        }
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Happens when prepared statements are left unfinalized
            core::logging::getLogger()->error("Error closing SQLite database {}: {}", database_path_, sqlite3_errmsg(db_));
        }
        db_ = nullptr;
    }

    bool CandleStore::isConnected() const
    {
        return db_ != nullptr;
    }

    core::TimeSeries<core::Candle> CandleStore::queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time) const
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot query candles: not connected to " + database_path_);
        }

        // Stored timestamps are ISO 8601 UTC text, so text comparison orders them
        const std::string start_str = core::utils::timestampToString(start_time);
        const std::string end_str = core::utils::timestampToString(end_time);

        logger->debug("Querying candles for {} ({}) between '{}' and '{}'",
                      instrument_key, interval, start_str, end_str);

        const char* sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE instrument_key = ?
              AND interval = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            throw core::DataLoadException(fmt::format("Failed to prepare candle query [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        // Index is 1-based
        sqlite3_bind_text(guard.stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        core::TimeSeries<core::Candle> candles;
        size_t row_count = 0;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            ++row_count;
            const unsigned char* ts_text = sqlite3_column_text(guard.stmt, 0);
            if (!ts_text)
            {
                throw core::DataLoadException(fmt::format("NULL timestamp in row {} for {} ({})", row_count, instrument_key, interval));
            }

            core::Candle candle;
            try
            {
                candle.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char*>(ts_text));
            }
            catch (const std::exception& e)
            {
                throw core::DataLoadException(fmt::format("Bad timestamp in row {}: {}", row_count, e.what()));
            }
            candle.open = sqlite3_column_double(guard.stmt, 1);
            candle.high = sqlite3_column_double(guard.stmt, 2);
            candle.low = sqlite3_column_double(guard.stmt, 3);
            candle.close = sqlite3_column_double(guard.stmt, 4);
            candle.volume = sqlite3_column_double(guard.stmt, 5);

            // Text ordering can still hide mixed offsets or duplicates
            if (!candles.empty() && candle.timestamp <= candles.back().timestamp)
            {
                throw core::DataLoadException(fmt::format(
                    "Timestamps not strictly increasing at row {} ({} after {})", row_count,
                    core::utils::timestampToString(candle.timestamp),
                    core::utils::timestampToString(candles.back().timestamp)));
            }
            candles.push_back(candle);
        }

        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Error stepping through candle query [{}]: {}", rc, sqlite3_errmsg(db_)));
        }

        logger->info("Loaded {} candles for {} ({}) from {}", candles.size(), instrument_key, interval, database_path_);
        return candles;
    }

} // namespace data
