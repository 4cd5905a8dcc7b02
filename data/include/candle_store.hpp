#pragma once

#include <string>

#include <sqlite3.h>

#include "datatypes.hpp"

namespace data {

// Read-only access to the 'historical_candles' table:
//   (instrument_key TEXT, interval TEXT, timestamp TEXT (ISO 8601), open REAL,
//    high REAL, low REAL, close REAL, volume REAL)
class CandleStore {
public:
    explicit CandleStore(const std::string& db_path);
    ~CandleStore();

    CandleStore(const CandleStore&) = delete;
    CandleStore& operator=(const CandleStore&) = delete;

    // Opens the database read-only. Throws DataLoadException if it cannot be opened.
    void connect();
    void disconnect();
    bool isConnected() const;

    // Candles of one instrument/interval with start <= timestamp <= end, oldest first.
    // Throws DataLoadException on SQL errors, unparseable rows, or timestamps that
    // are not strictly increasing.
    core::TimeSeries<core::Candle> queryCandles(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time) const;

    const std::string& getPath() const { return database_path_; }

private:
    std::string database_path_;
    sqlite3* db_ = nullptr;
};

} // namespace data
