#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include <sqlite3.h>

#include "candle_store.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

namespace {

class CandleStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = (std::filesystem::temp_directory_path() / (std::string("wfv_") + info->name() + ".db")).string();
        std::filesystem::remove(path_);

        ASSERT_EQ(sqlite3_open(path_.c_str(), &db_), SQLITE_OK);
        exec(R"(
            CREATE TABLE historical_candles (
                instrument_key TEXT,
                interval TEXT,
                timestamp TEXT,
                open REAL,
                high REAL,
                low REAL,
                close REAL,
                volume REAL
            );
        )");
    }

    void TearDown() override {
        sqlite3_close(db_);
        std::filesystem::remove(path_);
    }

    void exec(const std::string& sql) {
        char* error = nullptr;
        const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
        const std::string message = error ? error : "";
        sqlite3_free(error);
        ASSERT_EQ(rc, SQLITE_OK) << message;
    }

    void insert(const std::string& key, const std::string& interval, const std::string& ts, double close) {
        exec("INSERT INTO historical_candles VALUES ('" + key + "', '" + interval + "', '" + ts + "', " +
             std::to_string(close - 1.0) + ", " + std::to_string(close + 1.0) + ", " +
             std::to_string(close - 2.0) + ", " + std::to_string(close) + ", 1500.5);");
    }

    std::string path_;
    sqlite3* db_ = nullptr;
};

core::Timestamp ts(const std::string& text) {
    return core::utils::stringToTimestamp(text);
}

} // namespace

TEST_F(CandleStoreTest, ReturnsMatchingRowsOldestFirst) {
    insert("NSE_EQ|ABC", "day", "2020-01-03T00:00:00Z", 103.0);
    insert("NSE_EQ|ABC", "day", "2020-01-01T00:00:00Z", 101.0);
    insert("NSE_EQ|ABC", "day", "2020-01-02T00:00:00Z", 102.0);
    insert("NSE_EQ|XYZ", "day", "2020-01-02T00:00:00Z", 999.0);
    insert("NSE_EQ|ABC", "1minute", "2020-01-02T00:00:00Z", 555.0);

    data::CandleStore store(path_);
    store.connect();
    ASSERT_TRUE(store.isConnected());

    const auto candles = store.queryCandles("NSE_EQ|ABC", "day", ts("2020-01-01"), ts("2020-01-31"));
    ASSERT_EQ(candles.size(), 3u);
    EXPECT_EQ(candles[0].timestamp, ts("2020-01-01"));
    EXPECT_DOUBLE_EQ(candles[0].close, 101.0);
    EXPECT_DOUBLE_EQ(candles[0].open, 100.0);
    EXPECT_DOUBLE_EQ(candles[0].high, 102.0);
    EXPECT_DOUBLE_EQ(candles[0].low, 99.0);
    EXPECT_DOUBLE_EQ(candles[0].volume, 1500.5);
    EXPECT_DOUBLE_EQ(candles[2].close, 103.0);

    store.disconnect();
    EXPECT_FALSE(store.isConnected());
}

TEST_F(CandleStoreTest, RangeBoundsAreInclusive) {
    for (int day = 1; day <= 9; ++day) {
        insert("K", "day", "2020-01-0" + std::to_string(day) + "T00:00:00Z", 100.0 + day);
    }
    data::CandleStore store(path_);
    store.connect();
    const auto candles = store.queryCandles("K", "day", ts("2020-01-03"), ts("2020-01-05"));
    ASSERT_EQ(candles.size(), 3u);
    EXPECT_DOUBLE_EQ(candles.front().close, 103.0);
    EXPECT_DOUBLE_EQ(candles.back().close, 105.0);

    EXPECT_TRUE(store.queryCandles("missing", "day", ts("2020-01-01"), ts("2020-12-31")).empty());
}

TEST_F(CandleStoreTest, DuplicateTimestampsAreRejected) {
    insert("K", "day", "2020-01-01T00:00:00Z", 100.0);
    insert("K", "day", "2020-01-01T00:00:00Z", 101.0);
    data::CandleStore store(path_);
    store.connect();
    EXPECT_THROW(store.queryCandles("K", "day", ts("2020-01-01"), ts("2020-01-31")), core::DataLoadException);
}

TEST_F(CandleStoreTest, UnparseableTimestampsAreRejected) {
    insert("K", "day", "2020-01-05 garbage", 100.0);
    data::CandleStore store(path_);
    store.connect();
    EXPECT_THROW(store.queryCandles("K", "day", ts("2020-01-01"), ts("2020-01-31")), core::DataLoadException);
}

TEST_F(CandleStoreTest, ConnectionFailuresThrow) {
    data::CandleStore not_connected(path_);
    EXPECT_EQ(not_connected.getPath(), path_);
    EXPECT_THROW(not_connected.queryCandles("K", "day", ts("2020-01-01"), ts("2020-01-31")), core::DataLoadException);

    data::CandleStore missing((std::filesystem::temp_directory_path() / "wfv_no_such_dir" / "none.db").string());
    EXPECT_THROW(missing.connect(), core::DataLoadException);
    EXPECT_FALSE(missing.isConnected());
}

TEST_F(CandleStoreTest, MissingTableThrows) {
    exec("DROP TABLE historical_candles;");
    data::CandleStore store(path_);
    store.connect();
    EXPECT_THROW(store.queryCandles("K", "day", ts("2020-01-01"), ts("2020-01-31")), core::DataLoadException);
}
