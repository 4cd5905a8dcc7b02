#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>

#include "utils.hpp"
#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

using core::utils::stringToTimestamp;
using core::utils::timestampToString;

TEST(UtilsTest, DateOnlyStringsAreMidnightUtc) {
    EXPECT_EQ(stringToTimestamp("2024-01-01"), stringToTimestamp("2024-01-01T00:00:00Z"));
    EXPECT_EQ(timestampToString(stringToTimestamp("2024-02-29")), "2024-02-29T00:00:00Z");
}

TEST(UtilsTest, OffsetsAreNormalisedToUtc) {
    EXPECT_EQ(stringToTimestamp("2024-01-01T05:30:00+05:30"), stringToTimestamp("2024-01-01T00:00:00Z"));
    EXPECT_EQ(stringToTimestamp("2023-12-31T20:00:00-04:00"), stringToTimestamp("2024-01-01T00:00:00Z"));
    EXPECT_EQ(timestampToString(stringToTimestamp("2024-03-15T12:34:56Z")), "2024-03-15T12:34:56Z");
}

TEST(UtilsTest, FractionalSecondsAreKept) {
    const auto base = stringToTimestamp("2024-03-15T12:34:56Z");
    EXPECT_DOUBLE_EQ(core::utils::secondsBetween(base, stringToTimestamp("2024-03-15T12:34:56.5Z")), 0.5);
    // Digits past nanoseconds are dropped
    EXPECT_EQ(stringToTimestamp("2024-03-15T12:34:56.1234567891Z") - base, std::chrono::nanoseconds(123456789));
    EXPECT_EQ(stringToTimestamp("2024-03-15T12:34:56.250+01:00"),
              stringToTimestamp("2024-03-15T11:34:56.25Z"));
}

TEST(UtilsTest, MalformedTimestampsThrow) {
    EXPECT_THROW(stringToTimestamp("not a date"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2024-01-01T00:00:00"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2024-01-01T00:00:00X"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2024-01-01T00:00:00Zjunk"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2024-01-01T00:00:00+05:75"), std::runtime_error);
    EXPECT_THROW(stringToTimestamp("2024/01/01"), std::runtime_error);
}

TEST(UtilsTest, SecondsBetween) {
    EXPECT_DOUBLE_EQ(core::utils::secondsBetween(stringToTimestamp("2024-01-01"), stringToTimestamp("2024-01-02")), 86400.0);
    EXPECT_DOUBLE_EQ(core::utils::secondsBetween(stringToTimestamp("2024-01-02"), stringToTimestamp("2024-01-01")), -86400.0);
}

TEST(ConfigTest, TypedFieldAccess) {
    const core::config::json object = {{"n", 3}, {"name", "x"}, {"empty", nullptr}};
    EXPECT_EQ(core::config::requireField<int>(object, "n", "section"), 3);
    EXPECT_THROW(core::config::requireField<int>(object, "missing", "section"), core::ConfigException);
    EXPECT_THROW(core::config::requireField<int>(object, "name", "section"), core::ConfigException);

    EXPECT_EQ(core::config::getOr<int>(object, "missing", 7, "section"), 7);
    EXPECT_EQ(core::config::getOr<int>(object, "empty", 7, "section"), 7);
    EXPECT_EQ(core::config::getOr<std::string>(object, "name", "y", "section"), "x");
}

TEST(ConfigTest, IntegerFieldsAreRangeChecked) {
    const auto object = core::config::json::parse(R"({"neg": -1, "big": 300, "frac": 1.5, "ok": 42})");
    EXPECT_EQ(core::config::getIntegerOr<std::size_t>(object, "ok", 0, "section"), 42u);
    EXPECT_EQ(core::config::getIntegerOr<int>(object, "neg", 0, "section"), -1);
    EXPECT_EQ(core::config::getIntegerOr<int>(object, "missing", 9, "section", 1), 9);

    EXPECT_THROW(core::config::getIntegerOr<std::size_t>(object, "neg", 0, "section"), core::ConfigException);
    EXPECT_THROW(core::config::getIntegerOr<std::uint8_t>(object, "big", 0, "section"), core::ConfigException);
    EXPECT_THROW(core::config::getIntegerOr<int>(object, "frac", 0, "section"), core::ConfigException);
    EXPECT_THROW(core::config::getIntegerOr<int>(object, "neg", 0, "section", 0), core::ConfigException);
}

TEST(LoggingTest, ReinitializingKeepsTheLoggerAvailable) {
    ASSERT_TRUE(core::logging::isInitialized());
    const auto level = core::logging::getLogger()->level();

    core::logging::LoggingConfig config;
    config.log_to_file = false;
    config.console_level = spdlog::level::err;
    core::logging::initialize(config);
    EXPECT_TRUE(core::logging::isInitialized());
    EXPECT_NE(core::logging::getLogger(), nullptr);

    config.console_level = level;
    core::logging::initialize(config);
}

TEST(ExceptionsTest, NoValidWindowsCarriesItsInputs) {
    const core::NoValidWindowsException error("nothing to test", 8, 12);
    EXPECT_EQ(error.nSplits(), 8);
    EXPECT_EQ(error.seriesLength(), 12u);
    EXPECT_STREQ(error.what(), "nothing to test");

    const core::PlatformException& base = error;
    EXPECT_STREQ(base.what(), "nothing to test");
}
