#include <gtest/gtest.h>
#include <chrono>
#include <ctime>
#include <regex>
#include "data_ngin/core/time_utils.hpp"

using namespace data_ngin;
using namespace data_ngin::core;

class TimeUtilsTest : public ::testing::Test {
protected:
    // 2024-01-02 00:00:00 UTC
    static constexpr long long kJan2Millis = 1704153600000LL;
};

TEST_F(TimeUtilsTest, SafeGmtimeEpochTime) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, SafeTimegmInvertsGmtime) {
    std::time_t original = 1704153600;
    std::tm broken;
    ASSERT_NE(safe_gmtime(&original, &broken), nullptr);
    EXPECT_EQ(safe_timegm(&broken), original);
}

TEST_F(TimeUtilsTest, GetFormattedTimeBasic) {
    std::string formatted = get_formatted_time("%Y%m%d_%H%M%S", false);
    EXPECT_TRUE(std::regex_match(formatted, std::regex(R"(\d{8}_\d{6})"))) << formatted;
}

TEST_F(TimeUtilsTest, ParseExactAcceptsCommandLineFormat) {
    auto parsed = parse_exact("20240102-00:00:00");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error()->what();

    auto utc = UtcTimestamp::specify_utc(parsed.value());
    EXPECT_EQ(to_epoch_millis(utc), kJan2Millis);
}

TEST_F(TimeUtilsTest, ParseExactKeepsFieldsAsWritten) {
    auto parsed = parse_exact("20240315-13:45:30");
    ASSERT_TRUE(parsed.is_ok());

    auto utc = UtcTimestamp::specify_utc(parsed.value());
    EXPECT_EQ(format_utc(utc, kDateTimeExactFormat), "20240315-13:45:30");
}

TEST_F(TimeUtilsTest, ParseExactRejectsOtherLayouts) {
    const char* bad_inputs[] = {"2024-01-02", "20240102", "20240102-00:00", "yesterday",
                                "20240102-00:00:00Z", "",
                                "20240231-00:00:00", "20230229-00:00:00", "20240431-12:00:00",
                                "20240102-23:59:60"};
    for (const char* input : bad_inputs) {
        auto parsed = parse_exact(input);
        EXPECT_TRUE(parsed.is_error()) << "accepted '" << input << "'";
        if (parsed.is_error()) {
            EXPECT_EQ(parsed.error()->code(), ErrorCode::CONFIGURATION_ERROR);
        }
    }
}

TEST_F(TimeUtilsTest, ParseExactAcceptsLeapDay) {
    auto parsed = parse_exact("20240229-23:59:59");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(format_utc(UtcTimestamp::specify_utc(parsed.value()), "%Y%m%d %H:%M:%S"),
              "20240229 23:59:59");
}

TEST_F(TimeUtilsTest, EpochMillisRoundTrip) {
    auto ts = from_epoch_millis(kJan2Millis + 34200000);  // 09:30
    EXPECT_EQ(to_epoch_millis(ts), kJan2Millis + 34200000);
    EXPECT_EQ(format_utc(ts, "%Y%m%d %H:%M"), "20240102 09:30");
}

TEST_F(TimeUtilsTest, DayStartAndMillisSinceMidnight) {
    auto ts = from_epoch_millis(kJan2Millis + 34200000 + 123);

    EXPECT_EQ(to_epoch_millis(utc_day_start(ts)), kJan2Millis);
    EXPECT_EQ(millis_since_midnight(ts), 34200123);

    auto midnight = from_epoch_millis(kJan2Millis);
    EXPECT_EQ(utc_day_start(midnight), midnight);
    EXPECT_EQ(millis_since_midnight(midnight), 0);
}

TEST_F(TimeUtilsTest, DayStartBeforeEpoch) {
    auto ts = from_epoch_millis(-1);
    EXPECT_EQ(to_epoch_millis(utc_day_start(ts)), -86400000LL);
    EXPECT_EQ(millis_since_midnight(ts), 86399999);
}
