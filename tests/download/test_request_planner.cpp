#include <gtest/gtest.h>
#include <chrono>
#include "data_ngin/core/time_utils.hpp"
#include "data_ngin/download/request_planner.hpp"

using namespace data_ngin;

class RequestPlannerTest : public ::testing::Test {
protected:
    Timestamp at(const std::string& text) {
        return core::parse_exact(text).value();
    }

    const SecurityType all_types[12] = {
        SecurityType::BASE,   SecurityType::EQUITY,        SecurityType::OPTION,
        SecurityType::COMMODITY, SecurityType::FOREX,      SecurityType::FUTURE,
        SecurityType::CFD,    SecurityType::CRYPTO,        SecurityType::FUTURE_OPTION,
        SecurityType::INDEX,  SecurityType::INDEX_OPTION,  SecurityType::CRYPTO_FUTURE};
    const Resolution all_resolutions[5] = {Resolution::TICK, Resolution::SECOND,
                                           Resolution::MINUTE, Resolution::HOUR,
                                           Resolution::DAILY};

    RequestPlanner planner;
};

TEST_F(RequestPlannerTest, QuoteForForexCfdAndCryptoAtEveryResolution) {
    for (Resolution resolution : all_resolutions) {
        EXPECT_EQ(planner.infer_tick_type(SecurityType::FOREX, resolution), TickType::QUOTE);
        EXPECT_EQ(planner.infer_tick_type(SecurityType::CFD, resolution), TickType::QUOTE);
        EXPECT_EQ(planner.infer_tick_type(SecurityType::CRYPTO, resolution), TickType::QUOTE);
    }
}

TEST_F(RequestPlannerTest, TradeForEverythingElse) {
    for (SecurityType type : all_types) {
        if (type == SecurityType::FOREX || type == SecurityType::CFD ||
            type == SecurityType::CRYPTO) {
            continue;
        }
        for (Resolution resolution : all_resolutions) {
            EXPECT_EQ(planner.infer_tick_type(type, resolution), TickType::TRADE)
                << to_string(type) << " at " << to_string(resolution);
        }
    }
}

TEST_F(RequestPlannerTest, OptionTradesAtTickResolution) {
    EXPECT_EQ(planner.infer_tick_type(SecurityType::OPTION, Resolution::TICK), TickType::TRADE);
    EXPECT_EQ(planner.infer_tick_type(SecurityType::OPTION, Resolution::MINUTE), TickType::TRADE);
}

TEST_F(RequestPlannerTest, StandardTableRows) {
    const TickTypeTable& table = TickTypeTable::standard();
    EXPECT_EQ(table.fallback(), TickType::TRADE);
    EXPECT_EQ(table.find(SecurityType::FOREX, ResolutionClass::BAR).value(), TickType::QUOTE);
    EXPECT_FALSE(table.find(SecurityType::EQUITY, ResolutionClass::BAR).has_value());
    EXPECT_EQ(resolution_class(Resolution::TICK), ResolutionClass::TICK);
    EXPECT_EQ(resolution_class(Resolution::DAILY), ResolutionClass::BAR);
}

TEST_F(RequestPlannerTest, NewSecurityTypeIsOneTableRow) {
    TickTypeTable table;
    table.set(SecurityType::CRYPTO_FUTURE, ResolutionClass::BAR, TickType::QUOTE);
    RequestPlanner custom(table);

    EXPECT_EQ(custom.infer_tick_type(SecurityType::CRYPTO_FUTURE, Resolution::HOUR),
              TickType::QUOTE);
    EXPECT_EQ(custom.infer_tick_type(SecurityType::CRYPTO_FUTURE, Resolution::TICK),
              TickType::TRADE);
    EXPECT_EQ(custom.infer_tick_type(SecurityType::FOREX, Resolution::MINUTE), TickType::TRADE);
}

TEST_F(RequestPlannerTest, ParseResolution) {
    EXPECT_EQ(RequestPlanner::parse_resolution("").value(), Resolution::MINUTE);
    EXPECT_EQ(RequestPlanner::parse_resolution("daily").value(), Resolution::DAILY);
    EXPECT_EQ(RequestPlanner::parse_resolution("Tick").value(), Resolution::TICK);
    EXPECT_EQ(RequestPlanner::parse_resolution("HOUR").value(), Resolution::HOUR);

    auto bad = RequestPlanner::parse_resolution("Weekly");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error()->code(), ErrorCode::UNSUPPORTED_COMBINATION);
}

TEST_F(RequestPlannerTest, ForexDailyPlansQuoteRequest) {
    Instrument eurusd("EURUSD", SecurityType::FOREX, "oanda");
    auto request = planner.plan(eurusd, Resolution::DAILY, at("20240101-00:00:00"),
                                at("20240201-00:00:00"));

    ASSERT_TRUE(request.is_ok());
    EXPECT_EQ(request.value().instrument, eurusd);
    EXPECT_EQ(request.value().resolution, Resolution::DAILY);
    EXPECT_EQ(request.value().tick_type, TickType::QUOTE);
}

TEST_F(RequestPlannerTest, DatesAreDesignatedUtcWithoutShift) {
    Instrument aapl("AAPL", SecurityType::EQUITY, "usa");
    auto request = planner.plan(aapl, Resolution::MINUTE, at("20240102-09:30:00"),
                                at("20240102-16:00:00"));

    ASSERT_TRUE(request.is_ok());
    EXPECT_EQ(core::format_utc(request.value().range_start, core::kDateTimeExactFormat),
              "20240102-09:30:00");
    EXPECT_EQ(core::format_utc(request.value().range_end, core::kDateTimeExactFormat),
              "20240102-16:00:00");
    EXPECT_LE(request.value().range_start, request.value().range_end);
}

TEST_F(RequestPlannerTest, MissingEndDefaultsToProcessStart) {
    Instrument aapl("AAPL", SecurityType::EQUITY, "usa");
    auto request = planner.plan(aapl, Resolution::DAILY, at("20240101-00:00:00"));

    ASSERT_TRUE(request.is_ok());
    EXPECT_EQ(request.value().range_end.time_point(), RequestPlanner::process_start_time());
    EXPECT_LE(RequestPlanner::process_start_time(), std::chrono::system_clock::now());
}

TEST_F(RequestPlannerTest, EqualEndsAreAllowed) {
    Instrument aapl("AAPL", SecurityType::EQUITY, "usa");
    auto request =
        planner.plan(aapl, Resolution::MINUTE, at("20240102-00:00:00"), at("20240102-00:00:00"));
    EXPECT_TRUE(request.is_ok());
}

TEST_F(RequestPlannerTest, ReversedRangeIsConfigurationError) {
    Instrument aapl("AAPL", SecurityType::EQUITY, "usa");
    auto request = planner.plan(aapl, Resolution::MINUTE, at("20240105-00:00:00"),
                                at("20240101-00:00:00"));

    ASSERT_TRUE(request.is_error());
    EXPECT_EQ(request.error()->code(), ErrorCode::CONFIGURATION_ERROR);

    EXPECT_TRUE(
        RequestPlanner::validate_range(at("20240105-00:00:00"), at("20240101-00:00:00")).is_error());
}
