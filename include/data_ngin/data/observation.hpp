// include/data_ngin/data/observation.hpp
#pragma once

#include <utility>
#include <variant>
#include "data_ngin/core/types.hpp"

namespace data_ngin {

/**
 * @brief Open/high/low/close of one side of the book or of trades
 */
struct Ohlc {
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};

    Ohlc() = default;
    Ohlc(Price o, Price h, Price l, Price c) : open(o), high(h), low(l), close(c) {}
};

/**
 * @brief Trade bar payload
 */
struct TradeBar {
    Ohlc price;
    Quantity volume{0.0};
};

/**
 * @brief Quote bar payload, bid and ask sides
 */
struct QuoteBar {
    Ohlc bid;
    Ohlc ask;
    Quantity last_bid_size{0.0};
    Quantity last_ask_size{0.0};
};

/**
 * @brief Single trade or quote tick
 * Trade ticks fill value/quantity, quote ticks fill the bid/ask fields.
 */
struct Tick {
    Price value{0.0};
    Quantity quantity{0.0};
    Price bid_price{0.0};
    Price ask_price{0.0};
    Quantity bid_size{0.0};
    Quantity ask_size{0.0};
};

using ObservationPayload = std::variant<TradeBar, QuoteBar, Tick>;

/**
 * @brief One raw market data point as produced by a provider
 *
 * time is the start of the period, end_time its end (equal for ticks).
 * Ordering in the store is by end_time.
 */
struct Observation {
    UtcTimestamp time;
    UtcTimestamp end_time;
    ObservationPayload payload;

    Observation() = default;
    Observation(UtcTimestamp start, UtcTimestamp end, ObservationPayload data)
        : time(start), end_time(end), payload(std::move(data)) {}

    bool is_trade_bar() const {
        return std::holds_alternative<TradeBar>(payload);
    }
    bool is_quote_bar() const {
        return std::holds_alternative<QuoteBar>(payload);
    }
    bool is_tick() const {
        return std::holds_alternative<Tick>(payload);
    }
};

}  // namespace data_ngin
