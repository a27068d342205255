// include/data_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace data_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Naive value: carries no statement about its time zone
 */
using Timestamp = std::chrono::system_clock::time_point;

using Price = double;
using Quantity = double;

/**
 * @brief Timestamp explicitly designated as UTC
 *
 * The only way to obtain one from a naive Timestamp is specify_utc(), which
 * attaches the designation without any timezone arithmetic.
 */
class UtcTimestamp {
public:
    UtcTimestamp() = default;

    static UtcTimestamp specify_utc(const Timestamp& naive) {
        return UtcTimestamp(naive);
    }

    static UtcTimestamp now() {
        return UtcTimestamp(std::chrono::system_clock::now());
    }

    const Timestamp& time_point() const {
        return tp_;
    }

    bool operator==(const UtcTimestamp& other) const {
        return tp_ == other.tp_;
    }
    bool operator!=(const UtcTimestamp& other) const {
        return tp_ != other.tp_;
    }
    bool operator<(const UtcTimestamp& other) const {
        return tp_ < other.tp_;
    }
    bool operator<=(const UtcTimestamp& other) const {
        return tp_ <= other.tp_;
    }
    bool operator>(const UtcTimestamp& other) const {
        return tp_ > other.tp_;
    }
    bool operator>=(const UtcTimestamp& other) const {
        return tp_ >= other.tp_;
    }

private:
    explicit UtcTimestamp(const Timestamp& tp) : tp_(tp) {}

    Timestamp tp_{};
};

/**
 * @brief Security type enumeration
 */
enum class SecurityType {
    BASE,
    EQUITY,
    OPTION,
    COMMODITY,
    FOREX,
    FUTURE,
    CFD,
    CRYPTO,
    FUTURE_OPTION,
    INDEX,
    INDEX_OPTION,
    CRYPTO_FUTURE
};

/**
 * @brief Data resolution enumeration
 */
enum class Resolution {
    TICK,
    SECOND,
    MINUTE,
    HOUR,
    DAILY
};

/**
 * @brief Kind of market data requested from a provider
 */
enum class TickType {
    TRADE,
    QUOTE
};

/**
 * @brief Canonical token, e.g. "Equity", "FutureOption"
 */
std::string to_string(SecurityType type);
std::string to_string(Resolution resolution);
std::string to_string(TickType tick_type);

/**
 * @brief Case-insensitive parse of an enum token
 * @return The enum value, or nullopt when the token is not recognized
 */
std::optional<SecurityType> security_type_from_string(const std::string& token);
std::optional<Resolution> resolution_from_string(const std::string& token);
std::optional<TickType> tick_type_from_string(const std::string& token);

/**
 * @brief Intraday resolutions are partitioned per day in the store
 */
inline bool is_intraday(Resolution resolution) {
    return resolution == Resolution::TICK || resolution == Resolution::SECOND ||
           resolution == Resolution::MINUTE;
}

namespace market {
// Default home market for resolved instruments
inline const std::string USA = "usa";
}  // namespace market

}  // namespace data_ngin
