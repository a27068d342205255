// include/data_ngin/instruments/instrument.hpp
#pragma once

#include <ostream>
#include <string>
#include <utility>
#include "data_ngin/core/types.hpp"

namespace data_ngin {

/**
 * @brief Canonical identity of a downloadable instrument
 *
 * Immutable value type; two instruments are the same when ticker, security
 * type and market all match.
 */
class Instrument {
public:
    Instrument() = default;
    Instrument(std::string ticker, SecurityType security_type, std::string market)
        : ticker_(std::move(ticker)), security_type_(security_type), market_(std::move(market)) {}

    const std::string& get_ticker() const {
        return ticker_;
    }

    SecurityType get_security_type() const {
        return security_type_;
    }

    const std::string& get_market() const {
        return market_;
    }

    /**
     * @brief Display form, e.g. "AAPL (Equity, usa)"
     */
    std::string to_string() const {
        return ticker_ + " (" + data_ngin::to_string(security_type_) + ", " + market_ + ")";
    }

    bool operator==(const Instrument& other) const {
        return ticker_ == other.ticker_ && security_type_ == other.security_type_ &&
               market_ == other.market_;
    }

    bool operator!=(const Instrument& other) const {
        return !(*this == other);
    }

private:
    std::string ticker_;
    SecurityType security_type_{SecurityType::EQUITY};
    std::string market_{market::USA};
};

inline std::ostream& operator<<(std::ostream& os, const Instrument& instrument) {
    return os << instrument.to_string();
}

}  // namespace data_ngin
