// include/data_ngin/instruments/instrument_resolver.hpp
#pragma once

#include <string>
#include "data_ngin/core/error.hpp"
#include "data_ngin/core/types.hpp"
#include "data_ngin/instruments/instrument.hpp"

namespace data_ngin {

/**
 * @brief Turns raw ticker strings into canonical instruments
 *
 * Pure and deterministic. Global tokens (security type, market) are
 * normalized once per batch; resolve() then only combines them with the
 * ticker.
 */
class InstrumentResolver {
public:
    /**
     * @brief Parse the batch-wide security type token
     * @param token Case-insensitive enum token, empty means Equity
     * @return CONFIGURATION_ERROR when the token is not a known security type
     */
    static Result<SecurityType> parse_security_type(const std::string& token);

    /**
     * @brief Canonical market: lower-cased, "usa" when blank
     */
    static std::string normalize_market(const std::string& market);

    /**
     * @brief Trim whitespace from both ends of a raw ticker
     */
    static std::string trim_ticker(const std::string& raw);

    /**
     * @brief Canonical ticker: trimmed and upper-cased, so "aapl" and "AAPL"
     * name the same instrument
     */
    static std::string normalize_ticker(const std::string& ticker);

    /**
     * @brief Build the instrument for one ticker
     * @param ticker Non-blank ticker, normalized here
     * @param security_type Parsed security type
     * @param market Raw market, normalized here
     */
    static Instrument resolve(const std::string& ticker, SecurityType security_type,
                              const std::string& market);
};

}  // namespace data_ngin
