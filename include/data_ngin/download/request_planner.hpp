// include/data_ngin/download/request_planner.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include "data_ngin/core/error.hpp"
#include "data_ngin/core/types.hpp"
#include "data_ngin/instruments/instrument.hpp"

namespace data_ngin {

/**
 * @brief Concrete fetch parameters for one instrument
 * Invariant: range_start <= range_end, both designated UTC.
 */
struct FetchRequest {
    Instrument instrument;
    Resolution resolution{Resolution::MINUTE};
    TickType tick_type{TickType::TRADE};
    UtcTimestamp range_start;
    UtcTimestamp range_end;
};

/**
 * @brief Granularity class used as the second key of the tick type table
 */
enum class ResolutionClass {
    TICK,  // Resolution::TICK
    BAR    // every aggregated resolution
};

inline ResolutionClass resolution_class(Resolution resolution) {
    return resolution == Resolution::TICK ? ResolutionClass::TICK : ResolutionClass::BAR;
}

/**
 * @brief Provider tick type mapping keyed by (security type, resolution class)
 *
 * Security types without an entry use the fallback (Trade).
 */
class TickTypeTable {
public:
    /**
     * @brief The provider mapping: Forex/Cfd/Crypto quote, everything else trades
     */
    static const TickTypeTable& standard();

    explicit TickTypeTable(TickType fallback = TickType::TRADE) : fallback_(fallback) {}

    TickTypeTable& set(SecurityType security_type, ResolutionClass resolution_class,
                       TickType tick_type) {
        entries_[{security_type, resolution_class}] = tick_type;
        return *this;
    }

    TickType lookup(SecurityType security_type, Resolution resolution) const;

    /**
     * @brief Explicit entry, nullopt when the fallback applies
     */
    std::optional<TickType> find(SecurityType security_type,
                                 ResolutionClass resolution_class) const;

    TickType fallback() const {
        return fallback_;
    }

private:
    std::map<std::pair<SecurityType, ResolutionClass>, TickType> entries_;
    TickType fallback_;
};

/**
 * @brief Derives fetch requests from run parameters and a resolved instrument
 */
class RequestPlanner {
public:
    explicit RequestPlanner(TickTypeTable table = TickTypeTable::standard())
        : table_(std::move(table)) {}

    /**
     * @brief Parse the batch-wide resolution token
     * @param token Case-insensitive enum token, empty means Minute
     * @return UNSUPPORTED_COMBINATION when the token is not a known resolution
     */
    static Result<Resolution> parse_resolution(const std::string& token);

    /**
     * @brief Check the date range once for the whole batch
     * @return CONFIGURATION_ERROR when range_start is later than range_end
     */
    static Result<void> validate_range(const Timestamp& range_start, const Timestamp& range_end);

    /**
     * @brief Build the request for one instrument
     *
     * Both ends get the UTC designation attached without any conversion.
     * range_end defaults to the process start time when not supplied.
     */
    Result<FetchRequest> plan(const Instrument& instrument, Resolution resolution,
                              const Timestamp& range_start,
                              const std::optional<Timestamp>& range_end = std::nullopt) const;

    TickType infer_tick_type(SecurityType security_type, Resolution resolution) const {
        return table_.lookup(security_type, resolution);
    }

    /**
     * @brief Process start time, captured once
     */
    static const Timestamp& process_start_time();

private:
    TickTypeTable table_;
};

}  // namespace data_ngin
