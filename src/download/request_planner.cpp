// src/download/request_planner.cpp

#include "data_ngin/download/request_planner.hpp"
#include "data_ngin/instruments/instrument_resolver.hpp"

namespace data_ngin {

const TickTypeTable& TickTypeTable::standard() {
    static const TickTypeTable table = [] {
        TickTypeTable t(TickType::TRADE);
        t.set(SecurityType::FOREX, ResolutionClass::TICK, TickType::QUOTE)
            .set(SecurityType::FOREX, ResolutionClass::BAR, TickType::QUOTE)
            .set(SecurityType::CFD, ResolutionClass::TICK, TickType::QUOTE)
            .set(SecurityType::CFD, ResolutionClass::BAR, TickType::QUOTE)
            .set(SecurityType::CRYPTO, ResolutionClass::TICK, TickType::QUOTE)
            .set(SecurityType::CRYPTO, ResolutionClass::BAR, TickType::QUOTE)
            // Options trade at every resolution; the tick row matches the bar row
            .set(SecurityType::OPTION, ResolutionClass::TICK, TickType::TRADE)
            .set(SecurityType::OPTION, ResolutionClass::BAR, TickType::TRADE);
        return t;
    }();
    return table;
}

std::optional<TickType> TickTypeTable::find(SecurityType security_type,
                                            ResolutionClass resolution_class) const {
    auto it = entries_.find({security_type, resolution_class});
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

TickType TickTypeTable::lookup(SecurityType security_type, Resolution resolution) const {
    return find(security_type, resolution_class(resolution)).value_or(fallback_);
}

Result<Resolution> RequestPlanner::parse_resolution(const std::string& token) {
    std::string trimmed = InstrumentResolver::trim_ticker(token);
    if (trimmed.empty()) {
        return Result<Resolution>(Resolution::MINUTE);
    }

    auto parsed = resolution_from_string(trimmed);
    if (!parsed) {
        return make_error<Resolution>(ErrorCode::UNSUPPORTED_COMBINATION,
                                      "Unsupported resolution '" + token + "'", "RequestPlanner");
    }
    return Result<Resolution>(*parsed);
}

Result<void> RequestPlanner::validate_range(const Timestamp& range_start,
                                            const Timestamp& range_end) {
    if (range_start > range_end) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Range start is later than range end", "RequestPlanner");
    }
    return Result<void>();
}

const Timestamp& RequestPlanner::process_start_time() {
    static const Timestamp start = std::chrono::system_clock::now();
    return start;
}

Result<FetchRequest> RequestPlanner::plan(const Instrument& instrument, Resolution resolution,
                                          const Timestamp& range_start,
                                          const std::optional<Timestamp>& range_end) const {
    const Timestamp end = range_end.value_or(process_start_time());

    auto range_check = validate_range(range_start, end);
    if (range_check.is_error()) {
        return forward_error<FetchRequest>(range_check, "RequestPlanner");
    }

    FetchRequest request;
    request.instrument = instrument;
    request.resolution = resolution;
    request.tick_type = infer_tick_type(instrument.get_security_type(), resolution);
    request.range_start = UtcTimestamp::specify_utc(range_start);
    request.range_end = UtcTimestamp::specify_utc(end);
    return Result<FetchRequest>(std::move(request));
}

}  // namespace data_ngin
