// src/instruments/instrument_resolver.cpp

#include "data_ngin/instruments/instrument_resolver.hpp"
#include <algorithm>
#include <cctype>

namespace data_ngin {

namespace {
bool is_space(unsigned char c) {
    return std::isspace(c) != 0;
}
}  // namespace

Result<SecurityType> InstrumentResolver::parse_security_type(const std::string& token) {
    std::string trimmed = trim_ticker(token);
    if (trimmed.empty()) {
        return Result<SecurityType>(SecurityType::EQUITY);
    }

    auto parsed = security_type_from_string(trimmed);
    if (!parsed) {
        return make_error<SecurityType>(ErrorCode::CONFIGURATION_ERROR,
                                        "Unsupported security-type '" + token + "'",
                                        "InstrumentResolver");
    }
    return Result<SecurityType>(*parsed);
}

std::string InstrumentResolver::normalize_market(const std::string& market) {
    std::string trimmed = trim_ticker(market);
    if (trimmed.empty()) {
        return market::USA;
    }
    std::transform(trimmed.begin(), trimmed.end(), trimmed.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return trimmed;
}

std::string InstrumentResolver::trim_ticker(const std::string& raw) {
    auto first = std::find_if_not(raw.begin(), raw.end(), is_space);
    auto last = std::find_if_not(raw.rbegin(), raw.rend(), is_space).base();
    if (first >= last) {
        return std::string();
    }
    return std::string(first, last);
}

std::string InstrumentResolver::normalize_ticker(const std::string& ticker) {
    std::string canonical = trim_ticker(ticker);
    std::transform(canonical.begin(), canonical.end(), canonical.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return canonical;
}

Instrument InstrumentResolver::resolve(const std::string& ticker, SecurityType security_type,
                                       const std::string& market) {
    return Instrument(normalize_ticker(ticker), security_type, normalize_market(market));
}

}  // namespace data_ngin
