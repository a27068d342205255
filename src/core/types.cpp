// src/core/types.cpp

#include "data_ngin/core/types.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace data_ngin {

namespace {

const std::array<std::pair<SecurityType, const char*>, 12> kSecurityTypeTokens = {{
    {SecurityType::BASE, "Base"},
    {SecurityType::EQUITY, "Equity"},
    {SecurityType::OPTION, "Option"},
    {SecurityType::COMMODITY, "Commodity"},
    {SecurityType::FOREX, "Forex"},
    {SecurityType::FUTURE, "Future"},
    {SecurityType::CFD, "Cfd"},
    {SecurityType::CRYPTO, "Crypto"},
    {SecurityType::FUTURE_OPTION, "FutureOption"},
    {SecurityType::INDEX, "Index"},
    {SecurityType::INDEX_OPTION, "IndexOption"},
    {SecurityType::CRYPTO_FUTURE, "CryptoFuture"},
}};

const std::array<std::pair<Resolution, const char*>, 5> kResolutionTokens = {{
    {Resolution::TICK, "Tick"},
    {Resolution::SECOND, "Second"},
    {Resolution::MINUTE, "Minute"},
    {Resolution::HOUR, "Hour"},
    {Resolution::DAILY, "Daily"},
}};

const std::array<std::pair<TickType, const char*>, 2> kTickTypeTokens = {{
    {TickType::TRADE, "Trade"},
    {TickType::QUOTE, "Quote"},
}};

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <typename E, size_t N>
std::string token_of(const std::array<std::pair<E, const char*>, N>& table, E value) {
    for (const auto& entry : table) {
        if (entry.first == value) {
            return entry.second;
        }
    }
    return "Unknown";
}

template <typename E, size_t N>
std::optional<E> parse_token(const std::array<std::pair<E, const char*>, N>& table,
                             const std::string& token) {
    const std::string wanted = lower(token);
    for (const auto& entry : table) {
        if (lower(entry.second) == wanted) {
            return entry.first;
        }
    }
    return std::nullopt;
}

}  // namespace

std::string to_string(SecurityType type) {
    return token_of(kSecurityTypeTokens, type);
}

std::string to_string(Resolution resolution) {
    return token_of(kResolutionTokens, resolution);
}

std::string to_string(TickType tick_type) {
    return token_of(kTickTypeTokens, tick_type);
}

std::optional<SecurityType> security_type_from_string(const std::string& token) {
    return parse_token(kSecurityTypeTokens, token);
}

std::optional<Resolution> resolution_from_string(const std::string& token) {
    return parse_token(kResolutionTokens, token);
}

std::optional<TickType> tick_type_from_string(const std::string& token) {
    return parse_token(kTickTypeTokens, token);
}

}  // namespace data_ngin
