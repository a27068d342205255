// include/data_ngin/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include "data_ngin/core/error.hpp"
#include "data_ngin/core/types.hpp"

namespace data_ngin {
namespace core {

/**
 * @brief Exact timestamp format accepted on the command line, e.g. "20240101-09:30:00"
 */
inline constexpr const char* kDateTimeExactFormat = "%Y%m%d-%H:%M:%S";

/**
 * @brief Thread-safe wrapper for localtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Inverse of safe_gmtime: broken-down fields read as UTC
 */
inline std::time_t safe_timegm(std::tm* time_info) {
#ifdef _WIN32
    return _mkgmtime(time_info);
#else
    return timegm(time_info);
#endif
}

/**
 * @brief Get current time as a string with specified format
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Parse a timestamp that must match the format exactly
 *
 * The fields are taken at face value; the returned Timestamp is naive and
 * gets its UTC designation from UtcTimestamp::specify_utc.
 *
 * @param text Input text, e.g. "20240101-00:00:00"
 * @param format strptime-style format, defaults to kDateTimeExactFormat
 */
inline Result<Timestamp> parse_exact(const std::string& text,
                                     const char* format = kDateTimeExactFormat) {
    std::tm time_info = {};
    std::istringstream ss(text);
    ss >> std::get_time(&time_info, format);
    if (ss.fail()) {
        return make_error<Timestamp>(ErrorCode::CONFIGURATION_ERROR,
                                     "Timestamp '" + text + "' does not match the expected format",
                                     "TimeUtils");
    }
    // Trailing characters mean the text was not an exact match
    ss >> std::ws;
    if (!ss.eof()) {
        return make_error<Timestamp>(ErrorCode::CONFIGURATION_ERROR,
                                     "Unexpected trailing characters in timestamp '" + text + "'",
                                     "TimeUtils");
    }
    time_info.tm_isdst = 0;
    std::tm parsed = time_info;
    std::time_t seconds = safe_timegm(&time_info);

    // timegm normalizes out-of-range fields, e.g. Feb 31 becomes Mar 2
    std::tm check = {};
    if (safe_gmtime(&seconds, &check) == nullptr || check.tm_year != parsed.tm_year ||
        check.tm_mon != parsed.tm_mon || check.tm_mday != parsed.tm_mday ||
        check.tm_hour != parsed.tm_hour || check.tm_min != parsed.tm_min ||
        check.tm_sec != parsed.tm_sec) {
        return make_error<Timestamp>(ErrorCode::CONFIGURATION_ERROR,
                                     "Timestamp '" + text + "' is not a valid calendar time",
                                     "TimeUtils");
    }
    return Result<Timestamp>(std::chrono::system_clock::from_time_t(seconds));
}

/**
 * @brief Format a UTC timestamp with strftime semantics
 */
inline std::string format_utc(const UtcTimestamp& ts, const char* format) {
    auto time_c = std::chrono::system_clock::to_time_t(ts.time_point());
    std::tm time_info;
    safe_gmtime(&time_c, &time_info);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), format, &time_info);
    return std::string(buffer);
}

/**
 * @brief Start of the UTC day containing ts
 */
inline UtcTimestamp utc_day_start(const UtcTimestamp& ts) {
    using namespace std::chrono;
    auto since_epoch = duration_cast<milliseconds>(ts.time_point().time_since_epoch());
    auto day = milliseconds(86400000);
    auto floored = since_epoch - ((since_epoch % day + day) % day);
    return UtcTimestamp::specify_utc(Timestamp(duration_cast<system_clock::duration>(floored)));
}

/**
 * @brief Milliseconds elapsed since the start of the UTC day
 */
inline long long millis_since_midnight(const UtcTimestamp& ts) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(ts.time_point() - utc_day_start(ts).time_point()).count();
}

/**
 * @brief UTC timestamp from epoch milliseconds, the unit most REST providers use
 */
inline UtcTimestamp from_epoch_millis(long long millis) {
    using namespace std::chrono;
    return UtcTimestamp::specify_utc(
        Timestamp(duration_cast<system_clock::duration>(milliseconds(millis))));
}

inline long long to_epoch_millis(const UtcTimestamp& ts) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(ts.time_point().time_since_epoch()).count();
}

}  // namespace core
}  // namespace data_ngin
