// include/data_ngin/core/retry.hpp
#pragma once

#include <chrono>
#include <random>
#include <string>
#include <thread>
#include "data_ngin/core/error.hpp"
#include "data_ngin/core/logger.hpp"

namespace data_ngin {
namespace utils {

/**
 * @brief Retry a Result-returning call with exponential backoff
 *
 * Only errors carrying retry_on are retried; any other outcome is returned
 * at once. The final attempt's result is returned as is.
 *
 * @param func Callable returning Result<T>
 * @param max_retries Retries after the first attempt
 * @param retry_on Error code considered transient
 * @param initial_delay Delay before the first retry, doubled each time
 */
template <typename Func>
auto retry_with_backoff(Func func, int max_retries = 3,
                        ErrorCode retry_on = ErrorCode::PROVIDER_UNAVAILABLE,
                        std::chrono::milliseconds initial_delay = std::chrono::milliseconds(100))
    -> decltype(func()) {
    thread_local std::mt19937 jitter_gen{std::random_device{}()};
    std::uniform_int_distribution<int> jitter(0, 99);

    std::chrono::milliseconds delay = initial_delay;

    for (int attempt = 0; attempt < max_retries; ++attempt) {
        auto result = func();

        if (!result.is_error() || result.error()->code() != retry_on) {
            return result;
        }

        WARN("Transient failure, retrying (attempt " << (attempt + 1) << " of " << max_retries
                                                     << "): " << result.error()->what());

        std::this_thread::sleep_for(delay);
        delay = delay * 2 + std::chrono::milliseconds(jitter(jitter_gen));
    }

    return func();
}

}  // namespace utils
}  // namespace data_ngin
