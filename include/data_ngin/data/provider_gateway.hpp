// include/data_ngin/data/provider_gateway.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "data_ngin/core/error.hpp"
#include "data_ngin/data/observation.hpp"
#include "data_ngin/download/request_planner.hpp"

namespace data_ngin {

/**
 * @brief Absent (nullopt) or the observations a provider returned
 */
using FetchResult = std::optional<std::vector<Observation>>;

/**
 * @brief Abstract interface to a historical data provider
 */
class ProviderGateway {
public:
    virtual ~ProviderGateway() = default;

    /**
     * @brief Execute one fetch request
     *
     * @return nullopt when the provider has no data for the request (not an
     * error). PROVIDER_UNAVAILABLE when the provider could not be asked.
     * INVALID_ARGUMENT when the provider refuses this particular request.
     */
    virtual Result<FetchResult> fetch(const FetchRequest& request) = 0;

    /**
     * @brief Short provider name used in logs and reports
     */
    virtual std::string name() const = 0;
};

}  // namespace data_ngin
