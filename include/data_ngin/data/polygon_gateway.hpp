// include/data_ngin/data/polygon_gateway.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "data_ngin/core/config_base.hpp"
#include "data_ngin/core/error.hpp"
#include "data_ngin/data/http_client.hpp"
#include "data_ngin/data/provider_gateway.hpp"

namespace data_ngin {

/**
 * @brief Connection settings for the Polygon REST API
 */
struct PolygonConfig : public ConfigBase {
    std::string api_key;
    std::string base_url{"https://api.polygon.io"};
    int max_retries{3};
    int page_limit{50000};
    bool adjusted{true};
    long timeout_seconds{60};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief One page of an aggregates response
 */
struct AggregatePage {
    std::vector<Observation> observations;
    std::string next_url;  // empty on the last page
};

/**
 * @brief Provider gateway backed by the Polygon aggregates endpoint
 *
 * Bars are requested as /v2/aggs/ticker/{T}/range/1/{span}/{from}/{to} and
 * paginated through next_url. Transport failures, throttling and server
 * errors are retried with exponential backoff.
 */
class PolygonGateway : public ProviderGateway {
public:
    PolygonGateway(PolygonConfig config, std::shared_ptr<HttpClient> http);

    Result<FetchResult> fetch(const FetchRequest& request) override;

    std::string name() const override {
        return "polygon";
    }

    /**
     * @brief Polygon ticker for an instrument, e.g. "C:EURUSD" for forex
     * @return INVALID_ARGUMENT for security types the API does not serve
     */
    static Result<std::string> to_provider_ticker(const Instrument& instrument);

    /**
     * @brief First page URL for a request
     * @return INVALID_ARGUMENT for tick resolution or unsupported security types
     */
    Result<std::string> build_url(const FetchRequest& request) const;

    /**
     * @brief Parse an aggregates response body
     *
     * Trade requests yield trade bars; quote requests yield quote bars with
     * both sides set from the aggregate prices.
     */
    static Result<AggregatePage> parse_aggregates(const std::string& body,
                                                  const FetchRequest& request);

private:
    Result<HttpResponse> get_page(const std::string& url);

    PolygonConfig config_;
    std::shared_ptr<HttpClient> http_;
};

}  // namespace data_ngin
