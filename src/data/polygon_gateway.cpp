// src/data/polygon_gateway.cpp

#include "data_ngin/data/polygon_gateway.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iterator>
#include <optional>
#include <sstream>
#include "data_ngin/core/logger.hpp"
#include "data_ngin/core/retry.hpp"
#include "data_ngin/core/time_utils.hpp"

namespace data_ngin {

namespace {

struct Span {
    const char* timespan;
    std::chrono::seconds period;
};

std::optional<Span> span_for(Resolution resolution) {
    switch (resolution) {
        case Resolution::SECOND:
            return Span{"second", std::chrono::seconds(1)};
        case Resolution::MINUTE:
            return Span{"minute", std::chrono::seconds(60)};
        case Resolution::HOUR:
            return Span{"hour", std::chrono::seconds(3600)};
        case Resolution::DAILY:
            return Span{"day", std::chrono::seconds(86400)};
        default:
            return std::nullopt;
    }
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string body_excerpt(const std::string& body) {
    return body.size() > 200 ? body.substr(0, 200) + "..." : body;
}

}  // namespace

nlohmann::json PolygonConfig::to_json() const {
    nlohmann::json j;
    j["api_key"] = api_key;
    j["base_url"] = base_url;
    j["max_retries"] = max_retries;
    j["page_limit"] = page_limit;
    j["adjusted"] = adjusted;
    j["timeout_seconds"] = timeout_seconds;
    return j;
}

void PolygonConfig::from_json(const nlohmann::json& j) {
    if (j.contains("api_key"))
        api_key = j.at("api_key").get<std::string>();
    if (j.contains("base_url"))
        base_url = j.at("base_url").get<std::string>();
    if (j.contains("max_retries"))
        max_retries = j.at("max_retries").get<int>();
    if (j.contains("page_limit"))
        page_limit = j.at("page_limit").get<int>();
    if (j.contains("adjusted"))
        adjusted = j.at("adjusted").get<bool>();
    if (j.contains("timeout_seconds"))
        timeout_seconds = j.at("timeout_seconds").get<long>();
}

PolygonGateway::PolygonGateway(PolygonConfig config, std::shared_ptr<HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
}

Result<std::string> PolygonGateway::to_provider_ticker(const Instrument& instrument) {
    const std::string ticker = upper(instrument.get_ticker());
    switch (instrument.get_security_type()) {
        case SecurityType::EQUITY:
            return Result<std::string>(ticker);
        case SecurityType::FOREX:
            return Result<std::string>("C:" + ticker);
        case SecurityType::CRYPTO:
            return Result<std::string>("X:" + ticker);
        case SecurityType::OPTION:
            return Result<std::string>("O:" + ticker);
        case SecurityType::INDEX:
            return Result<std::string>("I:" + ticker);
        default:
            return make_error<std::string>(
                ErrorCode::INVALID_ARGUMENT,
                "Security type " + to_string(instrument.get_security_type()) +
                    " is not served by the aggregates API",
                "PolygonGateway");
    }
}

Result<std::string> PolygonGateway::build_url(const FetchRequest& request) const {
    auto span = span_for(request.resolution);
    if (!span) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Resolution " + to_string(request.resolution) +
                                           " is not available from the aggregates API",
                                       "PolygonGateway");
    }

    auto ticker = to_provider_ticker(request.instrument);
    if (ticker.is_error()) {
        return forward_error<std::string>(ticker, "PolygonGateway");
    }

    std::ostringstream url;
    url << config_.base_url << "/v2/aggs/ticker/" << ticker.value() << "/range/1/"
        << span->timespan << "/" << core::to_epoch_millis(request.range_start) << "/"
        << core::to_epoch_millis(request.range_end)
        << "?adjusted=" << (config_.adjusted ? "true" : "false") << "&sort=asc"
        << "&limit=" << config_.page_limit;
    return Result<std::string>(url.str());
}

Result<AggregatePage> PolygonGateway::parse_aggregates(const std::string& body,
                                                       const FetchRequest& request) {
    auto span = span_for(request.resolution);
    if (!span) {
        return make_error<AggregatePage>(ErrorCode::INVALID_ARGUMENT,
                                         "Resolution " + to_string(request.resolution) +
                                             " has no aggregate period",
                                         "PolygonGateway");
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<AggregatePage>(ErrorCode::PROVIDER_UNAVAILABLE,
                                         "Malformed aggregates response: " + std::string(e.what()),
                                         "PolygonGateway");
    }

    const std::string status = j.value("status", "");
    if (status == "NOT_AUTHORIZED") {
        return make_error<AggregatePage>(ErrorCode::PROVIDER_UNAVAILABLE,
                                         "Not authorized: " + j.value("message", status),
                                         "PolygonGateway");
    }
    if (status == "ERROR") {
        return make_error<AggregatePage>(ErrorCode::INVALID_ARGUMENT,
                                         "Provider error: " + j.value("error", status),
                                         "PolygonGateway");
    }

    AggregatePage page;
    page.next_url = j.value("next_url", "");

    if (!j.contains("results") || !j.at("results").is_array()) {
        return Result<AggregatePage>(std::move(page));
    }

    const auto& results = j.at("results");
    page.observations.reserve(results.size());

    try {
        for (const auto& bar : results) {
            UtcTimestamp start = core::from_epoch_millis(bar.at("t").get<long long>());
            UtcTimestamp end = UtcTimestamp::specify_utc(start.time_point() + span->period);
            Ohlc prices(bar.at("o").get<double>(), bar.at("h").get<double>(),
                        bar.at("l").get<double>(), bar.at("c").get<double>());

            if (request.tick_type == TickType::QUOTE) {
                QuoteBar quote;
                quote.bid = prices;
                quote.ask = prices;
                page.observations.emplace_back(start, end, quote);
            } else {
                TradeBar trade;
                trade.price = prices;
                trade.volume = bar.value("v", 0.0);
                page.observations.emplace_back(start, end, trade);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<AggregatePage>(ErrorCode::CONVERSION_ERROR,
                                         "Unexpected aggregate layout: " + std::string(e.what()),
                                         "PolygonGateway");
    }

    return Result<AggregatePage>(std::move(page));
}

Result<HttpResponse> PolygonGateway::get_page(const std::string& url) {
    const std::vector<std::string> headers = {"Authorization: Bearer " + config_.api_key,
                                              "Accept: application/json"};

    auto attempt = [&]() -> Result<HttpResponse> {
        auto response = http_->get(url, headers);
        if (response.is_error()) {
            return response;
        }
        long status = response.value().status_code;
        if (status == 429 || status >= 500) {
            return make_error<HttpResponse>(ErrorCode::PROVIDER_UNAVAILABLE,
                                            "HTTP " + std::to_string(status) + " from provider",
                                            "PolygonGateway");
        }
        return response;
    };

    return utils::retry_with_backoff(attempt, config_.max_retries);
}

Result<FetchResult> PolygonGateway::fetch(const FetchRequest& request) {
    if (config_.api_key.empty()) {
        return make_error<FetchResult>(ErrorCode::PROVIDER_UNAVAILABLE,
                                       "No API key configured", "PolygonGateway");
    }

    auto first_url = build_url(request);
    if (first_url.is_error()) {
        return forward_error<FetchResult>(first_url, "PolygonGateway");
    }

    std::vector<Observation> observations;
    std::string url = first_url.value();
    int pages = 0;

    while (!url.empty()) {
        DEBUG("Requesting " << request.instrument << " page " << (pages + 1));

        auto response = get_page(url);
        if (response.is_error()) {
            return forward_error<FetchResult>(response, "PolygonGateway");
        }

        const HttpResponse& http = response.value();
        if (http.status_code == 404) {
            if (observations.empty()) {
                return Result<FetchResult>(std::nullopt);
            }
            break;
        }
        if (http.status_code == 401 || http.status_code == 403) {
            return make_error<FetchResult>(ErrorCode::PROVIDER_UNAVAILABLE,
                                           "Not authorized (HTTP " +
                                               std::to_string(http.status_code) + ")",
                                           "PolygonGateway");
        }
        if (http.status_code < 200 || http.status_code >= 300) {
            return make_error<FetchResult>(ErrorCode::INVALID_ARGUMENT,
                                           "HTTP " + std::to_string(http.status_code) + ": " +
                                               body_excerpt(http.body),
                                           "PolygonGateway");
        }

        auto page = parse_aggregates(http.body, request);
        if (page.is_error()) {
            return forward_error<FetchResult>(page, "PolygonGateway");
        }

        AggregatePage parsed = page.take_value();
        std::move(parsed.observations.begin(), parsed.observations.end(),
                  std::back_inserter(observations));
        url = parsed.next_url;
        pages++;
    }

    if (observations.empty()) {
        return Result<FetchResult>(std::nullopt);
    }

    INFO("Fetched " << observations.size() << " " << to_string(request.resolution) << " bars for "
                    << request.instrument << " in " << pages << " page(s)");
    return Result<FetchResult>(FetchResult(std::move(observations)));
}

}  // namespace data_ngin
