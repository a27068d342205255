// include/data_ngin/data/http_client.hpp
#pragma once

#include <string>
#include <vector>
#include "data_ngin/core/error.hpp"

namespace data_ngin {

/**
 * @brief Status and body of a completed HTTP exchange
 */
struct HttpResponse {
    long status_code{0};
    std::string body;
};

/**
 * @brief Minimal HTTP GET transport
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Perform a GET request
     * @param url Absolute URL
     * @param headers Extra header lines, e.g. "Authorization: Bearer ..."
     * @return Any completed exchange, whatever its status code.
     * PROVIDER_UNAVAILABLE when no response was received.
     */
    virtual Result<HttpResponse> get(const std::string& url,
                                     const std::vector<std::string>& headers) = 0;
};

/**
 * @brief libcurl-backed HTTP client
 *
 * Each request uses its own easy handle, so one instance may be shared by
 * several worker threads.
 */
class CurlHttpClient : public HttpClient {
public:
    /**
     * @param timeout_seconds Total transfer timeout per request
     */
    explicit CurlHttpClient(long timeout_seconds = 60);

    Result<HttpResponse> get(const std::string& url,
                             const std::vector<std::string>& headers) override;

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* user_data);

    long timeout_seconds_;
};

}  // namespace data_ngin
