// src/data/http_client.cpp

#include "data_ngin/data/http_client.hpp"
#include <curl/curl.h>
#include <cstdlib>
#include <memory>
#include <mutex>

namespace data_ngin {

namespace {

// curl_global_init is not thread-safe and must run once per process
void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        std::atexit([] { curl_global_cleanup(); });
    });
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const {
        curl_easy_cleanup(handle);
    }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

}  // namespace

CurlHttpClient::CurlHttpClient(long timeout_seconds) : timeout_seconds_(timeout_seconds) {
    ensure_curl_initialized();
}

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb,
                                      std::string* user_data) {
    user_data->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

Result<HttpResponse> CurlHttpClient::get(const std::string& url,
                                         const std::vector<std::string>& headers) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        return make_error<HttpResponse>(ErrorCode::PROVIDER_UNAVAILABLE,
                                        "Failed to initialize CURL", "CurlHttpClient");
    }

    std::unique_ptr<curl_slist, CurlListDeleter> header_list;
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
        if (!appended) {
            return make_error<HttpResponse>(ErrorCode::PROVIDER_UNAVAILABLE,
                                            "Failed to build request headers", "CurlHttpClient");
        }
        header_list.release();
        header_list.reset(appended);
    }

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, CurlHttpClient::write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return make_error<HttpResponse>(ErrorCode::PROVIDER_UNAVAILABLE,
                                        "CURL error: " + std::string(curl_easy_strerror(res)),
                                        "CurlHttpClient");
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    return Result<HttpResponse>(std::move(response));
}

}  // namespace data_ngin
