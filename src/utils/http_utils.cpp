// HttpUtils.cpp
#include "http_utils.hpp"
#include "trader/errors/trading_errors.hpp"
#include <chrono>
#include <memory>
#include <thread>
#include <curl/curl.h>

using IntradayTrader::Core::ConnectionError;

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

namespace {

struct CurlHeaderListDeleter {
    void operator()(curl_slist* header_list) const { curl_slist_free_all(header_list); }
};

struct CurlHandleDeleter {
    void operator()(CURL* curl_handle) const { curl_easy_cleanup(curl_handle); }
};

HttpResponse perform_http_request(const HttpRequest& http_request, const std::string& method,
                                  ConnectivityManager& connectivity_ref) {
    if (!connectivity_ref.allows_request()) {
        throw ConnectionError("request refused, " + connectivity_ref.describe() + ", retry in " +
                              std::to_string(connectivity_ref.get_seconds_until_retry()) + "s");
    }

    std::unique_ptr<CURL, CurlHandleDeleter> curl_handle(curl_easy_init());
    if (!curl_handle) {
        throw ConnectionError("failed to initialize CURL for HTTP " + method + " request");
    }

    curl_slist* raw_header_list = nullptr;
    for (const std::string& header_line : http_request.headers) {
        raw_header_list = curl_slist_append(raw_header_list, header_line.c_str());
    }
    if (method != "GET") {
        raw_header_list = curl_slist_append(raw_header_list, "Content-Type: application/json");
    }
    std::unique_ptr<curl_slist, CurlHeaderListDeleter> header_list(raw_header_list);

    HttpResponse http_response;
    curl_easy_setopt(curl_handle.get(), CURLOPT_URL, http_request.url.c_str());
    curl_easy_setopt(curl_handle.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEDATA, &http_response.body);
    curl_easy_setopt(curl_handle.get(), CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_USERAGENT, "intraday-trader/1.0");

    if (method == "POST") {
        curl_easy_setopt(curl_handle.get(), CURLOPT_POSTFIELDS, http_request.body.c_str());
    } else if (method == "DELETE") {
        curl_easy_setopt(curl_handle.get(), CURLOPT_CUSTOMREQUEST, "DELETE");
        if (!http_request.body.empty()) {
            curl_easy_setopt(curl_handle.get(), CURLOPT_POSTFIELDS, http_request.body.c_str());
        }
    }

    int attempt_limit = resolve_attempt_limit(method, http_request.retries);
    CURLcode curl_result = CURLE_OK;
    for (int retry_attempt = 0; retry_attempt < attempt_limit; ++retry_attempt) {
        http_response.body.clear();
        curl_result = curl_easy_perform(curl_handle.get());
        if (curl_result == CURLE_OK) {
            curl_easy_getinfo(curl_handle.get(), CURLINFO_RESPONSE_CODE, &http_response.status_code);
            connectivity_ref.record_success();
            return http_response;
        }

        std::string error_message = "HTTP " + method + " retry " + std::to_string(retry_attempt + 1) + "/" +
                                    std::to_string(attempt_limit) + " failed: " + std::string(curl_easy_strerror(curl_result));
        connectivity_ref.record_failure(error_message);

        if (retry_attempt < attempt_limit - 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(http_request.rate_limit_delay_ms));
        }
    }

    throw ConnectionError("HTTP " + method + " failed after " + std::to_string(attempt_limit) + " attempts. " +
                          "Last error: " + std::string(curl_easy_strerror(curl_result)) + " URL: " + http_request.url);
}

} // anonymous namespace

int resolve_attempt_limit(const std::string& method, int configured_retries) {
    if (method != "GET") {
        return 1;
    }
    return configured_retries > 0 ? configured_retries : 1;
}

HttpResponse http_get(const HttpRequest& http_request, ConnectivityManager& connectivity_ref) {
    return perform_http_request(http_request, "GET", connectivity_ref);
}

HttpResponse http_post(const HttpRequest& http_request, ConnectivityManager& connectivity_ref) {
    return perform_http_request(http_request, "POST", connectivity_ref);
}

HttpResponse http_delete(const HttpRequest& http_request, ConnectivityManager& connectivity_ref) {
    return perform_http_request(http_request, "DELETE", connectivity_ref);
}

std::string replace_url_placeholder(const std::string& url_template, const std::string& symbol) {
    const std::string placeholder = "{symbol}";
    std::string resolved_url = url_template;
    size_t placeholder_position = resolved_url.find(placeholder);
    if (placeholder_position != std::string::npos) {
        resolved_url.replace(placeholder_position, placeholder.size(), symbol);
    }
    return resolved_url;
}
