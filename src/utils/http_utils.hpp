#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <vector>
#include "utils/connectivity_manager.hpp"

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;   // "Name: value" lines
    int retries;
    int timeout_seconds;
    bool enable_ssl_verification;
    int rate_limit_delay_ms;
    std::string body; // for POST/DELETE; leave empty for GET

    HttpRequest(const std::string& request_url,
                std::vector<std::string> request_headers = {},
                int retry_count = 3,
                int timeout = 30,
                bool ssl_verify = true,
                int rate_delay = 100,
                std::string request_body = "")
        : url(request_url), headers(std::move(request_headers)), retries(retry_count), timeout_seconds(timeout),
          enable_ssl_verification(ssl_verify), rate_limit_delay_ms(rate_delay), body(std::move(request_body)) {}
};

struct HttpResponse {
    long status_code;
    std::string body;

    HttpResponse() : status_code(0) {}

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string);

// Transport failures (after retries, or refused by the connectivity backoff) throw ConnectionError.
// HTTP error statuses are returned to the caller.
HttpResponse http_get(const HttpRequest& http_request, ConnectivityManager& connectivity_ref);
HttpResponse http_post(const HttpRequest& http_request, ConnectivityManager& connectivity_ref);
HttpResponse http_delete(const HttpRequest& http_request, ConnectivityManager& connectivity_ref);

// Only GET is repeated; a POST or DELETE that timed out may already have been applied upstream
int resolve_attempt_limit(const std::string& method, int configured_retries);

std::string replace_url_placeholder(const std::string& url_template, const std::string& symbol);

#endif // HTTP_UTILS_HPP
