#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <vector>
#include <map>

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string url;
    std::string method;                  // GET, POST or DELETE
    std::vector<std::string> headers;    // "Name: value"
    std::string body;                    // for POST; leave empty for GET
    long timeout_ms;
    bool enable_ssl_verification;
    int retries;
    int retry_delay_ms;

    HttpRequest(const std::string& request_url, const std::string& request_method, long timeout_milliseconds)
        : url(request_url), method(request_method), timeout_ms(timeout_milliseconds),
          enable_ssl_verification(true), retries(1), retry_delay_ms(0) {}
};

struct HttpResponse {
    bool transport_ok = false;            // false when curl itself failed (DNS, connect, timeout)
    bool timed_out = false;
    long status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;   // lower-cased names
    std::string error_message;
};

// Process-wide libcurl initialisation; construct once in main before any thread starts.
class CurlGlobalGuard {
public:
    CurlGlobalGuard();
    ~CurlGlobalGuard();
    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string);

HttpResponse http_perform(const HttpRequest& http_request);

HttpResponse http_get(const std::string& url, const std::vector<std::string>& headers, long timeout_ms, bool enable_ssl_verification);

HttpResponse http_post(const std::string& url, const std::string& body, long timeout_ms);

HttpResponse http_delete(const std::string& url, long timeout_ms);

std::string join_url(const std::string& base_url, const std::string& path);

#endif // HTTP_UTILS_HPP
