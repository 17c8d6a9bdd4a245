// HttpUtils.cpp
#include "http_utils.hpp"
#include "core/logging/logging_macros.hpp"
#include <algorithm>
#include <chrono>
#include <thread>
#include <stdexcept>
#include <curl/curl.h>

namespace {
    size_t header_callback(char* buffer, size_t size, size_t nitems, std::map<std::string, std::string>* header_map) {
        size_t total = size * nitems;
        std::string line(buffer, total);
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            std::string name = line.substr(0, colon);
            std::string value = line.substr(colon + 1);
            std::transform(name.begin(), name.end(), name.begin(), ::tolower);
            auto first = value.find_first_not_of(" \t");
            auto last = value.find_last_not_of(" \t\r\n");
            value = (first == std::string::npos) ? "" : value.substr(first, last - first + 1);
            (*header_map)[name] = value;
        }
        return total;
    }
}

CurlGlobalGuard::CurlGlobalGuard() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

CurlGlobalGuard::~CurlGlobalGuard() {
    curl_global_cleanup();
}

// Implement write_callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpResponse http_perform(const HttpRequest& http_request) {
    HttpResponse response;

    CURL* curl_handle = curl_easy_init();
    if (!curl_handle) {
        response.error_message = "Failed to initialize CURL for HTTP " + http_request.method + " request";
        LOG_ERROR(response.error_message);
        return response;
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header_line : http_request.headers) {
        headers = curl_slist_append(headers, header_line.c_str());
    }

    curl_easy_setopt(curl_handle, CURLOPT_URL, http_request.url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_handle, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl_handle, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT_MS, http_request.timeout_ms > 0 ? http_request.timeout_ms : 1L);
    curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
    curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);

    if (http_request.method == "POST") {
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, http_request.body.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(http_request.body.size()));
    } else if (http_request.method == "DELETE") {
        curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    CURLcode curl_result = CURLE_OK;
    int attempts = http_request.retries > 0 ? http_request.retries : 1;
    for (int retry_attempt = 0; retry_attempt < attempts; ++retry_attempt) {
        response.body.clear();
        response.headers.clear();
        curl_result = curl_easy_perform(curl_handle);
        if (curl_result == CURLE_OK) {
            curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &response.status_code);
            response.transport_ok = true;
            break;
        }

        response.timed_out = (curl_result == CURLE_OPERATION_TIMEDOUT);
        response.error_message = "HTTP " + http_request.method + " " + http_request.url + " failed: " + std::string(curl_easy_strerror(curl_result));
        if (retry_attempt < attempts - 1) {
            LOG_DEBUG(response.error_message + " (retry " + std::to_string(retry_attempt + 1) + "/" + std::to_string(attempts) + ")");
            std::this_thread::sleep_for(std::chrono::milliseconds(http_request.retry_delay_ms));
        }
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl_handle);
    return response;
}

HttpResponse http_get(const std::string& url, const std::vector<std::string>& headers, long timeout_ms, bool enable_ssl_verification) {
    HttpRequest request(url, "GET", timeout_ms);
    request.headers = headers;
    request.enable_ssl_verification = enable_ssl_verification;
    return http_perform(request);
}

HttpResponse http_post(const std::string& url, const std::string& body, long timeout_ms) {
    HttpRequest request(url, "POST", timeout_ms);
    request.headers.push_back("Content-Type: application/json");
    request.body = body;
    return http_perform(request);
}

HttpResponse http_delete(const std::string& url, long timeout_ms) {
    HttpRequest request(url, "DELETE", timeout_ms);
    return http_perform(request);
}

std::string join_url(const std::string& base_url, const std::string& path) {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (path.empty()) {
        return base;
    }
    return path.front() == '/' ? base + path : base + "/" + path;
}
