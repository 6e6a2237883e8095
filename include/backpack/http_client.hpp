#pragma once

#include <curl/curl.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace backpack {

struct HttpResponse {
    long status_code = 0;
    std::string body;
    double total_ms = 0.0;
};

// status_code() is 0 when the request never produced an HTTP status
// (timeout, refused connection, DNS failure).
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message, long status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    [[nodiscard]] long status_code() const noexcept { return status_code_; }
    [[nodiscard]] bool is_rate_limit() const noexcept { return status_code_ == 429; }
    [[nodiscard]] bool is_transport() const noexcept { return status_code_ == 0; }

private:
    long status_code_;
};

struct HttpTimeouts {
    long connect_ms = 3000;
    long total_ms = 10000;
};

class HttpClient {
public:
    explicit HttpClient(HttpTimeouts timeouts = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept = delete;
    HttpClient& operator=(HttpClient&&) noexcept = delete;

    HttpResponse request(
        const std::string& method,
        const std::string& url,
        const std::vector<std::pair<std::string, std::string>>& headers = {},
        const std::string& body = ""
    ) const;

private:
    HttpTimeouts timeouts_;
    bool global_initialized_;
};

} // namespace backpack
