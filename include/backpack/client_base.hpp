#pragma once

#include "backpack/http_client.hpp"
#include "backpack/retry_policy.hpp"
#include "backpack/util.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace backpack {

struct Credentials {
    std::string api_key;
    std::string api_secret;

    [[nodiscard]] bool empty() const noexcept { return api_key.empty() || api_secret.empty(); }
};

struct ClientOptions {
    std::string base_url = "https://api.backpack.exchange";
    long window_ms = 5000;
    HttpTimeouts timeouts{};
    RetryPolicy rate_limit_retry{5, std::chrono::milliseconds(1000), 2.0, std::chrono::milliseconds(30000), 0.0};
    RetryPolicy error_retry{3, std::chrono::milliseconds(1000), 1.0, std::chrono::milliseconds(1000), 0.0};
};

class ClientBase {
public:
    explicit ClientBase(Credentials credentials, ClientOptions options = {});

    [[nodiscard]] const Credentials& credentials() const noexcept { return credentials_; }
    [[nodiscard]] long window_ms() const noexcept { return options_.window_ms; }

protected:
    nlohmann::json public_request(
        const std::string& method,
        const std::string& path,
        const QueryParams& params = {}) const;

    // Query parameters travel in the URL for GET and in a JSON body for
    // POST/DELETE. Both are covered by the signature.
    nlohmann::json signed_request(
        const std::string& method,
        const std::string& path,
        const std::string& instruction,
        const QueryParams& params = {},
        const nlohmann::json& body = nlohmann::json()) const;

private:
    HttpResponse with_retry(const std::string& label,
                            const std::function<HttpResponse()>& attempt) const;

    static nlohmann::json parse_body(const HttpResponse& response);

    Credentials credentials_;
    ClientOptions options_;
    HttpClient http_client_;
};

} // namespace backpack
