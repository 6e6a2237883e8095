#include "backpack/client_base.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace backpack {

ClientBase::ClientBase(Credentials credentials, ClientOptions options)
    : credentials_(std::move(credentials)),
      options_(std::move(options)),
      http_client_(options_.timeouts) {}

nlohmann::json ClientBase::public_request(
    const std::string& method,
    const std::string& path,
    const QueryParams& params) const {

    std::string url = options_.base_url + path;
    const auto query = build_query_string(params);
    if (!query.empty()) {
        url += '?' + query;
    }

    const std::vector<std::pair<std::string, std::string>> headers = {
        {"Content-Type", "application/json"}
    };

    const auto response = with_retry(method + " " + path, [&]() {
        return http_client_.request(method, url, headers);
    });
    return parse_body(response);
}

nlohmann::json ClientBase::signed_request(
    const std::string& method,
    const std::string& path,
    const std::string& instruction,
    const QueryParams& params,
    const nlohmann::json& body) const {

    if (credentials_.empty()) {
        throw std::invalid_argument("API key and secret are required for signed requests");
    }

    std::string url = options_.base_url + path;
    std::string payload;
    if (method == "GET") {
        const auto query = build_query_string(params);
        if (!query.empty()) {
            url += '?' + query;
        }
    } else if (!body.is_null()) {
        payload = body.dump();
    }

    // Re-signed on every attempt so a long backoff cannot outlive the window.
    const auto response = with_retry(method + " " + path, [&]() {
        const auto timestamp = current_timestamp_ms();
        const auto message = build_signing_payload(instruction, params, timestamp, options_.window_ms);
        const std::vector<std::pair<std::string, std::string>> headers = {
            {"Content-Type", "application/json"},
            {"X-API-KEY", credentials_.api_key},
            {"X-SIGNATURE", hmac_sha256_hex(credentials_.api_secret, message)},
            {"X-TIMESTAMP", std::to_string(timestamp)},
            {"X-WINDOW", std::to_string(options_.window_ms)}
        };
        return http_client_.request(method, url, headers, payload);
    });
    return parse_body(response);
}

HttpResponse ClientBase::with_retry(const std::string& label,
                                    const std::function<HttpResponse()>& attempt) const {
    int error_attempt = 0;
    int rate_limit_attempt = 0;

    while (true) {
        try {
            return attempt();
        } catch (const HttpError& ex) {
            std::chrono::milliseconds delay{0};
            if (ex.is_rate_limit()) {
                if (!options_.rate_limit_retry.allows_retry(rate_limit_attempt)) {
                    throw;
                }
                delay = options_.rate_limit_retry.delay_for(rate_limit_attempt++);
                std::cerr << "[RateLimit] " << label << " throttled; backing off for "
                          << delay.count() << " ms" << std::endl;
            } else {
                if (!options_.error_retry.allows_retry(error_attempt)) {
                    throw;
                }
                delay = options_.error_retry.delay_for(error_attempt++);
                std::cerr << "[REST] " << label << " failed (" << ex.what() << "); retry "
                          << error_attempt << " in " << delay.count() << " ms" << std::endl;
            }
            std::this_thread::sleep_for(delay);
        }
    }
}

nlohmann::json ClientBase::parse_body(const HttpResponse& response) {
    if (response.body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& ex) {
        throw HttpError("Malformed JSON response: " + std::string(ex.what()), response.status_code);
    }
}

} // namespace backpack
