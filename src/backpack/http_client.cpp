#include "backpack/http_client.hpp"

#include <utility>

namespace backpack {
namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

} // namespace

HttpClient::HttpClient(HttpTimeouts timeouts)
    : timeouts_(timeouts),
      global_initialized_(false) {
    const auto code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        throw HttpError("Failed to initialize libcurl: " + std::string(curl_easy_strerror(code)));
    }
    global_initialized_ = true;
}

HttpClient::~HttpClient() {
    if (global_initialized_) {
        curl_global_cleanup();
    }
}

HttpResponse HttpClient::request(
    const std::string& method,
    const std::string& url,
    const std::vector<std::pair<std::string, std::string>>& headers,
    const std::string& body) const {
    CURL* handle = curl_easy_init();
    if (!handle) {
        throw HttpError("Failed to create CURL easy handle");
    }

    std::string response_body;
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, timeouts_.total_ms);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, timeouts_.connect_ms);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* header_list = nullptr;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, (header.first + ": " + header.second).c_str());
    }

    if (header_list) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list);
    }

    if (!body.empty()) {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    const auto perform_code = curl_easy_perform(handle);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    long status_code = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status_code);

    double total_seconds = 0.0;
    curl_easy_getinfo(handle, CURLINFO_TOTAL_TIME, &total_seconds);
    curl_easy_cleanup(handle);

    if (perform_code != CURLE_OK) {
        throw HttpError("libcurl request failed: " + std::string(curl_easy_strerror(perform_code)));
    }

    if (status_code < 200 || status_code >= 300) {
        throw HttpError("HTTP " + std::to_string(status_code) + ": " + response_body, status_code);
    }

    return HttpResponse{status_code, std::move(response_body), total_seconds * 1000.0};
}

} // namespace backpack
