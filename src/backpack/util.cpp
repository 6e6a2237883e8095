#include "backpack/util.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace backpack {

std::string url_encode(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped.push_back(static_cast<char>(c));
        } else {
            escaped.push_back('%');
            constexpr char hex_chars[] = "0123456789ABCDEF";
            escaped.push_back(hex_chars[(c >> 4) & 0x0F]);
            escaped.push_back(hex_chars[c & 0x0F]);
        }
    }
    return escaped;
}

QueryParams filter_empty(const QueryParams& params) {
    QueryParams filtered;
    filtered.reserve(params.size());
    for (const auto& [key, value] : params) {
        if (!value.empty()) {
            filtered.emplace_back(key, value);
        }
    }
    return filtered;
}

std::string build_query_string(const QueryParams& params) {
    const auto filtered = filter_empty(params);
    std::ostringstream oss;
    for (std::size_t i = 0; i < filtered.size(); ++i) {
        if (i != 0) {
            oss << '&';
        }
        oss << url_encode(filtered[i].first) << '=' << url_encode(filtered[i].second);
    }
    return oss.str();
}

std::string build_signing_payload(const std::string& instruction,
                                  const QueryParams& params,
                                  std::int64_t timestamp_ms,
                                  long window_ms) {
    auto sorted = filter_empty(params);
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first < rhs.first;
    });

    std::ostringstream oss;
    oss << "instruction=" << instruction;
    for (const auto& [key, value] : sorted) {
        oss << '&' << key << '=' << value;
    }
    oss << "&timestamp=" << timestamp_ms << "&window=" << window_ms;
    return oss.str();
}

std::string hmac_sha256_hex(const std::string& key, const std::string& message) {
    unsigned int len = 0;
    unsigned char buffer[EVP_MAX_MD_SIZE];

    const unsigned char* digest = HMAC(
        EVP_sha256(),
        key.data(), static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        buffer,
        &len);

    if (digest == nullptr) {
        throw std::runtime_error("Failed to create HMAC signature");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(buffer[i]);
    }

    return oss.str();
}

std::string format_decimal(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(std::max(precision, 0)) << value;
    return oss.str();
}

double round_to_precision(double value, int precision) {
    if (precision < 0) {
        return value;
    }
    const double factor = std::pow(10.0, precision);
    return std::round(value * factor) / factor;
}

std::int64_t current_timestamp_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string to_upper_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

} // namespace backpack
