#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace backpack {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

std::string url_encode(const std::string& value);

QueryParams filter_empty(const QueryParams& params);

std::string build_query_string(const QueryParams& params);

// Canonical string the venue signs:
// instruction=<ins>[&k=v sorted by key]&timestamp=<ts>&window=<window>
std::string build_signing_payload(const std::string& instruction,
                                  const QueryParams& params,
                                  std::int64_t timestamp_ms,
                                  long window_ms);

std::string hmac_sha256_hex(const std::string& key, const std::string& message);

std::string format_decimal(double value, int precision);

double round_to_precision(double value, int precision);

std::int64_t current_timestamp_ms();

std::string to_upper_copy(std::string value);

} // namespace backpack
