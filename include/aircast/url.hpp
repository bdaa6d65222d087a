// url.hpp
// Percent-encoding helpers for request targets and served file names.
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace aircast {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Quote a path component; '/' is kept, space becomes %20.
std::string url_encode_path(std::string_view text);

// Form-encode a query value; space becomes '+'.
std::string url_encode_query(std::string_view text);

// "a=1&b=2" in the given order.
std::string build_query(const QueryParams &params);

// Decode %XX escapes. Malformed escapes are kept as-is; '+' is not touched.
std::string url_decode(std::string_view text);

// Shortest decimal form that always carries a fraction: 1 -> "1.0", 0.25 -> "0.25".
std::string format_decimal(double value);

} // namespace aircast
