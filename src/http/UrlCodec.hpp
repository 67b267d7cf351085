#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace igp::http {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Query-string decoding: '+' is a space, malformed escapes are kept verbatim.
std::string decode_form_component(std::string_view value);

// Strict URI component decoding; nullopt on a malformed escape sequence.
std::optional<std::string> decode_uri_component(std::string_view value);

// Percent-encodes everything except RFC 3986 unreserved characters.
std::string encode_component(std::string_view value);

// Splits "k=v&k2" into form-decoded pairs in order; empty segments are skipped.
QueryParams parse_query(std::string_view query);

// "?k=v&k2=v2", or an empty string for no parameters.
std::string encode_query(const QueryParams& params);

}  // namespace igp::http
