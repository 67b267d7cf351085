#pragma once

#include <string_view>

namespace igp::http::errors {

inline constexpr std::string_view not_found = "not_found";
inline constexpr std::string_view internal_error = "internal_error";
inline constexpr std::string_view history_params_required = "Missing required parameters: symbol and resolution";
inline constexpr std::string_view url_required = "URL parameter required";
inline constexpr std::string_view domain_forbidden = "Only Indodax URLs allowed";
inline constexpr std::string_view uri_malformed = "URI malformed";
inline constexpr std::string_view ticker_failed = "Failed to fetch ticker data";
inline constexpr std::string_view history_failed = "Failed to fetch history data";
inline constexpr std::string_view proxy_failed = "Proxy request failed";

}  // namespace igp::http::errors
