#pragma once

#include <optional>
#include <string>

#include "api/Controllers.hpp"

namespace igp::http {

// First value for key in the request's query string, form-decoded.
std::optional<std::string> opt_string(const igp::api::Request& request, const char* key);

}  // namespace igp::http
