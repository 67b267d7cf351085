#pragma once

#include <string_view>

#include "api/Controllers.hpp"

namespace igp::http {

// Writes {"error":"..."} with the given status.
void json_error(igp::api::Response& response, int statusCode, std::string_view message);

}  // namespace igp::http
