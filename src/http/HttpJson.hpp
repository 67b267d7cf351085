#pragma once

#include <string>

#include <boost/json/value.hpp>

#include "api/Controllers.hpp"

namespace igp::http {

std::string serialize_json(const boost::json::value& value);

const char* status_reason(int statusCode);

// Serializes a JSON value into the response and sets status and content type.
void write_json(igp::api::Response& response, const boost::json::value& value, int statusCode = 200);

}  // namespace igp::http
