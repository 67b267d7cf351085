#include "http/json_error.hpp"

#include <boost/json/object.hpp>

#include "http/HttpJson.hpp"

namespace igp::http {

void json_error(igp::api::Response& response, int statusCode, std::string_view message) {
    boost::json::object payload;
    payload["error"] = message;
    write_json(response, payload, statusCode);
}

}  // namespace igp::http
