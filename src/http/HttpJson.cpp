#include "http/HttpJson.hpp"

#include <string>

#include <boost/json/serialize.hpp>

namespace igp::http {

const char* status_reason(int statusCode) {
    switch (statusCode) {
    case 200:
        return "OK";
    case 204:
        return "No Content";
    case 400:
        return "Bad Request";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 500:
        return "Internal Server Error";
    default:
        break;
    }
    return "Unknown";
}

std::string serialize_json(const boost::json::value& value) { return boost::json::serialize(value); }

void write_json(igp::api::Response& response, const boost::json::value& value, int statusCode) {
    response.body = serialize_json(value);
    response.statusCode = statusCode;
    response.statusText = status_reason(statusCode);
    response.contentType = "application/json; charset=utf-8";
    response.headers.clear();
}

}  // namespace igp::http
