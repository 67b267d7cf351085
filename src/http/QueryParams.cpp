#include "http/QueryParams.hpp"

#include <utility>

#include "http/UrlCodec.hpp"

namespace igp::http {

std::optional<std::string> opt_string(const igp::api::Request& request, const char* key) {
    if (!key || request.query.empty()) {
        return std::nullopt;
    }
    for (auto& [name, value] : parse_query(request.query)) {
        if (name == key) {
            return std::move(value);
        }
    }
    return std::nullopt;
}

}  // namespace igp::http
