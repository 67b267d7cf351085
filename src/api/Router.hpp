#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "api/Controllers.hpp"

namespace igp::api {

class Router {
public:
    explicit Router(Controllers& controllers);

    // Never throws; handler exceptions become 500 internal_error.
    Response handle(const Request& request) const;

private:
    using Handler = std::function<Response(const Request&)>;
    using PairHandler = std::function<Response(const Request&, const std::string&)>;

    struct PairRoute {
        std::string prefix;
        std::string routeKey;
        PairHandler handler;
    };

    Response dispatch(const Request& request) const;

    std::map<std::string, Handler> routes_;
    std::vector<PairRoute> pairRoutes_;
};

}  // namespace igp::api
