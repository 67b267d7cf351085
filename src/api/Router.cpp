#include "api/Router.hpp"

#include <exception>
#include <optional>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "http/ErrorCodes.hpp"
#include "http/UrlCodec.hpp"
#include "http/json_error.hpp"

namespace igp::api {

namespace {

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

std::string stripTrailingSlash(const std::string& path) {
    if (path.size() > 1 && path.back() == '/') {
        return path.substr(0, path.size() - 1);
    }
    return path;
}

}  // namespace

Router::Router(Controllers& controllers) {
    auto* c = &controllers;
    routes_.emplace(makeKey("GET", "/api/ticker_all"), [c](const Request& r) { return c->tickerAll(r); });
    routes_.emplace(makeKey("GET", "/api/tradingview/history"), [c](const Request& r) { return c->history(r); });
    routes_.emplace(makeKey("GET", "/api/summaries"), [c](const Request& r) { return c->summaries(r); });
    routes_.emplace(makeKey("GET", "/proxy"), [c](const Request& r) { return c->proxy(r); });
    routes_.emplace(makeKey("GET", "/health"), [c](const Request& r) { return c->health(r); });
    routes_.emplace(makeKey("GET", "/clear-cache"), [c](const Request& r) { return c->clearCache(r); });
    routes_.emplace(makeKey("GET", "/stats"), [c](const Request& r) { return c->stats(r); });

    pairRoutes_.push_back(PairRoute{"/api/depth/", "GET /api/depth/:pair",
                                    [c](const Request& r, const std::string& pair) { return c->depth(r, pair); }});
    pairRoutes_.push_back(PairRoute{"/api/ticker/", "GET /api/ticker/:pair",
                                    [c](const Request& r, const std::string& pair) { return c->ticker(r, pair); }});
}

Response Router::handle(const Request& request) const {
    try {
        return dispatch(request);
    } catch (const std::exception& ex) {
        LOG_ERR(API, "Unhandled error on " << request.method << ' ' << request.path << ": " << ex.what());
        Response response{};
        igp::http::json_error(response, 500, igp::http::errors::internal_error);
        return response;
    }
}

Response Router::dispatch(const Request& request) const {
    if (request.method == "OPTIONS") {
        return preflight();
    }

    const auto path = stripTrailingSlash(request.path);
    const auto key = makeKey(request.method, path);
    if (const auto it = routes_.find(key); it != routes_.end()) {
        common::metrics::Registry::ScopedTimer timer(key);
        return it->second(request);
    }

    if (request.method == "GET") {
        for (const auto& route : pairRoutes_) {
            if (path.size() <= route.prefix.size() || path.compare(0, route.prefix.size(), route.prefix) != 0) {
                continue;
            }
            const auto rawPair = path.substr(route.prefix.size());
            if (rawPair.find('/') != std::string::npos) {
                continue;
            }
            const auto pair = igp::http::decode_uri_component(rawPair);
            if (!pair) {
                Response response{};
                igp::http::json_error(response, 400, igp::http::errors::uri_malformed);
                return response;
            }
            common::metrics::Registry::ScopedTimer timer(route.routeKey);
            return route.handler(request, *pair);
        }
    }

    LOG_DEBUG(API, "no route for " << key);
    return notFound();
}

}  // namespace igp::api
