#include "api/Controllers.hpp"

#include <chrono>
#include <string>
#include <utility>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "app/MarketDataService.hpp"
#include "common/Metrics.hpp"
#include "http/ErrorCodes.hpp"
#include "http/HttpJson.hpp"
#include "http/QueryParams.hpp"
#include "http/json_error.hpp"

namespace igp::api {

namespace {

constexpr char kAllowedMethods[] = "GET,HEAD,PUT,PATCH,POST,DELETE";

Response toResponse(const app::Reply& reply) {
    Response response{};
    igp::http::write_json(response, reply.body, reply.status);
    return response;
}

}  // namespace

Controllers::Controllers(app::MarketDataService& service) : service_(service) {}

Response Controllers::tickerAll(const Request&) { return toResponse(service_.tickerAll()); }

Response Controllers::history(const Request& request) {
    app::HistoryQuery query{};
    query.symbol = igp::http::opt_string(request, "symbol");
    query.resolution = igp::http::opt_string(request, "resolution");
    query.from = igp::http::opt_string(request, "from");
    query.to = igp::http::opt_string(request, "to");
    return toResponse(service_.history(query));
}

Response Controllers::depth(const Request&, const std::string& pair) { return toResponse(service_.depth(pair)); }

Response Controllers::ticker(const Request&, const std::string& pair) { return toResponse(service_.ticker(pair)); }

Response Controllers::summaries(const Request&) { return toResponse(service_.summaries()); }

Response Controllers::proxy(const Request& request) {
    return toResponse(service_.proxy(igp::http::opt_string(request, "url")));
}

Response Controllers::health(const Request&) { return toResponse(service_.health()); }

Response Controllers::clearCache(const Request&) { return toResponse(service_.clearCache()); }

Response Controllers::stats(const Request&) {
    const auto snapshot = common::metrics::Registry::instance().snapshot();

    boost::json::object routes;
    for (const auto& [routeKey, route] : snapshot.routes) {
        boost::json::object row;
        row["requests"] = route.totalRequests;
        if (route.p95Ms) {
            row["p95_ms"] = *route.p95Ms;
        }
        if (route.p99Ms) {
            row["p99_ms"] = *route.p99Ms;
        }
        routes[routeKey] = std::move(row);
    }

    boost::json::object counters;
    for (const auto& [key, value] : snapshot.counters) {
        counters[key] = value;
    }

    boost::json::object payload;
    payload["uptime_seconds"]
        = std::chrono::duration_cast<std::chrono::seconds>(snapshot.capturedAt - snapshot.startTime).count();
    payload["cache_size"] = service_.cacheSize();
    payload["routes"] = std::move(routes);
    payload["counters"] = std::move(counters);

    Response response{};
    igp::http::write_json(response, payload);
    return response;
}

Response notFound() {
    Response response{};
    igp::http::json_error(response, 404, igp::http::errors::not_found);
    return response;
}

Response preflight() {
    Response response{};
    response.statusCode = 204;
    response.statusText = igp::http::status_reason(204);
    response.headers.emplace_back("Access-Control-Allow-Methods", kAllowedMethods);
    response.headers.emplace_back("Access-Control-Allow-Headers", "Content-Type, Authorization");
    return response;
}

}  // namespace igp::api
