#pragma once

#include <string>
#include <utility>
#include <vector>

namespace app {
class MarketDataService;
}  // namespace app

namespace igp::api {

struct Request {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
    std::string version;
    std::string body;
};

struct Response {
    int statusCode = 200;
    std::string statusText = "OK";
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
};

// Adapts HTTP requests to MarketDataService calls and serializes the replies.
class Controllers {
public:
    explicit Controllers(app::MarketDataService& service);

    Response tickerAll(const Request& request);
    Response history(const Request& request);
    Response depth(const Request& request, const std::string& pair);
    Response ticker(const Request& request, const std::string& pair);
    Response summaries(const Request& request);
    Response proxy(const Request& request);
    Response health(const Request& request);
    Response clearCache(const Request& request);
    Response stats(const Request& request);

private:
    app::MarketDataService& service_;
};

Response notFound();

Response preflight();

}  // namespace igp::api
