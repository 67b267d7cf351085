#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/json/value.hpp>

#include "adapters/indodax/IndodaxClient.hpp"
#include "app/MarketDataService.hpp"
#include "common/Metrics.hpp"
#include "core/TtlCache.hpp"
#include "support/FakeTransport.hpp"

namespace {

using namespace std::chrono_literals;
using adapters::indodax::IndodaxClient;
using core::ports::TransportError;
using igp::testing::FakeTransport;
using igp::testing::ManualClock;

// One service wired to a scripted transport and a hand-driven clock.
struct Fixture {
    explicit Fixture(app::MarketDataService::Options options = {}) : service(cache, client, std::move(options)) {}

    FakeTransport transport;
    ManualClock clock;
    core::TtlCache cache{core::TtlCache::Config{}, clock.fn()};
    IndodaxClient client{transport, IndodaxClient::Options{}};
    app::MarketDataService service;
};

std::string field(const boost::json::value& body, const char* key) {
    if (!body.is_object()) {
        return {};
    }
    const auto* value = body.as_object().if_contains(key);
    if (!value || !value->is_string()) {
        return {};
    }
    return std::string{value->as_string().c_str()};
}

bool isEmptyArray(const boost::json::value& body, const char* key) {
    const auto* value = body.is_object() ? body.as_object().if_contains(key) : nullptr;
    return value && value->is_array() && value->as_array().empty();
}

app::HistoryQuery historyQuery(const char* symbol, const char* resolution) {
    app::HistoryQuery query{};
    query.symbol = symbol;
    query.resolution = resolution;
    return query;
}

}  // namespace

int main() {
    {
        Fixture f;
        f.transport.push(200, R"({"s":"error","errmsg":"unknown symbol"})");
        const auto reply = f.service.history(historyQuery("BTCIDR", "60"));
        if (reply.status != 200 || field(reply.body, "s") != "no_data") {
            std::cerr << "Expected a non-ok history status to become no_data\n";
            return 1;
        }
        for (const char* series : {"t", "o", "h", "l", "c", "v"}) {
            if (!isEmptyArray(reply.body, series)) {
                std::cerr << "Expected empty series " << series << " in the no_data body\n";
                return 1;
            }
        }
        if (f.cache.size() != 0) {
            std::cerr << "Expected a no_data reply not to be cached\n";
            return 1;
        }
    }

    {
        Fixture f;
        app::HistoryQuery query{};
        query.symbol = "BTCIDR";
        const auto reply = f.service.history(query);
        if (reply.status != 400
            || field(reply.body, "error") != "Missing required parameters: symbol and resolution") {
            std::cerr << "Expected 400 when resolution is missing\n";
            return 1;
        }
        if (f.transport.calls() != 0) {
            std::cerr << "Expected no upstream call for an invalid history request\n";
            return 1;
        }
    }

    {
        Fixture f;
        f.transport.push(200, R"({"s":"ok","t":[1],"o":[1],"h":[1],"l":[1],"c":[1],"v":[1]})");
        auto query = historyQuery("BTCIDR", "60");
        query.from = "1700000000abc";
        const auto first = f.service.history(query);
        const auto second = f.service.history(query);
        if (first.status != 200 || field(first.body, "s") != "ok" || second.body != first.body) {
            std::cerr << "Expected an ok history payload to be returned verbatim\n";
            return 1;
        }
        if (f.transport.calls() != 1) {
            std::cerr << "Expected the second history request to be served from cache\n";
            return 1;
        }
        const auto requests = f.transport.requests();
        if (requests[0].url
            != "https://indodax.com/api/tradingview/history?symbol=btc_idr&resolution=60&from=1700000000") {
            std::cerr << "Unexpected history URL " << requests[0].url << "\n";
            return 1;
        }
        if (!f.cache.contains("history_btc_idr_60_1700000000abc_undefined")) {
            std::cerr << "Expected the cache key to use the raw from/to values\n";
            return 1;
        }
    }

    {
        Fixture f;
        f.transport.pushError(TransportError::Kind::Network, "connect: Connection refused");
        const auto reply = f.service.history(historyQuery("BTCIDR", "60"));
        if (reply.status != 500 || field(reply.body, "error") != "Failed to fetch history data"
            || field(reply.body, "symbol") != "BTCIDR"
            || field(reply.body, "message") != "connect: Connection refused") {
            std::cerr << "Expected a history transport failure to become a 500 with the raw symbol\n";
            return 1;
        }
    }

    {
        Fixture f;
        f.transport.push(200, R"({"buy":[[1,2]],"sell":[[3,4]]})");
        f.transport.push(200, R"({"buy":[],"sell":[[5,6]]})");

        const auto first = f.service.depth("btcidr");
        f.clock.advance(1999ms);
        const auto second = f.service.depth("BTC_IDR");
        if (f.transport.calls() != 1 || first.body != second.body) {
            std::cerr << "Expected a depth request within 2 s to be served from cache\n";
            return 1;
        }
        if (f.transport.requests()[0].url != "https://indodax.com/api/depth/btc_idr") {
            std::cerr << "Unexpected depth URL " << f.transport.requests()[0].url << "\n";
            return 1;
        }

        f.clock.advance(1ms);
        const auto third = f.service.depth("btcidr");
        if (f.transport.calls() != 2 || third.body == first.body) {
            std::cerr << "Expected an expired depth entry to be refetched\n";
            return 1;
        }
    }

    {
        Fixture f;
        f.transport.push(500, "oops");
        f.transport.push(500, "oops");
        const auto reply = f.service.depth("ethidr");
        if (reply.status != 200 || !isEmptyArray(reply.body, "buy") || !isEmptyArray(reply.body, "sell")) {
            std::cerr << "Expected a failed depth request to degrade to an empty order book\n";
            return 1;
        }
    }

    {
        Fixture f;
        f.transport.push(200, R"(["not","an","object"])");
        const auto reply = f.service.tickerAll();
        if (reply.status != 500 || field(reply.body, "error") != "Failed to fetch ticker data"
            || field(reply.body, "timestamp").empty() || f.cache.size() != 0) {
            std::cerr << "Expected a non-object ticker payload to become an uncached 500\n";
            return 1;
        }
    }

    {
        Fixture f;
        f.transport.push(200, R"({"tickers":{"btc_idr":{}}})");
        const auto first = f.service.tickerAll();
        f.clock.advance(2999ms);
        const auto second = f.service.tickerAll();
        if (first.status != 200 || second.body != first.body || f.transport.calls() != 1) {
            std::cerr << "Expected ticker_all to be cached for 3 s\n";
            return 1;
        }
    }

    {
        Fixture f;
        f.transport.push(200, R"({"ticker":{"last":"1"}})");
        f.transport.push(200, R"({"ticker":{"last":"2"}})");
        f.service.ticker("BTCIDR");
        const auto second = f.service.ticker("btc_idr");
        if (f.transport.calls() != 2 || f.cache.size() != 0) {
            std::cerr << "Expected the single-pair ticker to bypass the cache\n";
            return 1;
        }
        if (f.transport.requests()[0].url != "https://indodax.com/api/ticker/btc_idr" || second.status != 200) {
            std::cerr << "Unexpected ticker request\n";
            return 1;
        }

        f.transport.push(404, "{}");
        const auto failed = f.service.ticker("zzzidr");
        if (failed.status != 500 || field(failed.body, "error") != "Request failed with status code 404") {
            std::cerr << "Expected a ticker failure to carry the upstream message\n";
            return 1;
        }
    }

    {
        Fixture f;
        const auto missing = f.service.proxy(std::nullopt);
        if (missing.status != 400 || field(missing.body, "error") != "URL parameter required") {
            std::cerr << "Expected 400 when the proxy url is missing\n";
            return 1;
        }
        const auto forbidden = f.service.proxy(std::string{"https%3A%2F%2Fexample.com%2Fdata"});
        if (forbidden.status != 403 || field(forbidden.body, "error") != "Only Indodax URLs allowed") {
            std::cerr << "Expected 403 for a non-Indodax proxy target\n";
            return 1;
        }
        const auto malformed = f.service.proxy(std::string{"%E0%A4%A"});
        if (malformed.status != 500 || field(malformed.body, "error") != "Proxy request failed") {
            std::cerr << "Expected 500 for a malformed proxy url\n";
            return 1;
        }
        if (f.transport.calls() != 0) {
            std::cerr << "Expected rejected proxy requests to make no upstream call\n";
            return 1;
        }

        f.transport.push(200, R"({"pairs":[]})");
        const auto allowed = f.service.proxy(std::string{"https%3A%2F%2Findodax.com%2Fapi%2Fpairs"});
        if (allowed.status != 200 || f.transport.requests().back().url != "https://indodax.com/api/pairs"
            || f.transport.requests().back().timeout != 10000ms) {
            std::cerr << "Expected the decoded proxy url to be fetched with a 10 s timeout\n";
            return 1;
        }
        if (f.cache.size() != 0) {
            std::cerr << "Expected proxy responses to bypass the cache\n";
            return 1;
        }
    }

    {
        Fixture f;
        f.transport.push(200, R"({"tickers":{}})");
        f.transport.push(200, R"({"ticker":{}})", {{"x-response-time", "7"}});
        f.service.summaries();
        const auto up = f.service.health();
        if (up.status != 200 || field(up.body, "status") != "OK" || field(up.body, "indodaxStatus") != "CONNECTED"
            || field(up.body, "indodaxResponseTime") != "7" || field(up.body, "service") != "Indodax Proxy Server") {
            std::cerr << "Expected a healthy report with upstream CONNECTED\n";
            return 1;
        }
        const auto& object = up.body.as_object();
        if (object.at("cacheSize").to_number<std::int64_t>() != 1 || object.at("endpoints").as_array().size() != 7
            || object.at("cacheEntries").as_array().at(0).as_string() != "summaries") {
            std::cerr << "Expected health to list cache entries and the public endpoints\n";
            return 1;
        }

        f.transport.pushError(TransportError::Kind::Timeout, "timeout of 5000ms exceeded");
        const auto down = f.service.health();
        if (down.status != 200 || field(down.body, "indodaxStatus") != "DISCONNECTED"
            || field(down.body, "indodaxError") != "timeout of 5000ms exceeded") {
            std::cerr << "Expected health to stay 200 and report DISCONNECTED\n";
            return 1;
        }
    }

    {
        Fixture f;
        f.transport.push(200, R"({"tickers":{}})");
        f.transport.push(200, R"({"buy":[],"sell":[]})");
        f.service.tickerAll();
        f.service.depth("btcidr");

        const auto cleared = f.service.clearCache();
        const auto& object = cleared.body.as_object();
        if (field(cleared.body, "message") != "Cache cleared"
            || object.at("previousSize").to_number<std::int64_t>() != 2
            || object.at("currentSize").to_number<std::int64_t>() != 0 || f.service.cacheSize() != 0) {
            std::cerr << "Expected clear-cache to report previousSize=2 and currentSize=0\n";
            return 1;
        }
    }

    {
        // Upstream times out once, then answers: one reply, one cache entry.
        Fixture f;
        f.transport.pushError(TransportError::Kind::Timeout, "timeout of 8000ms exceeded");
        f.transport.push(200, R"({"tickers":{"btc_idr":{"last":"1"}}})");
        auto& registry = igp::common::metrics::Registry::instance();
        const auto hitsBefore = registry.counter(igp::common::metrics::kCacheHit);

        const auto first = f.service.tickerAll();
        if (first.status != 200 || !first.body.as_object().contains("tickers")) {
            std::cerr << "Expected the retried ticker_all payload to be served\n";
            return 1;
        }
        if (f.transport.calls() != 2 || f.cache.size() != 1 || !f.cache.contains("ticker_all")) {
            std::cerr << "Expected two upstream calls and a single cache entry (calls=" << f.transport.calls()
                      << " size=" << f.cache.size() << ")\n";
            return 1;
        }

        const auto second = f.service.tickerAll();
        if (second.body != first.body || f.transport.calls() != 2
            || registry.counter(igp::common::metrics::kCacheHit) != hitsBefore + 1) {
            std::cerr << "Expected the follow-up ticker_all to be a cache hit\n";
            return 1;
        }
    }

    {
        Fixture f;
        f.transport.push(404, "{}");
        const auto reply = f.service.summaries();
        if (reply.status != 500 || field(reply.body, "error") != "Request failed with status code 404"
            || f.cache.size() != 0) {
            std::cerr << "Expected a summaries failure to answer 500 {error} and cache nothing\n";
            return 1;
        }

        f.transport.push(200, R"(["not","an","object"])");
        const auto invalid = f.service.summaries();
        if (invalid.status != 500 || field(invalid.body, "error").empty() || f.cache.size() != 0) {
            std::cerr << "Expected a non-object summaries payload to answer 500 and cache nothing\n";
            return 1;
        }
    }

    {
        // Concurrent misses on one key share a single upstream fetch.
        app::MarketDataService::Options options{};
        options.singleFlight = true;
        Fixture f(options);
        f.transport.setLatency(200ms);
        f.transport.push(200, R"({"buy":[[1,2]],"sell":[[3,4]]})");

        std::vector<app::Reply> replies(4);
        std::vector<std::thread> callers;
        for (std::size_t i = 0; i < replies.size(); ++i) {
            callers.emplace_back([&f, &replies, i]() {
                replies[i] = f.service.depth(i % 2 == 0 ? "btcidr" : "BTC_IDR");
            });
        }
        for (auto& caller : callers) {
            caller.join();
        }

        if (f.transport.calls() != 1) {
            std::cerr << "Expected concurrent depth misses to share one upstream call, saw " << f.transport.calls()
                      << "\n";
            return 1;
        }
        for (const auto& reply : replies) {
            if (reply.status != 200 || isEmptyArray(reply.body, "buy") || reply.body != replies.front().body) {
                std::cerr << "Expected every concurrent caller to receive the shared order book\n";
                return 1;
            }
        }
    }

    return 0;
}
