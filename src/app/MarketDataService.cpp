#include "app/MarketDataService.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <exception>
#include <memory>
#include <utility>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>

#include "adapters/indodax/IndodaxClient.hpp"
#include "adapters/indodax/SymbolNormalizer.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/TimeUtils.hpp"
#include "core/UpstreamError.hpp"
#include "http/ErrorCodes.hpp"
#include "http/UrlCodec.hpp"

namespace app {

namespace {

namespace errors = igp::http::errors;
namespace metrics = igp::common::metrics;
using core::UpstreamError;

constexpr char kTickerAllKey[] = "ticker_all";
constexpr char kSummariesKey[] = "summaries";
constexpr char kUndefinedParam[] = "undefined";

std::size_t countTickers(const boost::json::value& data) {
    if (!data.is_object()) {
        return 0;
    }
    const auto* tickers = data.as_object().if_contains("tickers");
    if (!tickers || !tickers->is_object()) {
        return 0;
    }
    return tickers->as_object().size();
}

// Leading-integer parse ("1700000000", " 42abc" -> 42); nullopt when no digits.
std::optional<std::int64_t> parseLeadingInt(const std::string& raw) {
    std::size_t pos = 0;
    while (pos < raw.size() && std::isspace(static_cast<unsigned char>(raw[pos])) != 0) {
        ++pos;
    }
    bool negative = false;
    if (pos < raw.size() && (raw[pos] == '-' || raw[pos] == '+')) {
        negative = raw[pos] == '-';
        ++pos;
    }
    const auto digitsStart = pos;
    std::int64_t value = 0;
    while (pos < raw.size() && std::isdigit(static_cast<unsigned char>(raw[pos])) != 0) {
        if (value > (std::numeric_limits<std::int64_t>::max() - 9) / 10) {
            return std::nullopt;
        }
        value = value * 10 + (raw[pos] - '0');
        ++pos;
    }
    if (pos == digitsStart) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

boost::json::object errorBody(std::string_view message) {
    boost::json::object body;
    body["error"] = message;
    return body;
}

boost::json::object emptyOhlcv() {
    boost::json::object body;
    body["s"] = "no_data";
    for (const char* series : {"t", "o", "h", "l", "c", "v"}) {
        body[series] = boost::json::array{};
    }
    return body;
}

boost::json::object emptyOrderBook() {
    boost::json::object body;
    body["buy"] = boost::json::array{};
    body["sell"] = boost::json::array{};
    return body;
}

void requireObject(const boost::json::value& data, const char* what) {
    if (!data.is_object()) {
        throw UpstreamError(UpstreamError::Kind::InvalidPayload, std::string{"Invalid "} + what + " data format");
    }
}

}  // namespace

MarketDataService::MarketDataService(core::TtlCache& cache,
                                     adapters::indodax::IndodaxClient& client,
                                     Options options)
    : cache_(cache), client_(client), options_(std::move(options)) {}

const std::vector<std::string>& MarketDataService::publicEndpoints() {
    static const std::vector<std::string> endpoints{
        "/api/ticker_all",
        "/api/tradingview/history",
        "/api/depth/:pair",
        "/api/ticker/:pair",
        "/api/summaries",
        "/proxy",
        "/health",
    };
    return endpoints;
}

std::size_t MarketDataService::cacheSize() const { return cache_.size(); }

core::TtlCache::Payload MarketDataService::readThrough(const std::string& key,
                                                       core::TtlClass ttlClass,
                                                       const Loader& load,
                                                       const char* label) {
    auto& registry = metrics::Registry::instance();
    if (auto hit = cache_.get(key, options_.ttl.of(ttlClass))) {
        registry.incrementCounter(metrics::kCacheHit);
        LOG_INFO(CACHE, "[CACHE HIT] " << label << ": " << key);
        return std::move(hit->payload);
    }
    registry.incrementCounter(metrics::kCacheMiss);

    auto loadAndStore = [&]() -> core::TtlCache::Payload {
        auto payload = std::make_shared<const boost::json::value>(load());
        cache_.put(key, payload);
        LOG_DEBUG(CACHE, "stored " << key << " ttlClass=" << core::to_string(ttlClass)
                                   << " size=" << cache_.size());
        return payload;
    };

    if (!options_.singleFlight) {
        return loadAndStore();
    }

    auto outcome = flights_.run(key, loadAndStore);
    if (outcome.shared) {
        registry.incrementCounter(metrics::kCoalescedWait);
        LOG_DEBUG(CACHE, "coalesced miss on " << key);
    }
    return std::move(outcome.payload);
}

Reply MarketDataService::tickerAll() {
    try {
        const auto payload = readThrough(kTickerAllKey, core::TtlClass::Ticker, [this] {
            auto data = client_.fetch("/api/ticker_all");
            requireObject(data, "ticker");
            LOG_INFO(API, "[SUCCESS] ticker_all: " << countTickers(data) << " pairs");
            return data;
        }, "ticker_all");
        return Reply{200, *payload};
    } catch (const std::exception& ex) {
        LOG_ERR(API, "ticker_all error: " << ex.what());
        boost::json::object body;
        body["error"] = errors::ticker_failed;
        body["message"] = ex.what();
        body["timestamp"] = core::nowIsoUtc();
        return Reply{500, std::move(body)};
    }
}

Reply MarketDataService::history(const HistoryQuery& query) {
    if (!query.symbol || query.symbol->empty() || !query.resolution || query.resolution->empty()) {
        return Reply{400, errorBody(errors::history_params_required)};
    }

    const auto symbol = adapters::indodax::normalize_pair(*query.symbol);
    const auto& resolution = *query.resolution;
    const std::string fromRaw = query.from.value_or(kUndefinedParam);
    const std::string toRaw = query.to.value_or(kUndefinedParam);
    const std::string key = "history_" + symbol + "_" + resolution + "_" + fromRaw + "_" + toRaw;

    igp::http::QueryParams params{{"symbol", symbol}, {"resolution", resolution}};
    if (const auto from = parseLeadingInt(fromRaw)) {
        params.emplace_back("from", std::to_string(*from));
    }
    if (const auto to = parseLeadingInt(toRaw)) {
        params.emplace_back("to", std::to_string(*to));
    }

    try {
        const auto payload = readThrough(key, core::TtlClass::History, [&] {
            auto data = client_.fetch("/api/tradingview/history", params);
            const boost::json::value* status = data.is_object() ? data.as_object().if_contains("s") : nullptr;
            if (!status || !status->is_string() || status->as_string() != "ok") {
                const std::string reported = status && status->is_string()
                                                 ? std::string{status->as_string().c_str()}
                                                 : std::string{kUndefinedParam};
                throw UpstreamError(UpstreamError::Kind::InvalidPayload, "history status " + reported);
            }
            const auto* candles = data.as_object().if_contains("t");
            LOG_INFO(API, "[SUCCESS] history: " << symbol << " - "
                                                << (candles && candles->is_array() ? candles->as_array().size() : 0U)
                                                << " candles");
            return data;
        }, "history");
        return Reply{200, *payload};
    } catch (const std::exception& ex) {
        const auto* upstream = dynamic_cast<const UpstreamError*>(&ex);
        if (upstream && upstream->kind() == UpstreamError::Kind::InvalidPayload) {
            LOG_WARN(API, "History data not ok for " << symbol << ": " << ex.what());
            return Reply{200, emptyOhlcv()};
        }
        LOG_ERR(API, "history error: " << ex.what());
        boost::json::object body;
        body["error"] = errors::history_failed;
        body["message"] = ex.what();
        body["symbol"] = *query.symbol;
        return Reply{500, std::move(body)};
    }
}

Reply MarketDataService::depth(const std::string& rawPair) {
    const auto pair = adapters::indodax::normalize_pair(rawPair);
    try {
        const auto payload = readThrough("depth_" + pair, core::TtlClass::Depth, [&] {
            auto data = client_.fetch("/api/depth/" + pair);
            requireObject(data, "depth");
            LOG_INFO(API, "[SUCCESS] depth: " << pair);
            return data;
        }, "depth");
        return Reply{200, *payload};
    } catch (const std::exception& ex) {
        LOG_ERR(API, "depth error: " << ex.what());
        return Reply{200, emptyOrderBook()};
    }
}

Reply MarketDataService::ticker(const std::string& rawPair) {
    const auto pair = adapters::indodax::normalize_pair(rawPair);
    try {
        return Reply{200, client_.fetch("/api/ticker/" + pair)};
    } catch (const std::exception& ex) {
        LOG_ERR(API, "ticker error: " << ex.what());
        return Reply{500, errorBody(ex.what())};
    }
}

Reply MarketDataService::summaries() {
    try {
        const auto payload = readThrough(kSummariesKey, core::TtlClass::Ticker, [this] {
            auto data = client_.fetch("/api/summaries");
            requireObject(data, "summaries");
            LOG_INFO(API, "[SUCCESS] summaries: " << countTickers(data) << " pairs");
            return data;
        }, "summaries");
        return Reply{200, *payload};
    } catch (const std::exception& ex) {
        LOG_ERR(API, "summaries error: " << ex.what());
        return Reply{500, errorBody(ex.what())};
    }
}

Reply MarketDataService::proxy(const std::optional<std::string>& url) {
    if (!url || url->empty()) {
        return Reply{400, errorBody(errors::url_required)};
    }

    const auto decoded = igp::http::decode_uri_component(*url);
    if (!decoded) {
        LOG_ERR(API, "Proxy error: " << errors::uri_malformed);
        boost::json::object body;
        body["error"] = errors::proxy_failed;
        body["message"] = errors::uri_malformed;
        return Reply{500, std::move(body)};
    }

    if (decoded->find(options_.allowedDomain) == std::string::npos) {
        metrics::Registry::instance().incrementCounter(metrics::kProxyRejected);
        LOG_WARN(API, "Proxy rejected target " << *decoded);
        return Reply{403, errorBody(errors::domain_forbidden)};
    }

    try {
        return Reply{200, client_.fetchUrl(*decoded)};
    } catch (const std::exception& ex) {
        LOG_ERR(API, "Proxy error: " << ex.what());
        boost::json::object body;
        body["error"] = errors::proxy_failed;
        body["message"] = ex.what();
        return Reply{500, std::move(body)};
    }
}

Reply MarketDataService::health() {
    boost::json::object body;
    body["status"] = "OK";
    body["service"] = options_.serviceName;
    body["timestamp"] = core::nowIsoUtc();

    const auto keys = cache_.keys();
    body["cacheSize"] = keys.size();
    boost::json::array entries;
    entries.reserve(keys.size());
    for (const auto& key : keys) {
        entries.emplace_back(key);
    }
    body["cacheEntries"] = std::move(entries);

    boost::json::array endpoints;
    for (const auto& endpoint : publicEndpoints()) {
        endpoints.emplace_back(endpoint);
    }
    body["endpoints"] = std::move(endpoints);

    const auto upstream = client_.checkUpstream();
    if (upstream.connected) {
        body["indodaxStatus"] = "CONNECTED";
        if (upstream.responseTime) {
            body["indodaxResponseTime"] = *upstream.responseTime;
        }
    } else {
        body["indodaxStatus"] = "DISCONNECTED";
        body["indodaxError"] = upstream.error;
    }
    return Reply{200, std::move(body)};
}

Reply MarketDataService::clearCache() {
    const auto previousSize = cache_.clear();
    LOG_INFO(CACHE, "Cache cleared previousSize=" << previousSize);

    boost::json::object body;
    body["message"] = "Cache cleared";
    body["previousSize"] = previousSize;
    body["currentSize"] = cache_.size();
    return Reply{200, std::move(body)};
}

}  // namespace app
