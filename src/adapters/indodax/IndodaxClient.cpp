#include "adapters/indodax/IndodaxClient.hpp"

#include <string>
#include <utility>

#include <boost/json/parse.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/UpstreamError.hpp"

namespace adapters::indodax {

namespace {

using core::UpstreamError;
using core::ports::HeaderList;
using core::ports::HttpGet;
using core::ports::HttpResult;
using core::ports::TransportError;
namespace metrics = igp::common::metrics;

constexpr char kUserAgent[] = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";
constexpr char kAcceptLanguage[] = "id-ID,id;q=0.9,en-US;q=0.8,en;q=0.7";

HeaderList primaryHeaders() {
    return {
        {"User-Agent", kUserAgent},
        {"Accept", "application/json"},
        {"Accept-Language", kAcceptLanguage},
    };
}

HeaderList reducedHeaders() { return {{"User-Agent", kUserAgent}}; }

UpstreamError fromTransport(const TransportError& ex) {
    const auto kind = ex.kind() == TransportError::Kind::Timeout ? UpstreamError::Kind::Timeout
                                                                 : UpstreamError::Kind::Network;
    return UpstreamError(kind, ex.what());
}

void throwOnStatus(unsigned status) {
    if (status < 400U) {
        return;
    }
    const auto kind = status >= 500U ? UpstreamError::Kind::ServerError : UpstreamError::Kind::ClientError;
    throw UpstreamError(kind, "Request failed with status code " + std::to_string(status), status);
}

}  // namespace

IndodaxClient::IndodaxClient(core::ports::IHttpTransport& transport, Options options)
    : transport_(transport), options_(std::move(options)) {}

std::string IndodaxClient::baseUrl() const { return "https://" + options_.host; }

boost::json::value IndodaxClient::fetchOnce(const HttpGet& request) {
    HttpResult result;
    try {
        result = transport_.get(request);
    } catch (const TransportError& ex) {
        throw fromTransport(ex);
    }
    throwOnStatus(result.status);

    boost::json::error_code ec;
    auto value = boost::json::parse(result.body, ec);
    if (ec) {
        throw UpstreamError(UpstreamError::Kind::InvalidPayload,
                            "Upstream returned non-JSON body: " + ec.message(), result.status);
    }
    return value;
}

boost::json::value IndodaxClient::fetch(const std::string& path, const igp::http::QueryParams& params) {
    const std::string url = baseUrl() + path + igp::http::encode_query(params);
    metrics::Registry::instance().incrementCounter(metrics::kUpstreamFetch);
    LOG_INFO(NET, "[FETCH] " << path);

    try {
        return fetchOnce(HttpGet{url, primaryHeaders(), options_.timeout});
    } catch (const UpstreamError& ex) {
        LOG_ERR(NET, "[ERROR] " << path << ": " << ex.what());
        if (!ex.retryable()) {
            metrics::Registry::instance().incrementCounter(metrics::kUpstreamError);
            throw;
        }
    }

    LOG_INFO(NET, "[RETRY] " << path);
    metrics::Registry::instance().incrementCounter(metrics::kUpstreamRetry);
    try {
        return fetchOnce(HttpGet{url, reducedHeaders(), options_.retryTimeout});
    } catch (const UpstreamError& retryError) {
        metrics::Registry::instance().incrementCounter(metrics::kUpstreamError);
        throw UpstreamError(retryError.kind(), std::string{"Retry failed: "} + retryError.what(),
                            retryError.status());
    }
}

boost::json::value IndodaxClient::fetchUrl(const std::string& url) {
    metrics::Registry::instance().incrementCounter(metrics::kUpstreamFetch);
    LOG_INFO(NET, "[FETCH] " << url);
    try {
        return fetchOnce(HttpGet{url, reducedHeaders(), options_.proxyTimeout});
    } catch (const UpstreamError& ex) {
        metrics::Registry::instance().incrementCounter(metrics::kUpstreamError);
        LOG_ERR(NET, "[ERROR] " << url << ": " << ex.what());
        throw;
    }
}

IndodaxClient::ConnectivityResult IndodaxClient::checkUpstream(const std::string& path) {
    ConnectivityResult outcome{};
    try {
        const auto result = transport_.get(HttpGet{baseUrl() + path, {}, options_.healthTimeout});
        throwOnStatus(result.status);
        outcome.connected = true;
        outcome.responseTime = result.header("x-response-time");
    } catch (const TransportError& ex) {
        outcome.error = ex.what();
    } catch (const UpstreamError& ex) {
        outcome.error = ex.what();
    }

    if (!outcome.connected) {
        LOG_WARN(NET, "health outcome " << path << " failed: " << outcome.error);
    }
    return outcome;
}

}  // namespace adapters::indodax
