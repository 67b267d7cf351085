#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <boost/json/value.hpp>

#include "core/ports/IHttpTransport.hpp"
#include "http/UrlCodec.hpp"

namespace adapters::indodax {

inline constexpr char kHealthCheckPath[] = "/api/ticker/btc_idr";

// Upstream client for the Indodax public API. A timeout or 5xx on the first
// attempt is retried exactly once with a longer timeout and reduced headers;
// every other failure surfaces immediately as core::UpstreamError.
class IndodaxClient {
public:
    struct Options {
        std::string host = "indodax.com";
        std::chrono::milliseconds timeout{8000};
        std::chrono::milliseconds retryTimeout{10000};
        std::chrono::milliseconds healthTimeout{5000};
        std::chrono::milliseconds proxyTimeout{10000};
    };

    struct ConnectivityResult {
        bool connected{false};
        std::optional<std::string> responseTime;
        std::string error;
    };

    IndodaxClient(core::ports::IHttpTransport& transport, Options options);

    boost::json::value fetch(const std::string& path, const igp::http::QueryParams& params = {});

    // Single attempt against an absolute URL, no retry.
    boost::json::value fetchUrl(const std::string& url);

    // Single bounded attempt used by the health check; never throws.
    ConnectivityResult checkUpstream(const std::string& path = kHealthCheckPath);

    std::string baseUrl() const;

private:
    boost::json::value fetchOnce(const core::ports::HttpGet& request);

    core::ports::IHttpTransport& transport_;
    Options options_;
};

}  // namespace adapters::indodax
