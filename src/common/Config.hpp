#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"

namespace igp::common {

struct Config {
    std::uint16_t port = 3000;
    igp::log::Level logLevel = igp::log::Level::Info;
    std::size_t threads = 8;

    std::string upstreamHost = "indodax.com";
    std::string allowedDomain = "indodax.com";
    std::uint32_t upstreamTimeoutMs = 8000;
    std::uint32_t upstreamRetryTimeoutMs = 10000;
    std::uint32_t healthTimeoutMs = 5000;
    std::uint32_t proxyTimeoutMs = 10000;
    // Trust-all toward the upstream unless explicitly enabled.
    bool verifyTls = false;

    std::uint32_t tickerTtlMs = 3000;
    std::uint32_t historyTtlMs = 5000;
    std::uint32_t depthTtlMs = 2000;
    std::size_t cacheMaxEntries = 0;  // 0 = unbounded
    bool singleFlight = false;

    bool httpCorsEnable = true;
    std::string httpCorsOrigin = "*";

    static Config fromArgs(int argc, char** argv);
};

}  // namespace igp::common
