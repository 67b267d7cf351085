#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>
#include <utility>

#include "adapters/indodax/IndodaxClient.hpp"
#include "api/Controllers.hpp"
#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "app/MarketDataService.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "core/TtlCache.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

void printBanner(const igp::common::Config& config) {
    const auto base = "http://localhost:" + std::to_string(config.port);
    LOG_INFO(SYS, "Indodax proxy listening on " << base);
    LOG_INFO(SYS, "Endpoints:");
    for (const auto& endpoint : app::MarketDataService::publicEndpoints()) {
        LOG_INFO(SYS, "  " << endpoint);
    }
    LOG_INFO(SYS, "Try:");
    LOG_INFO(SYS, "  curl " << base << "/api/ticker_all");
    LOG_INFO(SYS, "  curl \"" << base << "/api/tradingview/history?symbol=BTCIDR&resolution=60\"");
    LOG_INFO(SYS, "  curl " << base << "/api/depth/btcidr");
    LOG_INFO(SYS, "  curl " << base << "/health");
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    try {
        auto config = igp::common::Config::fromArgs(argc, argv);
        igp::log::setLevel(config.logLevel);

        LOG_INFO(SYS, "Configuration loaded");
        LOG_INFO(SYS, "  Port: " << config.port);
        LOG_INFO(SYS, "  Log level: " << igp::log::levelToString(config.logLevel));
        LOG_INFO(SYS, "  Worker threads: " << config.threads);
        LOG_INFO(SYS, "  Upstream: https://" << config.upstreamHost << " timeout=" << config.upstreamTimeoutMs
                      << " ms retry_timeout=" << config.upstreamRetryTimeoutMs << " ms");
        LOG_INFO(SYS, "  Proxy allowed domain: " << config.allowedDomain);
        LOG_INFO(SYS, "  Cache TTL ticker=" << config.tickerTtlMs << " ms history=" << config.historyTtlMs
                      << " ms depth=" << config.depthTtlMs << " ms");
        LOG_INFO(SYS, "  Cache max entries: " << (config.cacheMaxEntries == 0 ? std::string("unbounded")
                                                                            : std::to_string(config.cacheMaxEntries)));
        LOG_INFO(SYS, "  Single-flight: " << (config.singleFlight ? "on" : "off"));
        if (!config.verifyTls) {
            LOG_WARN(NET, "Upstream TLS certificate verification is disabled");
        }

        infra::http::TlsHttpClient transport(config.verifyTls);

        adapters::indodax::IndodaxClient::Options clientOptions{};
        clientOptions.host = config.upstreamHost;
        clientOptions.timeout = std::chrono::milliseconds(config.upstreamTimeoutMs);
        clientOptions.retryTimeout = std::chrono::milliseconds(config.upstreamRetryTimeoutMs);
        clientOptions.healthTimeout = std::chrono::milliseconds(config.healthTimeoutMs);
        clientOptions.proxyTimeout = std::chrono::milliseconds(config.proxyTimeoutMs);
        adapters::indodax::IndodaxClient client(transport, std::move(clientOptions));

        app::MarketDataService::Options serviceOptions{};
        serviceOptions.ttl.ticker = std::chrono::milliseconds(config.tickerTtlMs);
        serviceOptions.ttl.history = std::chrono::milliseconds(config.historyTtlMs);
        serviceOptions.ttl.depth = std::chrono::milliseconds(config.depthTtlMs);
        serviceOptions.allowedDomain = config.allowedDomain;
        serviceOptions.singleFlight = config.singleFlight;

        core::TtlCache::Config cacheConfig{};
        cacheConfig.maxEntries = config.cacheMaxEntries;
        cacheConfig.sweepHorizon = serviceOptions.ttl.longest();
        core::TtlCache cache(cacheConfig);

        app::MarketDataService service(cache, client, std::move(serviceOptions));
        igp::api::Controllers controllers(service);
        igp::api::Router router(controllers);

        igp::api::Endpoint endpoint{"0.0.0.0", config.port};
        igp::api::HttpServer server(router, endpoint, config.threads);

        igp::api::HttpServer::CorsConfig corsConfig{};
        corsConfig.enabled = config.httpCorsEnable && !config.httpCorsOrigin.empty();
        corsConfig.origin = config.httpCorsOrigin;
        server.setCorsConfig(std::move(corsConfig));

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        server.start();
        printBanner(config);

        while (gSignalStatus == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO(SYS, "Signal " << gSignalStatus << " received, stopping");
        server.stop();
        LOG_INFO(SYS, "Shutdown complete, cache held " << cache.size() << " entries");
    } catch (const std::exception& ex) {
        LOG_ERR(SYS, "Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
