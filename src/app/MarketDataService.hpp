#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <boost/json/value.hpp>

#include "core/SingleFlight.hpp"
#include "core/TtlCache.hpp"
#include "core/TtlPolicy.hpp"

namespace adapters::indodax {
class IndodaxClient;
}  // namespace adapters::indodax

namespace app {

struct Reply {
    int status = 200;
    boost::json::value body;
};

struct HistoryQuery {
    std::optional<std::string> symbol;
    std::optional<std::string> resolution;
    std::optional<std::string> from;
    std::optional<std::string> to;
};

// One orchestrator per public resource. Every method converts its own
// failures into a Reply; none of them throws.
class MarketDataService {
public:
    struct Options {
        core::TtlPolicy ttl{};
        std::string allowedDomain = "indodax.com";
        bool singleFlight = false;
        std::string serviceName = "Indodax Proxy Server";
    };

    MarketDataService(core::TtlCache& cache, adapters::indodax::IndodaxClient& client, Options options);

    Reply tickerAll();
    Reply history(const HistoryQuery& query);
    Reply depth(const std::string& rawPair);
    Reply ticker(const std::string& rawPair);
    Reply summaries();
    Reply proxy(const std::optional<std::string>& url);
    Reply health();
    Reply clearCache();

    std::size_t cacheSize() const;

    static const std::vector<std::string>& publicEndpoints();

private:
    using Loader = std::function<boost::json::value()>;

    // Cache hit, or load + store. Loader failures propagate and nothing is stored.
    core::TtlCache::Payload readThrough(const std::string& key,
                                        core::TtlClass ttlClass,
                                        const Loader& load,
                                        const char* label);

    core::TtlCache& cache_;
    adapters::indodax::IndodaxClient& client_;
    Options options_;
    core::SingleFlight flights_;
};

}  // namespace app
