#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace igp::common::metrics {

inline constexpr char kCacheHit[] = "cache_hit";
inline constexpr char kCacheMiss[] = "cache_miss";
inline constexpr char kUpstreamFetch[] = "upstream_fetch";
inline constexpr char kUpstreamRetry[] = "upstream_retry";
inline constexpr char kUpstreamError[] = "upstream_error";
inline constexpr char kProxyRejected[] = "proxy_rejected";
inline constexpr char kCoalescedWait[] = "coalesced_wait";

class Registry {
public:
    struct RouteSnapshot {
        std::uint64_t totalRequests{0};
        std::optional<double> p95Ms{};
        std::optional<double> p99Ms{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, RouteSnapshot> routes;
        std::unordered_map<std::string, std::uint64_t> counters;
    };

    // Records one request for the route and its latency on destruction.
    class ScopedTimer {
    public:
        explicit ScopedTimer(const std::string& routeKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        Registry& registry_;
        std::string routeKey_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    std::uint64_t counter(const std::string& counterKey) const;
    Snapshot snapshot() const;

private:
    // Bounded so a long-running process keeps a fixed sample window per route.
    static constexpr std::size_t kMaxLatencySamples = 2048;

    struct RouteMetrics {
        std::uint64_t totalRequests{0};
        std::vector<double> latenciesMs;
        std::size_t nextSlot{0};
    };

    Registry();

    void recordRequest(const std::string& routeKey, double latencyMs);

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RouteMetrics> routes_;
    std::unordered_map<std::string, std::uint64_t> counters_;
};

}  // namespace igp::common::metrics
