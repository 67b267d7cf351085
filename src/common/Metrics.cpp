#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace igp::common::metrics {
namespace {

double computeQuantile(const std::vector<double>& sortedValues, double quantile) {
    if (sortedValues.empty()) {
        return 0.0;
    }
    if (sortedValues.size() == 1U) {
        return sortedValues.front();
    }

    const double clampedQuantile = std::clamp(quantile, 0.0, 1.0);
    const double position = clampedQuantile * static_cast<double>(sortedValues.size() - 1U);
    const auto lowerIndex = static_cast<std::size_t>(std::floor(position));
    const auto upperIndex = static_cast<std::size_t>(std::ceil(position));

    if (lowerIndex == upperIndex) {
        return sortedValues[lowerIndex];
    }

    const double weight = position - static_cast<double>(lowerIndex);
    return sortedValues[lowerIndex]
        + weight * (sortedValues[upperIndex] - sortedValues[lowerIndex]);
}

}  // namespace

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(const std::string& routeKey)
    : registry_(Registry::instance()), routeKey_(routeKey), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const auto end = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start_);
    registry_.recordRequest(routeKey_, duration.count());
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

void Registry::recordRequest(const std::string& routeKey, double latencyMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& route = routes_[routeKey];
    ++route.totalRequests;
    if (route.latenciesMs.size() < kMaxLatencySamples) {
        route.latenciesMs.push_back(latencyMs);
    }
    else {
        route.latenciesMs[route.nextSlot] = latencyMs;
        route.nextSlot = (route.nextSlot + 1U) % kMaxLatencySamples;
    }
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.routes.reserve(routes_.size());
    for (const auto& [routeKey, metrics] : routes_) {
        RouteSnapshot routeSnapshot;
        routeSnapshot.totalRequests = metrics.totalRequests;

        auto latencies = metrics.latenciesMs;
        if (!latencies.empty()) {
            std::sort(latencies.begin(), latencies.end());
            routeSnapshot.p95Ms = computeQuantile(latencies, 0.95);
            routeSnapshot.p99Ms = computeQuantile(latencies, 0.99);
        }

        snapshot.routes.emplace(routeKey, std::move(routeSnapshot));
    }

    snapshot.counters = counters_;
    return snapshot;
}

}  // namespace igp::common::metrics
