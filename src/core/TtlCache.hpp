#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/json/value.hpp>

namespace core {

// Keyed response store. Staleness is decided by the caller's TTL at read
// time; stale entries stay in place until overwritten, swept or cleared.
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    using Payload = std::shared_ptr<const boost::json::value>;

    struct Config {
        std::size_t maxEntries = 0;  // 0 = unbounded
        Clock::duration sweepHorizon = std::chrono::seconds(5);
    };

    struct Hit {
        Payload payload;
        Clock::duration age{};
    };

    TtlCache();
    explicit TtlCache(Config config, NowFn now = &Clock::now);

    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;

    // Miss when the key is absent or its age is not below ttl.
    std::optional<Hit> get(const std::string& key, Clock::duration ttl) const;

    // Last write wins.
    void put(const std::string& key, Payload payload);

    // Returns the number of entries dropped.
    std::size_t clear();

    std::size_t size() const;
    bool contains(const std::string& key) const;
    std::vector<std::string> keys() const;

private:
    struct Entry {
        Clock::time_point storedAt;
        Payload payload;
    };

    void enforceCapLocked(Clock::time_point now);

    Config config_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace core
