#include "core/TtlCache.hpp"

#include <algorithm>
#include <utility>

#include "common/Log.hpp"

namespace core {

TtlCache::TtlCache() : TtlCache(Config{}) {}

TtlCache::TtlCache(Config config, NowFn now) : config_(config), now_(std::move(now)) {
    if (!now_) {
        now_ = &Clock::now;
    }
}

std::optional<TtlCache::Hit> TtlCache::get(const std::string& key, Clock::duration ttl) const {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    const auto age = now - it->second.storedAt;
    if (age >= ttl) {
        return std::nullopt;
    }
    return Hit{it->second.payload, age};
}

void TtlCache::put(const std::string& key, Payload payload) {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second = Entry{now, std::move(payload)};
        return;
    }
    if (config_.maxEntries > 0 && entries_.size() >= config_.maxEntries) {
        enforceCapLocked(now);
    }
    entries_.emplace(key, Entry{now, std::move(payload)});
}

std::size_t TtlCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto previous = entries_.size();
    entries_.clear();
    return previous;
}

std::size_t TtlCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool TtlCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(key) != entries_.end();
}

std::vector<std::string> TtlCache::keys() const {
    std::vector<std::string> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(entries_.size());
        for (const auto& [key, _] : entries_) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

void TtlCache::enforceCapLocked(Clock::time_point now) {
    std::size_t swept = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.storedAt >= config_.sweepHorizon) {
            it = entries_.erase(it);
            ++swept;
        } else {
            ++it;
        }
    }

    std::size_t evicted = 0;
    while (!entries_.empty() && entries_.size() >= config_.maxEntries) {
        const auto oldest = std::min_element(entries_.begin(), entries_.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.second.storedAt < rhs.second.storedAt;
        });
        entries_.erase(oldest);
        ++evicted;
    }

    LOG_DEBUG(CACHE, "cap reached max=" << config_.maxEntries << " swept=" << swept << " evicted=" << evicted);
}

}  // namespace core
