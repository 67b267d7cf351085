#pragma once

#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

#include "core/TtlCache.hpp"

namespace core {

// Per-key in-flight registry: concurrent callers for one key share the
// leader's fetch, including its failure.
class SingleFlight {
public:
    using Payload = TtlCache::Payload;
    using Fetch = std::function<Payload()>;

    struct Outcome {
        Payload payload;
        bool shared{false};
    };

    Outcome run(const std::string& key, const Fetch& fetch);

    std::size_t inFlight() const;

private:
    void release(const std::string& key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<Payload>> calls_;
};

}  // namespace core
