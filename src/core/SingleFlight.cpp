#include "core/SingleFlight.hpp"

#include <exception>
#include <utility>

namespace core {

SingleFlight::Outcome SingleFlight::run(const std::string& key, const Fetch& fetch) {
    std::promise<Payload> promise;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        const auto it = calls_.find(key);
        if (it != calls_.end()) {
            auto pending = it->second;
            lock.unlock();
            return Outcome{pending.get(), true};
        }
        calls_.emplace(key, promise.get_future().share());
    }

    Payload payload;
    try {
        payload = fetch();
    } catch (...) {
        promise.set_exception(std::current_exception());
        release(key);
        throw;
    }

    promise.set_value(payload);
    release(key);
    return Outcome{std::move(payload), false};
}

std::size_t SingleFlight::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

void SingleFlight::release(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.erase(key);
}

}  // namespace core
