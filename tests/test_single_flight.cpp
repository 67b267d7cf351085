#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/json/value.hpp>

#include "core/SingleFlight.hpp"

namespace {
using namespace std::chrono_literals;
}  // namespace

int main() {
    {
        core::SingleFlight flights;
        std::atomic<int> fetches{0};
        std::atomic<int> shared{0};
        std::atomic<int> wrong{0};

        auto fetch = [&]() -> core::SingleFlight::Payload {
            fetches.fetch_add(1);
            std::this_thread::sleep_for(100ms);
            return std::make_shared<const boost::json::value>(42);
        };

        std::vector<std::thread> callers;
        for (int i = 0; i < 8; ++i) {
            callers.emplace_back([&]() {
                const auto outcome = flights.run("ticker_all", fetch);
                if (!outcome.payload || outcome.payload->as_int64() != 42) {
                    wrong.fetch_add(1);
                }
                if (outcome.shared) {
                    shared.fetch_add(1);
                }
            });
        }
        for (auto& caller : callers) {
            caller.join();
        }

        if (wrong.load() != 0) {
            std::cerr << "Expected every caller to observe the leader's payload\n";
            return 1;
        }
        if (fetches.load() + shared.load() != 8 || fetches.load() >= 8) {
            std::cerr << "Expected concurrent callers to share fetches (fetches=" << fetches.load()
                      << " shared=" << shared.load() << ")\n";
            return 1;
        }
        if (flights.inFlight() != 0) {
            std::cerr << "Expected no flights to remain registered after completion\n";
            return 1;
        }
    }

    {
        core::SingleFlight flights;
        bool threw = false;
        try {
            flights.run("depth_btc_idr", []() -> core::SingleFlight::Payload {
                throw std::runtime_error("upstream down");
            });
        } catch (const std::runtime_error& ex) {
            threw = std::string{ex.what()} == "upstream down";
        }
        if (!threw || flights.inFlight() != 0) {
            std::cerr << "Expected the leader's failure to propagate and release the key\n";
            return 1;
        }

        const auto retry = flights.run("depth_btc_idr", []() {
            return std::make_shared<const boost::json::value>("ok");
        });
        if (!retry.payload || retry.shared) {
            std::cerr << "Expected a fresh flight after a failed one\n";
            return 1;
        }
    }

    return 0;
}
