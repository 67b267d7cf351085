#pragma once

#include <algorithm>
#include <chrono>

namespace core {

enum class TtlClass { Ticker, History, Depth };

struct TtlPolicy {
    std::chrono::milliseconds ticker{3000};
    std::chrono::milliseconds history{5000};
    std::chrono::milliseconds depth{2000};

    std::chrono::milliseconds of(TtlClass ttlClass) const noexcept {
        switch (ttlClass) {
        case TtlClass::Ticker:
            return ticker;
        case TtlClass::History:
            return history;
        case TtlClass::Depth:
            return depth;
        }
        return ticker;
    }

    std::chrono::milliseconds longest() const noexcept { return std::max({ticker, history, depth}); }
};

const char* to_string(TtlClass ttlClass) noexcept;

}  // namespace core
