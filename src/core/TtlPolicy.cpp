#include "core/TtlPolicy.hpp"

namespace core {

const char* to_string(TtlClass ttlClass) noexcept {
    switch (ttlClass) {
    case TtlClass::Ticker:
        return "ticker";
    case TtlClass::History:
        return "history";
    case TtlClass::Depth:
        return "depth";
    }
    return "ticker";
}

}  // namespace core
