#include "core/TimeUtils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace core {

std::string toIsoUtc(std::chrono::system_clock::time_point tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << millis.count() << 'Z';
    return oss.str();
}

}  // namespace core
