#pragma once

#include <chrono>
#include <string>

namespace core {

// "2024-01-31T09:15:02.123Z"
std::string toIsoUtc(std::chrono::system_clock::time_point tp);

inline std::string nowIsoUtc() { return toIsoUtc(std::chrono::system_clock::now()); }

}  // namespace core
