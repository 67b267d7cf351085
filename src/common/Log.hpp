#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace igp::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

enum class Category : int {
    NET = 0,
    CACHE = 1,
    API = 2,
    SYS = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, Category category, const std::string& message);
const char* levelToString(Level level) noexcept;
const char* categoryToString(Category category) noexcept;
Level levelFromString(std::string_view text);

}  // namespace igp::log

#define IGP_LOG_IMPL(level, category, expr)                                                \
    do {                                                                                   \
        if (::igp::log::shouldLog(level)) {                                                \
            std::ostringstream igp_log_stream__;                                           \
            igp_log_stream__ << expr;                                                      \
            ::igp::log::log(level, ::igp::log::Category::category, igp_log_stream__.str()); \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(category, expr) IGP_LOG_IMPL(::igp::log::Level::Debug, category, expr)
#define LOG_INFO(category, expr) IGP_LOG_IMPL(::igp::log::Level::Info, category, expr)
#define LOG_WARN(category, expr) IGP_LOG_IMPL(::igp::log::Level::Warn, category, expr)
#define LOG_ERR(category, expr) IGP_LOG_IMPL(::igp::log::Level::Error, category, expr)
