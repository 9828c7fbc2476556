#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace tfsync::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

}  // namespace tfsync::log

#define TFSYNC_LOG_IMPL(level, expr)                                                       \
    do {                                                                                   \
        if (::tfsync::log::shouldLog(level)) {                                             \
            std::ostringstream tfsync_log_stream__;                                        \
            tfsync_log_stream__ << expr;                                                   \
            ::tfsync::log::log(level, tfsync_log_stream__.str());                          \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) TFSYNC_LOG_IMPL(::tfsync::log::Level::Debug, expr)
#define LOG_INFO(expr) TFSYNC_LOG_IMPL(::tfsync::log::Level::Info, expr)
#define LOG_WARN(expr) TFSYNC_LOG_IMPL(::tfsync::log::Level::Warn, expr)
#define LOG_ERR(expr) TFSYNC_LOG_IMPL(::tfsync::log::Level::Error, expr)
