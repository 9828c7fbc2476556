#include "common/Log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace tfsync::log {
namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_outputMutex;

constexpr const char* kLevelLabels[] = {"DEBUG", "INFO", "WARN", "ERROR"};

std::ostream& sinkFor(Level level) {
    return (level >= Level::Warn) ? std::cerr : std::cout;
}

std::tm utcTime(std::time_t time) {
    std::tm tm{};
    gmtime_r(&time, &tm);
    return tm;
}

}  // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(getLevel());
}

void log(Level level, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto tm = utcTime(std::chrono::system_clock::to_time_t(now));

    std::ostringstream line;
    line << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
         << millis.count() << "Z " << std::setw(5) << std::setfill(' ') << std::left
         << levelToString(level) << " [" << std::this_thread::get_id() << "] " << message;

    std::lock_guard<std::mutex> lock(g_outputMutex);
    sinkFor(level) << line.str() << '\n' << std::flush;
}

const char* levelToString(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index < (sizeof(kLevelLabels) / sizeof(kLevelLabels[0]))) {
        return kLevelLabels[index];
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (const char ch : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    if (lower == "debug" || lower == "trace") {
        return Level::Debug;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "err" || lower == "error") {
        return Level::Error;
    }

    throw std::invalid_argument("unknown log level: " + std::string{text});
}

}  // namespace tfsync::log
