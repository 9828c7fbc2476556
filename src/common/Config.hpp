#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "common/Log.hpp"
#include "domain/Types.hpp"

namespace tfsync::common {

enum class BootstrapMode {
    FreshStart,
    Incremental,
};

const char* to_string(BootstrapMode mode) noexcept;

struct Config {
    tfsync::log::Level logLevel = tfsync::log::Level::Info;

    std::vector<std::string> symbols{"BTCUSDT"};
    std::vector<std::string> timeframes{"1h", "15m", "5m", "1m"};
    std::map<std::string, int> rankOverrides{};
    std::size_t windowSize = 600;
    std::map<std::string, std::size_t> windowSizeOverrides{};
    std::size_t initialCandles = 1000;
    std::map<std::string, std::size_t> initialCandleOverrides{};

    BootstrapMode bootstrapMode = BootstrapMode::Incremental;
    double maxGapHours = 168.0;
    std::string duckdbPath = "data/market.duckdb";

    std::string restHost = "api.binance.com";
    std::string wsHost = "stream.binance.com";
    std::string wsPort = "9443";
    int requestTimeoutSec = 5;
    int restMaxAttempts = 5;
    std::uint32_t restBackoffMs = 1000;
    std::uint32_t restBackoffCapMs = 30000;
    std::uint32_t restPageDelayMs = 120;
    std::size_t restWorkers = 4;

    int wsMaxReconnects = 15;
    std::uint32_t wsBackoffMs = 1000;
    std::uint32_t wsBackoffCapMs = 60000;

    std::uint32_t coalesceMs = 100;
    bool fillGaps = false;

    // Validated per-timeframe settings, slowest timeframe first. Ranks default
    // to that order; overrides must still leave the fastest timeframe last.
    // Throws domain::ConfigurationError.
    std::vector<domain::TimeframeSpec> timeframeSpecs() const;

    static Config fromArgs(int argc, char** argv);
};

}  // namespace tfsync::common
