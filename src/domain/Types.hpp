#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace domain {

using TimestampSec = std::int64_t;

// Closed OHLCV bar. `openTs` is the canonical index, in seconds.
struct Candle {
    std::string symbol;
    std::string timeframe;
    TimestampSec openTs{0};
    TimestampSec closeTs{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
    std::optional<double> quoteVolume{};
    std::optional<std::int64_t> tradeCount{};
    std::optional<double> takerBuyBase{};
    std::optional<double> takerBuyQuote{};
};

struct TimeframeSpec {
    std::string timeframe;
    std::int64_t intervalSeconds{0};
    std::size_t windowCapacity{600};
    // Lower is more urgent.
    int rank{99};
    std::size_t initialCandles{1000};
};

// Inclusive range of missing open timestamps.
struct GapRange {
    TimestampSec firstMissing{0};
    TimestampSec lastMissing{0};
    std::size_t missingCount{0};
};

}  // namespace domain
