#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "domain/Types.hpp"

namespace domain {

// Interval length for a timeframe label such as "1m", "15m", "4h", "1d", "1w".
// Throws ConfigurationError for anything else.
std::int64_t timeframe_seconds(std::string_view label);

std::string timeframe_label(std::int64_t intervalSeconds);

inline bool is_aligned(TimestampSec ts, std::int64_t intervalSeconds) noexcept {
    return intervalSeconds > 0 && ts % intervalSeconds == 0;
}

inline TimestampSec align_down(TimestampSec ts, std::int64_t intervalSeconds) noexcept {
    if (intervalSeconds <= 0) {
        return ts;
    }
    const auto rem = ts % intervalSeconds;
    return rem < 0 ? ts - rem - intervalSeconds : ts - rem;
}

// Open timestamp of the most recent candle that is fully closed at `nowSec`.
inline TimestampSec last_closed_open(TimestampSec nowSec, std::int64_t intervalSeconds) noexcept {
    return align_down(nowSec, intervalSeconds) - intervalSeconds;
}

}  // namespace domain
