#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "domain/Types.hpp"

namespace domain {

// Returns a description of the first broken invariant, or nullopt if the candle
// belongs to (symbol, timeframe), sits on the interval grid and has sane OHLCV.
std::optional<std::string> integrity_violation(const Candle& candle,
                                               std::string_view symbol,
                                               std::string_view timeframe,
                                               std::int64_t intervalSeconds);

// Throwing variant for decode paths. Raises DataIntegrityError.
void require_integrity(const Candle& candle, std::int64_t intervalSeconds);

}  // namespace domain
