#include "domain/CandleValidation.hpp"

#include <cmath>
#include <sstream>

#include "domain/Errors.hpp"
#include "domain/Timeframe.hpp"

namespace domain {
namespace {

std::optional<std::string> ohlcv_violation(const Candle& candle) {
    const double values[] = {candle.open, candle.high, candle.low, candle.close, candle.volume};
    for (const double value : values) {
        if (!std::isfinite(value)) {
            return std::string{"non-finite price or volume"};
        }
    }
    if (candle.low > candle.high) {
        return std::string{"low above high"};
    }
    if (candle.open < candle.low || candle.open > candle.high) {
        return std::string{"open outside [low, high]"};
    }
    if (candle.close < candle.low || candle.close > candle.high) {
        return std::string{"close outside [low, high]"};
    }
    if (candle.volume < 0.0) {
        return std::string{"negative volume"};
    }
    return std::nullopt;
}

}  // namespace

std::optional<std::string> integrity_violation(const Candle& candle,
                                               std::string_view symbol,
                                               std::string_view timeframe,
                                               std::int64_t intervalSeconds) {
    if (candle.symbol != symbol) {
        return "symbol mismatch: got " + candle.symbol + ", expected " + std::string{symbol};
    }
    if (candle.timeframe != timeframe) {
        return "timeframe mismatch: got " + candle.timeframe + ", expected " + std::string{timeframe};
    }
    if (!is_aligned(candle.openTs, intervalSeconds)) {
        std::ostringstream oss;
        oss << "open_ts " << candle.openTs << " not aligned to " << intervalSeconds << "s";
        return oss.str();
    }
    return ohlcv_violation(candle);
}

void require_integrity(const Candle& candle, std::int64_t intervalSeconds) {
    if (auto violation = integrity_violation(candle, candle.symbol, candle.timeframe, intervalSeconds)) {
        throw DataIntegrityError(candle.symbol + "/" + candle.timeframe + ": " + *violation);
    }
}

}  // namespace domain
