#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "domain/Types.hpp"

namespace core {

// Bounded, strictly time-ordered candle store for one (symbol, timeframe).
// Oldest entries are evicted first once capacity is reached.
class CandleWindow {
public:
    explicit CandleWindow(std::size_t capacity);

    CandleWindow(const CandleWindow&) = delete;
    CandleWindow& operator=(const CandleWindow&) = delete;

    // Rejects (returns false) anything not newer than the current tail.
    bool append(const domain::Candle& candle);

    // Replaces the contents with the newest `capacity` entries of an ascending
    // sequence. Order is the caller's responsibility.
    void loadInitial(const std::vector<domain::Candle>& ordered);

    std::vector<domain::Candle> getAll() const;
    std::vector<domain::Candle> lastN(std::size_t n) const;
    std::optional<domain::Candle> getLatest() const;
    std::optional<domain::TimestampSec> lastTimestamp() const;
    std::optional<domain::TimestampSec> firstTimestamp() const;

    // True if any two neighbours are not exactly `step` seconds apart.
    bool hasGap(std::int64_t step) const;

    std::size_t size() const;
    std::size_t capacity() const noexcept { return capacity_; }
    std::uint64_t rejectedCount() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<domain::Candle> candles_;
    std::uint64_t rejected_{0};
};

}  // namespace core
