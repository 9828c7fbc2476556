#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/Types.hpp"

namespace domain {

class IHistoricalFetcher {
public:
    virtual ~IHistoricalFetcher() = default;

    // Ordered, deduplicated candles. `start`/`end` are inclusive open-time bounds.
    // Without `start` the newest `limit` candles up to `end` are returned.
    // Exhausted retries yield an empty vector.
    virtual std::vector<Candle> fetchRange(const std::string& symbol,
                                           const std::string& timeframe,
                                           std::size_t limit,
                                           std::optional<TimestampSec> start = std::nullopt,
                                           std::optional<TimestampSec> end = std::nullopt) = 0;

    virtual std::optional<Candle> fetchExact(const std::string& symbol,
                                             const std::string& timeframe,
                                             TimestampSec openTs) = 0;
};

class ICandleStreamHandler {
public:
    virtual ~ICandleStreamHandler() = default;

    virtual void onClosedCandle(const Candle& candle) = 0;
};

enum class StreamState {
    Idle,
    Connecting,
    Connected,
    Reconnecting,
    Disconnected,
};

const char* to_string(StreamState state) noexcept;

class IStreamSubscriber {
public:
    virtual ~IStreamSubscriber() = default;

    // One handler per (symbol, timeframe). Returns false if the key is taken or
    // the subscriber is already running.
    virtual bool subscribe(const std::string& symbol,
                           const std::string& timeframe,
                           ICandleStreamHandler& handler) = 0;
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual StreamState state() const = 0;
};

// Best-effort persistence target. Implementations log and count failures and
// never throw from the async entry points.
class ICandleSink {
public:
    virtual ~ICandleSink() = default;

    virtual void appendAsync(const Candle& candle) = 0;
    virtual void appendBatchAsync(std::vector<Candle> candles) = 0;

    // Blocks until every write queued before the call has been attempted.
    virtual void flush() = 0;
    // Drains pending writes and stops accepting new ones. Idempotent.
    virtual void shutdown() = 0;

    virtual std::optional<Candle> getLastPersisted(const std::string& symbol,
                                                   const std::string& timeframe) = 0;
    virtual std::vector<Candle> loadRecent(const std::string& symbol,
                                           const std::string& timeframe,
                                           std::size_t limit) = 0;
    virtual bool deleteSeries(const std::string& symbol, const std::string& timeframe) = 0;

    virtual std::vector<GapRange> findGaps(const std::string& symbol,
                                           const std::string& timeframe,
                                           std::int64_t intervalSeconds) {
        (void)symbol;
        (void)timeframe;
        (void)intervalSeconds;
        return {};
    }
};

}  // namespace domain
