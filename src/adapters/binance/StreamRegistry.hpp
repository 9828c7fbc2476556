#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include "domain/Ports.hpp"

namespace adapters::binance {

struct StreamKey {
    std::string symbol;
    std::string timeframe;

    bool operator<(const StreamKey& other) const noexcept {
        return std::tie(symbol, timeframe) < std::tie(other.symbol, other.timeframe);
    }
    bool operator==(const StreamKey& other) const noexcept {
        return symbol == other.symbol && timeframe == other.timeframe;
    }
};

// (symbol, timeframe) -> handler table behind the combined kline stream.
// Handlers are not owned and must outlive the registry.
class StreamRegistry {
public:
    // False if the key is already registered.
    bool add(const std::string& symbol, const std::string& timeframe, domain::ICandleStreamHandler& handler);

    domain::ICandleStreamHandler* find(const std::string& symbol, const std::string& timeframe) const;

    // Routes a candle to its handler. False if no handler is registered.
    bool dispatch(const domain::Candle& candle) const;

    std::vector<StreamKey> keys() const;
    std::size_t size() const;
    bool empty() const { return size() == 0; }

    // "/stream?streams=btcusdt@kline_1m/btcusdt@kline_5m"
    std::string combinedStreamPath() const;

private:
    mutable std::mutex mutex_;
    std::map<StreamKey, domain::ICandleStreamHandler*> handlers_;
};

}  // namespace adapters::binance
