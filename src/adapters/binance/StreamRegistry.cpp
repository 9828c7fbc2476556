#include "adapters/binance/StreamRegistry.hpp"

#include <sstream>

#include "adapters/binance/KlineJson.hpp"

namespace adapters::binance {

bool StreamRegistry::add(const std::string& symbol,
                         const std::string& timeframe,
                         domain::ICandleStreamHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.emplace(StreamKey{normalize_symbol(symbol), timeframe}, &handler).second;
}

domain::ICandleStreamHandler* StreamRegistry::find(const std::string& symbol, const std::string& timeframe) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = handlers_.find(StreamKey{symbol, timeframe}); it != handlers_.end()) {
        return it->second;
    }
    return nullptr;
}

bool StreamRegistry::dispatch(const domain::Candle& candle) const {
    auto* handler = find(candle.symbol, candle.timeframe);
    if (handler == nullptr) {
        return false;
    }
    handler->onClosedCandle(candle);
    return true;
}

std::vector<StreamKey> StreamRegistry::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StreamKey> keys;
    keys.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        keys.push_back(entry.first);
    }
    return keys;
}

std::size_t StreamRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

std::string StreamRegistry::combinedStreamPath() const {
    std::ostringstream oss;
    oss << "/stream?streams=";
    bool first = true;
    for (const auto& key : keys()) {
        if (!first) {
            oss << '/';
        }
        first = false;
        oss << kline_stream_name(key.symbol, key.timeframe);
    }
    return oss.str();
}

}  // namespace adapters::binance
