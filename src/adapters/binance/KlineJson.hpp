#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/json/array.hpp>

#include "domain/Types.hpp"

namespace adapters::binance {

// REST kline row:
// [openMs, open, high, low, close, volume, closeMs, quoteVolume, trades,
//  takerBuyBase, takerBuyQuote, ignore]
domain::Candle candle_from_rest_row(const boost::json::array& row,
                                    const std::string& symbol,
                                    const std::string& timeframe);

// Parses a /api/v3/klines body. Throws domain::DataIntegrityError on malformed input.
std::vector<domain::Candle> parse_rest_klines(std::string_view body,
                                              const std::string& symbol,
                                              const std::string& timeframe);

struct StreamKline {
    domain::Candle candle;
    bool closed{false};
};

// Parses a combined-stream kline event ({"stream": ..., "data": {"k": {...}}})
// or a bare kline event. Throws domain::DataIntegrityError on malformed input.
StreamKline parse_stream_kline(std::string_view payload);

// "BTCUSDT", "1m" -> "btcusdt@kline_1m"
std::string kline_stream_name(const std::string& symbol, const std::string& timeframe);

std::string normalize_symbol(std::string_view symbol);

}  // namespace adapters::binance
