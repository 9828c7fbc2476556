#include <iostream>
#include <string>

#include "adapters/binance/KlineJson.hpp"
#include "domain/Errors.hpp"

using namespace adapters::binance;

int main() {
    {
        const std::string body =
            "[[1700000040000,\"37000.1\",\"37010.0\",\"36990.5\",\"37005.2\",\"12.5\",1700000099999,"
            "\"462500.0\",321,\"6.25\",\"231250.0\",\"0\"],"
            "[1700000100000,\"37005.2\",\"37020.0\",\"37000.0\",\"37015.0\",\"8\",1700000159999]]";
        const auto candles = parse_rest_klines(body, "BTCUSDT", "1m");
        if (candles.size() != 2) {
            std::cerr << "Expected 2 candles, got " << candles.size() << "\n";
            return 1;
        }
        const auto& first = candles[0];
        if (first.openTs != 1700000040 || first.closeTs != 1700000099 || first.open != 37000.1
            || first.high != 37010.0 || first.low != 36990.5 || first.close != 37005.2 || first.volume != 12.5) {
            std::cerr << "REST row decoded incorrectly\n";
            return 1;
        }
        if (first.quoteVolume != 462500.0 || first.tradeCount != 321 || first.takerBuyBase != 6.25
            || first.takerBuyQuote != 231250.0) {
            std::cerr << "Extended REST fields decoded incorrectly\n";
            return 1;
        }
        if (candles[1].quoteVolume || candles[1].tradeCount || candles[1].symbol != "BTCUSDT") {
            std::cerr << "Short REST row must leave extended fields empty\n";
            return 1;
        }
    }

    for (const char* bad : {"{}", "[[1,2,3]]", "[\"x\"]", "[[1700000040000,\"abc\",\"1\",\"1\",\"1\",\"1\",1]]", "["}) {
        try {
            (void)parse_rest_klines(bad, "BTCUSDT", "1m");
            std::cerr << "Expected DataIntegrityError for " << bad << "\n";
            return 1;
        } catch (const domain::DataIntegrityError&) {
        }
    }

    {
        const std::string payload =
            "{\"stream\":\"btcusdt@kline_1m\",\"data\":{\"e\":\"kline\",\"E\":1700000100001,\"s\":\"BTCUSDT\","
            "\"k\":{\"t\":1700000040000,\"T\":1700000099999,\"s\":\"BTCUSDT\",\"i\":\"1m\",\"o\":\"37000.1\","
            "\"c\":\"37005.2\",\"h\":\"37010.0\",\"l\":\"36990.5\",\"v\":\"12.5\",\"n\":321,\"x\":true,"
            "\"q\":\"462500.0\",\"V\":\"6.25\",\"Q\":\"231250.0\"}}}";
        const auto kline = parse_stream_kline(payload);
        if (!kline.closed || kline.candle.symbol != "BTCUSDT" || kline.candle.timeframe != "1m"
            || kline.candle.openTs != 1700000040 || kline.candle.close != 37005.2
            || kline.candle.tradeCount != 321 || kline.candle.takerBuyQuote != 231250.0) {
            std::cerr << "Combined stream payload decoded incorrectly\n";
            return 1;
        }
    }

    {
        const std::string payload =
            "{\"e\":\"kline\",\"k\":{\"t\":1700000040000,\"T\":1700000099999,\"s\":\"ethusdt\",\"i\":\"5m\","
            "\"o\":\"1\",\"c\":\"1\",\"h\":\"1\",\"l\":\"1\",\"v\":\"0\",\"x\":false}}";
        const auto kline = parse_stream_kline(payload);
        if (kline.closed || kline.candle.symbol != "ETHUSDT" || kline.candle.timeframe != "5m") {
            std::cerr << "Bare kline payload decoded incorrectly\n";
            return 1;
        }
    }

    for (const char* bad : {"not json", "{\"data\":{}}", "{\"k\":{\"x\":\"yes\",\"s\":\"A\",\"i\":\"1m\"}}",
                            "{\"k\":{\"x\":true,\"s\":\"A\",\"i\":\"1m\",\"t\":1}}"}) {
        try {
            (void)parse_stream_kline(bad);
            std::cerr << "Expected DataIntegrityError for " << bad << "\n";
            return 1;
        } catch (const domain::DataIntegrityError&) {
        }
    }

    if (kline_stream_name("BTCUSDT", "15m") != "btcusdt@kline_15m" || normalize_symbol(" btcUsdt ") != "BTCUSDT") {
        std::cerr << "Stream naming mismatch\n";
        return 1;
    }

    return 0;
}
