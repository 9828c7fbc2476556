#include <iostream>
#include <stdexcept>
#include <string>

#include "adapters/binance/BinanceWsClient.hpp"
#include "adapters/binance/StreamRegistry.hpp"
#include "common/Metrics.hpp"
#include "support/Fakes.hpp"

using adapters::binance::BinanceWsClient;
using adapters::binance::StreamRegistry;
using tfsync::testing::makeCandle;
using tfsync::testing::RecordingHandler;

namespace {

std::string klineEvent(const std::string& symbol, const std::string& tf, long long openMs, bool closed) {
    return "{\"stream\":\"x\",\"data\":{\"e\":\"kline\",\"k\":{\"t\":" + std::to_string(openMs) +
           ",\"T\":" + std::to_string(openMs + 59999) + ",\"s\":\"" + symbol + "\",\"i\":\"" + tf +
           "\",\"o\":\"10\",\"c\":\"10.5\",\"h\":\"11\",\"l\":\"9\",\"v\":\"3\",\"x\":" + (closed ? "true" : "false") +
           "}}}";
}

class ThrowingHandler : public domain::ICandleStreamHandler {
public:
    void onClosedCandle(const domain::Candle&) override { throw std::runtime_error("handler failure"); }
};

}  // namespace

int main() {
    {
        StreamRegistry registry;
        RecordingHandler oneMinute;
        RecordingHandler fiveMinute;
        if (!registry.add("btcusdt", "1m", oneMinute) || !registry.add("BTCUSDT", "5m", fiveMinute)) {
            std::cerr << "Registration failed\n";
            return 1;
        }
        if (registry.add("BTCUSDT", "1m", fiveMinute)) {
            std::cerr << "Duplicate key accepted\n";
            return 1;
        }
        if (registry.size() != 2 || registry.find("BTCUSDT", "1m") != &oneMinute) {
            std::cerr << "Registry lookup mismatch\n";
            return 1;
        }
        if (registry.combinedStreamPath() != "/stream?streams=btcusdt@kline_1m/btcusdt@kline_5m") {
            std::cerr << "Combined stream path mismatch: " << registry.combinedStreamPath() << "\n";
            return 1;
        }
        if (!registry.dispatch(makeCandle("BTCUSDT", "5m", 300, 300))
            || registry.dispatch(makeCandle("ETHUSDT", "5m", 300, 300))) {
            std::cerr << "Dispatch routing mismatch\n";
            return 1;
        }
        if (fiveMinute.received().size() != 1 || !oneMinute.received().empty()) {
            std::cerr << "Candle routed to the wrong handler\n";
            return 1;
        }
    }

    {
        BinanceWsClient client(BinanceWsClient::Options{});
        RecordingHandler btc;
        RecordingHandler eth;
        ThrowingHandler failing;
        if (!client.subscribe("BTCUSDT", "1m", btc) || !client.subscribe("ETHUSDT", "1m", eth)
            || !client.subscribe("SOLUSDT", "1m", failing)) {
            std::cerr << "Subscribe failed\n";
            return 1;
        }
        if (client.subscribe("BTCUSDT", "1m", eth)) {
            std::cerr << "Duplicate subscription accepted\n";
            return 1;
        }
        if (client.state() != domain::StreamState::Idle) {
            std::cerr << "New client must be Idle\n";
            return 1;
        }

        const auto malformedBefore = tfsync::common::metrics::Registry::instance().counter("ws_malformed_total");

        client.handleMessage(klineEvent("BTCUSDT", "1m", 1700000040000LL, false));
        client.handleMessage(klineEvent("BTCUSDT", "1m", 1700000040000LL, true));
        client.handleMessage(klineEvent("ETHUSDT", "1m", 1700000040000LL, true));
        client.handleMessage(klineEvent("XRPUSDT", "1m", 1700000040000LL, true));
        client.handleMessage(klineEvent("SOLUSDT", "1m", 1700000040000LL, true));
        client.handleMessage("{not json");

        const auto btcReceived = btc.received();
        if (btcReceived.size() != 1 || btcReceived[0].openTs != 1700000040 || btcReceived[0].closeTs != 1700000099) {
            std::cerr << "Only the closed BTCUSDT candle must be delivered\n";
            return 1;
        }
        if (eth.received().size() != 1) {
            std::cerr << "ETHUSDT candle not delivered\n";
            return 1;
        }
        if (tfsync::common::metrics::Registry::instance().counter("ws_malformed_total") != malformedBefore + 1) {
            std::cerr << "Malformed message not counted\n";
            return 1;
        }

        client.stop();
        if (client.state() != domain::StreamState::Idle) {
            std::cerr << "Stop without start must leave the client Idle\n";
            return 1;
        }
    }

    return 0;
}
