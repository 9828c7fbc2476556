#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "adapters/binance/StreamRegistry.hpp"
#include "domain/Ports.hpp"

namespace adapters::binance {

// Combined kline stream for every registered (symbol, timeframe). Only closed
// candles are delivered. Dropped connections are retried with exponential
// backoff plus jitter; after `maxReconnectAttempts` consecutive failures the
// client gives up and reports Disconnected.
class BinanceWsClient : public domain::IStreamSubscriber {
public:
    struct Options {
        std::string host = "stream.binance.com";
        std::string port = "9443";
        int maxReconnectAttempts = 15;
        std::chrono::milliseconds backoffBase{1000};
        std::chrono::milliseconds backoffCap{60000};
        std::chrono::seconds pingInterval{30};
        // Reconnect if nothing arrives for this long.
        std::chrono::seconds silenceTimeout{90};
    };

    explicit BinanceWsClient(Options options);
    ~BinanceWsClient() override;

    BinanceWsClient(const BinanceWsClient&) = delete;
    BinanceWsClient& operator=(const BinanceWsClient&) = delete;

    bool subscribe(const std::string& symbol,
                   const std::string& timeframe,
                   domain::ICandleStreamHandler& handler) override;
    void start() override;
    void stop() override;
    domain::StreamState state() const override;

    // Decodes one stream payload and routes it. Public so message handling can
    // be exercised without a socket.
    void handleMessage(const std::string& payload);

private:
    using WsStream = boost::beast::websocket::stream<boost::asio::ssl::stream<boost::beast::tcp_stream>>;

    void run_();
    void session_(bool& connected);
    std::chrono::milliseconds reconnectDelay_(int attempt);
    void setState_(domain::StreamState state);

    const Options options_;
    StreamRegistry registry_;

    std::atomic<bool> running_{false};
    std::atomic<domain::StreamState> state_{domain::StreamState::Idle};
    std::atomic<std::chrono::steady_clock::time_point> lastMessage_{std::chrono::steady_clock::now()};
    std::thread worker_;

    std::mutex wsMutex_;
    std::shared_ptr<boost::asio::io_context> activeIoc_;
    std::shared_ptr<WsStream> activeWs_;
};

}  // namespace adapters::binance
