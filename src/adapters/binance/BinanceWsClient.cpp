#include "adapters/binance/BinanceWsClient.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <random>
#include <sstream>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "adapters/binance/KlineJson.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"

namespace adapters::binance {
namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

using tfsync::common::metrics::Registry;

constexpr std::chrono::milliseconds kStopPoll{200};

domain::TransportError make_error(const std::string& message) {
    return domain::TransportError("BinanceWsClient: " + message);
}

}  // namespace

BinanceWsClient::BinanceWsClient(Options options) : options_(std::move(options)) {}

BinanceWsClient::~BinanceWsClient() {
    stop();
}

bool BinanceWsClient::subscribe(const std::string& symbol,
                                const std::string& timeframe,
                                domain::ICandleStreamHandler& handler) {
    if (running_.load(std::memory_order_acquire)) {
        LOG_WARN("BinanceWsClient subscribe " << symbol << '/' << timeframe << " ignored: stream already running");
        return false;
    }
    if (!registry_.add(symbol, timeframe, handler)) {
        LOG_WARN("BinanceWsClient duplicate subscription " << symbol << '/' << timeframe << " rejected");
        return false;
    }
    LOG_DEBUG("BinanceWsClient subscribed " << kline_stream_name(symbol, timeframe));
    return true;
}

void BinanceWsClient::start() {
    if (registry_.empty()) {
        LOG_WARN("BinanceWsClient start requested without subscriptions");
        return;
    }
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    LOG_INFO("BinanceWsClient starting with " << registry_.size() << " stream(s)");
    worker_ = std::thread(&BinanceWsClient::run_, this);
}

void BinanceWsClient::stop() {
    running_.store(false, std::memory_order_release);

    {
        std::lock_guard<std::mutex> lock(wsMutex_);
        if (activeIoc_ && activeWs_) {
            net::post(*activeIoc_, [ws = activeWs_]() {
                beast::get_lowest_layer(*ws).close();
            });
        }
    }

    if (worker_.joinable()) {
        worker_.join();
    }
    if (state() != domain::StreamState::Disconnected) {
        setState_(domain::StreamState::Idle);
    }
}

domain::StreamState BinanceWsClient::state() const {
    return state_.load(std::memory_order_acquire);
}

void BinanceWsClient::setState_(domain::StreamState state) {
    state_.store(state, std::memory_order_release);
    Registry::instance().setGauge("ws_state", state == domain::StreamState::Connected ? 1.0 : 0.0);
}

void BinanceWsClient::run_() {
    LOG_INFO("BinanceWsClient worker thread starting");

    int attempt = 0;
    while (running_.load(std::memory_order_acquire)) {
        setState_(attempt == 0 ? domain::StreamState::Connecting : domain::StreamState::Reconnecting);

        bool connected = false;
        try {
            session_(connected);
        } catch (const std::exception& ex) {
            LOG_WARN("BinanceWsClient connection error: " << ex.what());
        }

        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
        if (connected) {
            attempt = 0;
        }

        ++attempt;
        if (attempt > options_.maxReconnectAttempts) {
            LOG_ERR("BinanceWsClient giving up after " << options_.maxReconnectAttempts
                                                       << " reconnect attempts");
            setState_(domain::StreamState::Disconnected);
            running_.store(false, std::memory_order_release);
            return;
        }

        setState_(domain::StreamState::Reconnecting);
        Registry::instance().incrementCounter("reconnect_attempts_total");
        const auto waitTime = reconnectDelay_(attempt);
        LOG_INFO("BinanceWsClient reconnect attempt=" << attempt << '/' << options_.maxReconnectAttempts
                                                      << " wait_ms=" << waitTime.count());

        auto waited = std::chrono::milliseconds{0};
        while (waited < waitTime && running_.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(kStopPoll);
            waited += kStopPoll;
        }
    }

    LOG_INFO("BinanceWsClient worker thread stopping");
}

std::chrono::milliseconds BinanceWsClient::reconnectDelay_(int attempt) {
    static thread_local std::mt19937 rng{std::random_device{}()};

    const auto exponent = std::min(attempt - 1, 16);
    auto backoff = options_.backoffBase * (std::int64_t{1} << exponent);
    if (backoff > options_.backoffCap) {
        backoff = options_.backoffCap;
    }
    std::uniform_int_distribution<std::int64_t> jitterDist(0, backoff.count() / 2);
    const auto jitter = std::chrono::milliseconds(jitterDist(rng));
    return std::min<std::chrono::milliseconds>(backoff + jitter, options_.backoffCap);
}

void BinanceWsClient::session_(bool& connected) {
    auto ioc = std::make_shared<net::io_context>();
    ssl::context sslCtx(ssl::context::tls_client);
    sslCtx.set_default_verify_paths();
    sslCtx.set_verify_mode(ssl::verify_peer);

    auto ws = std::make_shared<WsStream>(*ioc, sslCtx);
    ws->next_layer().set_verify_callback(ssl::rfc2818_verification(options_.host));

    if (!::SSL_set_tlsext_host_name(ws->next_layer().native_handle(), options_.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "failed to set SNI host name to '" << options_.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw make_error(oss.str());
    }

    beast::error_code ec;
    net::ip::tcp::resolver resolver(*ioc);
    const auto results = resolver.resolve(options_.host, options_.port, ec);
    if (ec) {
        throw make_error("DNS resolve failed: " + ec.message());
    }
    beast::get_lowest_layer(*ws).connect(results, ec);
    if (ec) {
        throw make_error("connect failed: " + ec.message());
    }
    ws->next_layer().handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw make_error("TLS handshake failed: " + ec.message());
    }

    ws->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "tfsync-kline-stream");
    }));
    const auto target = registry_.combinedStreamPath();
    ws->handshake(options_.host + ":" + options_.port, target, ec);
    if (ec) {
        throw make_error("WebSocket handshake failed: " + ec.message());
    }

    {
        std::lock_guard<std::mutex> lock(wsMutex_);
        activeIoc_ = ioc;
        activeWs_ = ws;
    }
    if (!running_.load(std::memory_order_acquire)) {
        // stop() ran between handshake and registration; nothing will close us.
        beast::get_lowest_layer(*ws).close();
    }

    connected = true;
    lastMessage_.store(std::chrono::steady_clock::now(), std::memory_order_release);
    setState_(domain::StreamState::Connected);
    LOG_INFO("BinanceWsClient connected to " << options_.host << target);

    net::steady_timer pingTimer(*ioc);
    net::steady_timer silenceTimer(*ioc);
    beast::flat_buffer buffer;
    beast::error_code readError;

    const auto closeSocket = [ws]() { beast::get_lowest_layer(*ws).close(); };

    std::function<void()> schedulePing = [&]() {
        pingTimer.expires_after(options_.pingInterval);
        pingTimer.async_wait([&](const beast::error_code& timerEc) {
            if (timerEc || !running_.load(std::memory_order_acquire)) {
                return;
            }
            ws->async_ping(websocket::ping_data{}, [&](const beast::error_code& pingEc) {
                if (pingEc) {
                    if (pingEc != net::error::operation_aborted) {
                        LOG_WARN("BinanceWsClient ping failed: " << pingEc.message());
                        closeSocket();
                    }
                    return;
                }
                schedulePing();
            });
        });
    };

    std::function<void()> scheduleSilenceCheck = [&]() {
        silenceTimer.expires_after(std::chrono::seconds(5));
        silenceTimer.async_wait([&](const beast::error_code& timerEc) {
            if (timerEc) {
                return;
            }
            const auto idle = std::chrono::steady_clock::now() - lastMessage_.load(std::memory_order_acquire);
            if (idle > options_.silenceTimeout) {
                LOG_WARN("BinanceWsClient silence watchdog triggered");
                closeSocket();
                return;
            }
            scheduleSilenceCheck();
        });
    };

    std::function<void()> readNext = [&]() {
        ws->async_read(buffer, [&](const beast::error_code& readEc, std::size_t) {
            if (readEc) {
                readError = readEc;
                pingTimer.cancel();
                silenceTimer.cancel();
                return;
            }
            lastMessage_.store(std::chrono::steady_clock::now(), std::memory_order_release);
            const auto payload = beast::buffers_to_string(buffer.cdata());
            buffer.consume(buffer.size());
            if (!payload.empty()) {
                handleMessage(payload);
            }
            readNext();
        });
    };

    schedulePing();
    scheduleSilenceCheck();
    readNext();
    ioc->run();

    {
        std::lock_guard<std::mutex> lock(wsMutex_);
        activeIoc_.reset();
        activeWs_.reset();
    }

    if (running_.load(std::memory_order_acquire) && readError && readError != websocket::error::closed) {
        throw make_error("read failed: " + readError.message());
    }
    LOG_INFO("BinanceWsClient connection closed");
}

void BinanceWsClient::handleMessage(const std::string& payload) {
    StreamKline kline;
    try {
        kline = parse_stream_kline(payload);
    } catch (const domain::DataIntegrityError& ex) {
        Registry::instance().incrementCounter("ws_malformed_total");
        LOG_WARN("BinanceWsClient dropping malformed message: " << ex.what());
        return;
    }

    if (!kline.closed) {
        return;
    }

    try {
        if (!registry_.dispatch(kline.candle)) {
            LOG_DEBUG("BinanceWsClient no handler for " << kline.candle.symbol << '/' << kline.candle.timeframe);
        }
    } catch (const std::exception& ex) {
        LOG_ERR("BinanceWsClient handler failed for " << kline.candle.symbol << '/' << kline.candle.timeframe
                                                      << ": " << ex.what());
    }
}

}  // namespace adapters::binance
