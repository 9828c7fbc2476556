#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "core/CandleWindow.hpp"
#include "core/GapReconciler.hpp"
#include "domain/Ports.hpp"
#include "domain/Types.hpp"

namespace app {

// Owns the per-timeframe window/reconciler pairs of one symbol. Stream
// arrivals are queued by timeframe rank and drained on `io` after a short
// coalescing delay, so slower timeframes arriving together with faster ones
// are reconciled first.
//
// Drains run as handlers on `io`; the context must have stopped running them
// before the orchestrator is destroyed.
class MultiTimeframeOrchestrator : public domain::ICandleStreamHandler {
public:
    using Consumer =
        std::function<void(const std::string& symbol, const std::string& timeframe, const domain::Candle& candle)>;

    struct TimeframeStatus {
        std::string timeframe;
        int rank{0};
        std::size_t count{0};
        std::optional<domain::TimestampSec> lastTs{};
        core::SyncState state{core::SyncState::Uninitialized};
        core::GapReconciler::Counters counters{};
    };

    struct Status {
        std::string symbol;
        bool initialized{false};
        bool stopped{false};
        std::size_t queued{0};
        std::vector<TimeframeStatus> timeframes;
    };

    MultiTimeframeOrchestrator(boost::asio::io_context& io,
                               std::string symbol,
                               const std::vector<domain::TimeframeSpec>& specs,
                               domain::IHistoricalFetcher& fetcher,
                               domain::ICandleSink* sink,
                               std::chrono::milliseconds coalesceDelay = std::chrono::milliseconds(100));
    ~MultiTimeframeOrchestrator() override;

    MultiTimeframeOrchestrator(const MultiTimeframeOrchestrator&) = delete;
    MultiTimeframeOrchestrator& operator=(const MultiTimeframeOrchestrator&) = delete;

    void setConsumer(Consumer consumer);

    // Loads an ascending history into the window and starts the reconciler
    // from its newest candle.
    void seed(const std::string& timeframe, const std::vector<domain::Candle>& candles);

    // Arrivals before this call are dropped.
    void markInitialized();
    bool initialized() const noexcept { return initialized_.load(std::memory_order_acquire); }

    void onClosedCandle(const domain::Candle& candle) override;

    // Routes every queued entry in rank order. A drain already in progress
    // makes this a no-op.
    void drain();

    // Stops accepting arrivals and discards anything still queued.
    void shutdown();

    const std::string& symbol() const noexcept { return symbol_; }
    std::vector<domain::TimeframeSpec> specs() const;
    core::CandleWindow* window(const std::string& timeframe) const;
    core::GapReconciler* reconciler(const std::string& timeframe) const;
    std::vector<domain::Candle> candles(const std::string& timeframe, std::size_t n) const;
    std::optional<domain::Candle> latest(const std::string& timeframe) const;
    Status status() const;

private:
    struct Slot {
        domain::TimeframeSpec spec;
        std::unique_ptr<core::CandleWindow> window;
        std::unique_ptr<core::GapReconciler> reconciler;
    };

    struct QueueEntry {
        int rank{0};
        std::uint64_t seq{0};
        std::string timeframe;
        domain::Candle candle;
    };

    // Top of the heap: lowest rank, then earliest arrival.
    struct QueueOrder {
        bool operator()(const QueueEntry& lhs, const QueueEntry& rhs) const noexcept {
            if (lhs.rank != rhs.rank) {
                return lhs.rank > rhs.rank;
            }
            return lhs.seq > rhs.seq;
        }
    };

    const Slot* slot_(const std::string& timeframe) const;
    void scheduleDrainLocked_();
    void deliver_(const std::string& timeframe, const domain::Candle& candle);

    boost::asio::io_context& io_;
    const std::string symbol_;
    const std::chrono::milliseconds coalesceDelay_;
    std::map<std::string, Slot> slots_;

    mutable std::mutex queueMutex_;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, QueueOrder> queue_;
    std::uint64_t nextSeq_{0};
    bool drainScheduled_{false};

    std::mutex drainMutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> stopped_{false};

    std::mutex consumerMutex_;
    Consumer consumer_;
};

}  // namespace app
