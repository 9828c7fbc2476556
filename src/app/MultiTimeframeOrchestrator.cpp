#include "app/MultiTimeframeOrchestrator.hpp"

#include <exception>
#include <utility>

#include <boost/asio/steady_timer.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {
namespace {
using tfsync::common::metrics::Registry;
}

MultiTimeframeOrchestrator::MultiTimeframeOrchestrator(boost::asio::io_context& io,
                                                       std::string symbol,
                                                       const std::vector<domain::TimeframeSpec>& specs,
                                                       domain::IHistoricalFetcher& fetcher,
                                                       domain::ICandleSink* sink,
                                                       std::chrono::milliseconds coalesceDelay)
    : io_(io), symbol_(std::move(symbol)), coalesceDelay_(coalesceDelay) {
    for (const auto& spec : specs) {
        Slot slot;
        slot.spec = spec;
        slot.window = std::make_unique<core::CandleWindow>(spec.windowCapacity);
        slot.reconciler = std::make_unique<core::GapReconciler>(symbol_, spec, *slot.window, fetcher, sink);
        slot.reconciler->setOnAccepted([this](const std::string& timeframe, const domain::Candle& candle) {
            deliver_(timeframe, candle);
        });
        slots_.emplace(spec.timeframe, std::move(slot));
    }
}

MultiTimeframeOrchestrator::~MultiTimeframeOrchestrator() {
    shutdown();
}

void MultiTimeframeOrchestrator::setConsumer(Consumer consumer) {
    std::lock_guard<std::mutex> lock(consumerMutex_);
    consumer_ = std::move(consumer);
}

void MultiTimeframeOrchestrator::seed(const std::string& timeframe, const std::vector<domain::Candle>& candles) {
    const auto* slot = slot_(timeframe);
    if (slot == nullptr) {
        LOG_WARN("Orchestrator " << symbol_ << " cannot seed unknown timeframe " << timeframe);
        return;
    }
    slot->window->loadInitial(candles);
    if (!candles.empty()) {
        slot->reconciler->setInitialLastTimestamp(candles.back().openTs);
    }
    LOG_INFO("Orchestrator " << symbol_ << '/' << timeframe << " seeded with " << slot->window->size()
                             << " candle(s)");
}

void MultiTimeframeOrchestrator::markInitialized() {
    initialized_.store(true, std::memory_order_release);
}

void MultiTimeframeOrchestrator::onClosedCandle(const domain::Candle& candle) {
    if (stopped_.load(std::memory_order_acquire)) {
        return;
    }
    if (candle.symbol != symbol_) {
        LOG_WARN("Orchestrator " << symbol_ << " dropping candle for foreign symbol " << candle.symbol);
        return;
    }
    const auto* slot = slot_(candle.timeframe);
    if (slot == nullptr) {
        LOG_WARN("Orchestrator " << symbol_ << " dropping candle for unknown timeframe " << candle.timeframe);
        return;
    }
    if (!initialized()) {
        Registry::instance().incrementCounter("candles_dropped_total");
        LOG_WARN("Orchestrator " << symbol_ << '/' << candle.timeframe
                                 << " not initialized, dropping open_ts=" << candle.openTs);
        return;
    }

    std::lock_guard<std::mutex> lock(queueMutex_);
    queue_.push(QueueEntry{slot->spec.rank, nextSeq_++, candle.timeframe, candle});
    scheduleDrainLocked_();
}

void MultiTimeframeOrchestrator::scheduleDrainLocked_() {
    if (drainScheduled_ || stopped_.load(std::memory_order_acquire)) {
        return;
    }
    drainScheduled_ = true;

    auto timer = std::make_shared<boost::asio::steady_timer>(io_, coalesceDelay_);
    timer->async_wait([this, timer](const boost::system::error_code& ec) {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            drainScheduled_ = false;
        }
        if (ec || stopped_.load(std::memory_order_acquire)) {
            return;
        }
        drain();
    });
}

void MultiTimeframeOrchestrator::drain() {
    {
        std::unique_lock<std::mutex> drainLock(drainMutex_, std::try_to_lock);
        if (!drainLock.owns_lock()) {
            return;
        }

        while (true) {
            QueueEntry entry;
            {
                std::lock_guard<std::mutex> lock(queueMutex_);
                if (queue_.empty() || stopped_.load(std::memory_order_acquire)) {
                    break;
                }
                entry = queue_.top();
                queue_.pop();
            }

            const auto* slot = slot_(entry.timeframe);
            if (slot == nullptr) {
                continue;
            }
            try {
                slot->reconciler->onCandle(entry.candle);
            } catch (const std::exception& ex) {
                LOG_ERR("Orchestrator " << symbol_ << '/' << entry.timeframe << " failed to process open_ts="
                                        << entry.candle.openTs << ": " << ex.what());
            }
        }
    }

    // Entries queued while another drain held the lock.
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (!queue_.empty()) {
        scheduleDrainLocked_();
    }
}

void MultiTimeframeOrchestrator::shutdown() {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    std::size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        discarded = queue_.size();
        decltype(queue_) empty;
        queue_.swap(empty);
    }
    LOG_INFO("Orchestrator " << symbol_ << " shut down, discarded " << discarded << " queued candle(s)");
}

void MultiTimeframeOrchestrator::deliver_(const std::string& timeframe, const domain::Candle& candle) {
    Consumer consumer;
    {
        std::lock_guard<std::mutex> lock(consumerMutex_);
        consumer = consumer_;
    }
    if (!consumer) {
        return;
    }
    try {
        consumer(symbol_, timeframe, candle);
    } catch (const std::exception& ex) {
        LOG_ERR("Orchestrator " << symbol_ << '/' << timeframe << " consumer failed: " << ex.what());
    }
}

const MultiTimeframeOrchestrator::Slot* MultiTimeframeOrchestrator::slot_(const std::string& timeframe) const {
    if (auto it = slots_.find(timeframe); it != slots_.end()) {
        return &it->second;
    }
    return nullptr;
}

std::vector<domain::TimeframeSpec> MultiTimeframeOrchestrator::specs() const {
    std::vector<domain::TimeframeSpec> specs;
    specs.reserve(slots_.size());
    for (const auto& [tf, slot] : slots_) {
        specs.push_back(slot.spec);
    }
    return specs;
}

core::CandleWindow* MultiTimeframeOrchestrator::window(const std::string& timeframe) const {
    const auto* slot = slot_(timeframe);
    return slot != nullptr ? slot->window.get() : nullptr;
}

core::GapReconciler* MultiTimeframeOrchestrator::reconciler(const std::string& timeframe) const {
    const auto* slot = slot_(timeframe);
    return slot != nullptr ? slot->reconciler.get() : nullptr;
}

std::vector<domain::Candle> MultiTimeframeOrchestrator::candles(const std::string& timeframe, std::size_t n) const {
    const auto* slot = slot_(timeframe);
    return slot != nullptr ? slot->window->lastN(n) : std::vector<domain::Candle>{};
}

std::optional<domain::Candle> MultiTimeframeOrchestrator::latest(const std::string& timeframe) const {
    const auto* slot = slot_(timeframe);
    return slot != nullptr ? slot->window->getLatest() : std::nullopt;
}

MultiTimeframeOrchestrator::Status MultiTimeframeOrchestrator::status() const {
    Status status;
    status.symbol = symbol_;
    status.initialized = initialized();
    status.stopped = stopped_.load(std::memory_order_acquire);
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        status.queued = queue_.size();
    }
    for (const auto& [tf, slot] : slots_) {
        TimeframeStatus entry;
        entry.timeframe = tf;
        entry.rank = slot.spec.rank;
        entry.count = slot.window->size();
        entry.lastTs = slot.reconciler->lastTimestamp();
        entry.state = slot.reconciler->state();
        entry.counters = slot.reconciler->counters();
        status.timeframes.push_back(std::move(entry));
    }
    return status;
}

}  // namespace app
