#include "core/GapReconciler.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/CandleValidation.hpp"

namespace core {
namespace {
using tfsync::common::metrics::Registry;
}

const char* to_string(SyncState state) noexcept {
    switch (state) {
    case SyncState::Uninitialized:
        return "uninitialized";
    case SyncState::Synced:
        return "synced";
    case SyncState::Recovering:
        return "recovering";
    }
    return "unknown";
}

GapReconciler::GapReconciler(std::string symbol,
                             domain::TimeframeSpec spec,
                             CandleWindow& window,
                             domain::IHistoricalFetcher& fetcher,
                             domain::ICandleSink* sink)
    : symbol_(std::move(symbol)), spec_(std::move(spec)), window_(window), fetcher_(fetcher), sink_(sink) {}

void GapReconciler::setOnAccepted(AcceptedCallback callback) {
    std::lock_guard<std::mutex> lock(processMutex_);
    onAccepted_ = std::move(callback);
}

void GapReconciler::setInitialLastTimestamp(domain::TimestampSec ts) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    lastTs_ = ts;
    state_ = SyncState::Synced;
}

void GapReconciler::onCandle(const domain::Candle& candle) {
    std::lock_guard<std::mutex> process(processMutex_);

    if (auto violation = domain::integrity_violation(candle, symbol_, spec_.timeframe, spec_.intervalSeconds)) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        Registry::instance().incrementCounter("candles_dropped_total");
        LOG_WARN("GapReconciler " << symbol_ << '/' << spec_.timeframe << " dropping candle open_ts="
                                  << candle.openTs << ": " << *violation);
        return;
    }

    const auto lastTs = lastTimestamp();
    const auto step = spec_.intervalSeconds;

    if (!lastTs) {
        accept_(candle);
        return;
    }

    if (candle.openTs <= *lastTs) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        Registry::instance().incrementCounter("candles_rejected_total");
        LOG_DEBUG("GapReconciler " << symbol_ << '/' << spec_.timeframe << " ignoring open_ts=" << candle.openTs
                                   << " (last=" << *lastTs << ")");
        return;
    }

    if (candle.openTs == *lastTs + step) {
        accept_(candle);
        return;
    }

    setState_(SyncState::Recovering);
    recover_(*lastTs, candle);
    accept_(candle);
    setState_(SyncState::Synced);
}

void GapReconciler::recover_(domain::TimestampSec lastTs, const domain::Candle& arrived) {
    const auto step = spec_.intervalSeconds;
    const auto firstMissing = lastTs + step;
    const auto lastMissing = arrived.openTs - step;
    const auto missingCount = static_cast<std::size_t>((lastMissing - firstMissing) / step + 1);

    LOG_INFO("GapReconciler " << symbol_ << '/' << spec_.timeframe << " gap detected: " << missingCount
                              << " candle(s) missing in [" << firstMissing << ", " << lastMissing << "]");

    std::optional<std::vector<domain::Candle>> batch;
    std::size_t filled = 0;

    for (auto boundary = firstMissing; boundary <= lastMissing; boundary += step) {
        auto candle = fetchExact_(boundary);

        if (!candle) {
            if (!batch) {
                try {
                    batch = fetcher_.fetchRange(symbol_, spec_.timeframe, missingCount, firstMissing, lastMissing);
                } catch (const std::exception& ex) {
                    LOG_WARN("GapReconciler " << symbol_ << '/' << spec_.timeframe
                                              << " batch fetch failed: " << ex.what());
                    batch.emplace();
                }
            }
            const auto it = std::find_if(batch->begin(), batch->end(), [boundary](const domain::Candle& c) {
                return c.openTs == boundary;
            });
            if (it != batch->end()) {
                candle = *it;
            }
        }

        if (!candle || !acceptIfValid_(*candle, "backfill")) {
            unrecoverable_.fetch_add(1, std::memory_order_relaxed);
            Registry::instance().incrementCounter("gaps_unrecoverable_total");
            LOG_ERR("GapUnrecoverable " << symbol_ << '/' << spec_.timeframe << " open_ts=" << boundary
                                        << " missing; filled " << filled << " of " << missingCount
                                        << ", leaving [" << boundary << ", " << lastMissing << "] open");
            return;
        }

        ++filled;
        recovered_.fetch_add(1, std::memory_order_relaxed);
        Registry::instance().incrementCounter("gaps_recovered_total");
    }

    LOG_INFO("GapReconciler " << symbol_ << '/' << spec_.timeframe << " gap filled (" << filled << " candle(s))");
}

bool GapReconciler::acceptIfValid_(const domain::Candle& candle, const char* origin) {
    if (auto violation = domain::integrity_violation(candle, symbol_, spec_.timeframe, spec_.intervalSeconds)) {
        LOG_WARN("GapReconciler " << symbol_ << '/' << spec_.timeframe << " discarding " << origin
                                  << " candle open_ts=" << candle.openTs << ": " << *violation);
        return false;
    }
    accept_(candle);
    return true;
}

void GapReconciler::accept_(const domain::Candle& candle) {
    if (!window_.append(candle)) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        Registry::instance().incrementCounter("candles_rejected_total");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        lastTs_ = candle.openTs;
        state_ = state_ == SyncState::Uninitialized ? SyncState::Synced : state_;
    }
    accepted_.fetch_add(1, std::memory_order_relaxed);
    Registry::instance().incrementCounter("candles_accepted_total");

    if (sink_ != nullptr) {
        sink_->appendAsync(candle);
    }

    if (onAccepted_) {
        try {
            onAccepted_(spec_.timeframe, candle);
        } catch (const std::exception& ex) {
            LOG_ERR("GapReconciler " << symbol_ << '/' << spec_.timeframe
                                     << " accepted-candle callback failed: " << ex.what());
        }
    }
}

std::optional<domain::Candle> GapReconciler::fetchExact_(domain::TimestampSec openTs) {
    try {
        return fetcher_.fetchExact(symbol_, spec_.timeframe, openTs);
    } catch (const std::exception& ex) {
        LOG_WARN("GapReconciler " << symbol_ << '/' << spec_.timeframe << " exact fetch open_ts=" << openTs
                                  << " failed: " << ex.what());
    }
    return std::nullopt;
}

void GapReconciler::setState_(SyncState state) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    state_ = state;
}

SyncState GapReconciler::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

std::optional<domain::TimestampSec> GapReconciler::lastTimestamp() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastTs_;
}

GapReconciler::Counters GapReconciler::counters() const {
    Counters counters;
    counters.accepted = accepted_.load(std::memory_order_relaxed);
    counters.rejected = rejected_.load(std::memory_order_relaxed);
    counters.dropped = dropped_.load(std::memory_order_relaxed);
    counters.recovered = recovered_.load(std::memory_order_relaxed);
    counters.unrecoverable = unrecoverable_.load(std::memory_order_relaxed);
    return counters;
}

}  // namespace core
