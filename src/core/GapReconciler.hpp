#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "core/CandleWindow.hpp"
#include "domain/Ports.hpp"
#include "domain/Types.hpp"

namespace core {

enum class SyncState {
    Uninitialized,
    Synced,
    Recovering,
};

const char* to_string(SyncState state) noexcept;

// Keeps one (symbol, timeframe) series monotonic and gap-filled. Out-of-order
// and duplicate arrivals are rejected; a forward jump triggers a synchronous
// backfill through the historical fetcher before the arrived candle is accepted.
// A boundary that cannot be recovered is logged and the rest of that gap is
// left open for the offline gap filler.
class GapReconciler {
public:
    using AcceptedCallback = std::function<void(const std::string& timeframe, const domain::Candle& candle)>;

    struct Counters {
        std::uint64_t accepted{0};
        std::uint64_t rejected{0};
        std::uint64_t dropped{0};
        std::uint64_t recovered{0};
        std::uint64_t unrecoverable{0};
    };

    GapReconciler(std::string symbol,
                  domain::TimeframeSpec spec,
                  CandleWindow& window,
                  domain::IHistoricalFetcher& fetcher,
                  domain::ICandleSink* sink = nullptr);

    GapReconciler(const GapReconciler&) = delete;
    GapReconciler& operator=(const GapReconciler&) = delete;

    void setOnAccepted(AcceptedCallback callback);

    // Bootstrap hook: Uninitialized -> Synced.
    void setInitialLastTimestamp(domain::TimestampSec ts);

    void onCandle(const domain::Candle& candle);

    SyncState state() const;
    std::optional<domain::TimestampSec> lastTimestamp() const;
    Counters counters() const;

    const std::string& symbol() const noexcept { return symbol_; }
    const domain::TimeframeSpec& spec() const noexcept { return spec_; }

private:
    void recover_(domain::TimestampSec lastTs, const domain::Candle& arrived);
    bool acceptIfValid_(const domain::Candle& candle, const char* origin);
    void accept_(const domain::Candle& candle);
    std::optional<domain::Candle> fetchExact_(domain::TimestampSec openTs);
    void setState_(SyncState state);

    const std::string symbol_;
    const domain::TimeframeSpec spec_;
    CandleWindow& window_;
    domain::IHistoricalFetcher& fetcher_;
    domain::ICandleSink* sink_;
    AcceptedCallback onAccepted_;

    // Serializes onCandle; stateMutex_ only guards the fields read by observers.
    std::mutex processMutex_;
    mutable std::mutex stateMutex_;
    SyncState state_{SyncState::Uninitialized};
    std::optional<domain::TimestampSec> lastTs_{};

    std::atomic<std::uint64_t> accepted_{0};
    std::atomic<std::uint64_t> rejected_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> recovered_{0};
    std::atomic<std::uint64_t> unrecoverable_{0};
};

}  // namespace core
