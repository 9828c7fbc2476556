#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/CandleWindow.hpp"
#include "core/GapReconciler.hpp"
#include "support/Fakes.hpp"

using tfsync::testing::FakeFetcher;
using tfsync::testing::makeCandle;
using tfsync::testing::MemorySink;
using tfsync::testing::timestamps;

namespace {

domain::TimeframeSpec oneMinute() {
    domain::TimeframeSpec spec;
    spec.timeframe = "1m";
    spec.intervalSeconds = 60;
    spec.windowCapacity = 100;
    spec.rank = 1;
    return spec;
}

}  // namespace

int main() {
    const auto spec = oneMinute();

    // Forward jump: both missing boundaries fetched exactly, then the arrival.
    {
        core::CandleWindow window(spec.windowCapacity);
        FakeFetcher fetcher;
        MemorySink sink;
        core::GapReconciler reconciler("BTCUSDT", spec, window, fetcher, &sink);

        std::vector<domain::TimestampSec> delivered;
        reconciler.setOnAccepted([&](const std::string& timeframe, const domain::Candle& candle) {
            if (timeframe == "1m") {
                delivered.push_back(candle.openTs);
            }
        });

        window.loadInitial({makeCandle("BTCUSDT", "1m", 960, 60)});
        reconciler.setInitialLastTimestamp(960);
        if (reconciler.state() != core::SyncState::Synced) {
            std::cerr << "Seeded reconciler must be Synced\n";
            return 1;
        }

        fetcher.add(makeCandle("BTCUSDT", "1m", 1020, 60));
        fetcher.add(makeCandle("BTCUSDT", "1m", 1080, 60));
        reconciler.onCandle(makeCandle("BTCUSDT", "1m", 1140, 60));

        if (fetcher.exactCalls() != std::vector<domain::TimestampSec>{1020, 1080}) {
            std::cerr << "Expected exact fetches at 1020 and 1080, got " << fetcher.exactCalls().size() << "\n";
            return 1;
        }
        if (!fetcher.rangeCalls().empty()) {
            std::cerr << "Range fallback must not run when exact fetches succeed\n";
            return 1;
        }
        if (timestamps(window.getAll()) != std::vector<domain::TimestampSec>{960, 1020, 1080, 1140}) {
            std::cerr << "Window tail mismatch after recovery\n";
            return 1;
        }
        if (delivered != std::vector<domain::TimestampSec>{1020, 1080, 1140}) {
            std::cerr << "Consumer must see recovered candles before the arrival\n";
            return 1;
        }
        if (sink.stored("BTCUSDT", "1m") != std::vector<domain::TimestampSec>{1020, 1080, 1140}) {
            std::cerr << "Accepted candles must be pushed to the sink\n";
            return 1;
        }
        const auto counters = reconciler.counters();
        if (counters.accepted != 3 || counters.recovered != 2 || counters.unrecoverable != 0) {
            std::cerr << "Counter mismatch accepted=" << counters.accepted << " recovered=" << counters.recovered
                      << "\n";
            return 1;
        }
        if (reconciler.state() != core::SyncState::Synced || reconciler.lastTimestamp() != 1140) {
            std::cerr << "Reconciler must return to Synced at 1140\n";
            return 1;
        }
    }

    // Exact miss falls back to one range fetch that is reused for every boundary.
    {
        core::CandleWindow window(spec.windowCapacity);
        FakeFetcher fetcher;
        core::GapReconciler reconciler("BTCUSDT", spec, window, fetcher);
        reconciler.setInitialLastTimestamp(600);

        for (domain::TimestampSec ts = 660; ts <= 840; ts += 60) {
            fetcher.add(makeCandle("BTCUSDT", "1m", ts, 60));
            fetcher.missExact(ts);
        }
        reconciler.onCandle(makeCandle("BTCUSDT", "1m", 900, 60));

        const auto ranges = fetcher.rangeCalls();
        if (ranges.size() != 1) {
            std::cerr << "Expected a single range fetch, got " << ranges.size() << "\n";
            return 1;
        }
        if (ranges[0].start != 660 || ranges[0].end != 840 || ranges[0].limit != 4) {
            std::cerr << "Range fetch must cover exactly the missing boundaries\n";
            return 1;
        }
        if (timestamps(window.getAll()) != std::vector<domain::TimestampSec>{660, 720, 780, 840, 900}) {
            std::cerr << "Range fallback did not fill the gap\n";
            return 1;
        }
    }

    // Partial gap: the first unrecoverable boundary stops the fill, the arrival is still accepted.
    {
        core::CandleWindow window(spec.windowCapacity);
        FakeFetcher fetcher;
        core::GapReconciler reconciler("BTCUSDT", spec, window, fetcher);
        reconciler.setInitialLastTimestamp(0);

        fetcher.add(makeCandle("BTCUSDT", "1m", 60, 60));
        fetcher.add(makeCandle("BTCUSDT", "1m", 180, 60));
        reconciler.onCandle(makeCandle("BTCUSDT", "1m", 240, 60));

        if (fetcher.exactCalls() != std::vector<domain::TimestampSec>{60, 120}) {
            std::cerr << "Recovery must stop at the first unrecoverable boundary\n";
            return 1;
        }
        if (timestamps(window.getAll()) != std::vector<domain::TimestampSec>{60, 240}) {
            std::cerr << "Expected [60, 240] after a partial fill\n";
            return 1;
        }
        const auto counters = reconciler.counters();
        if (counters.unrecoverable != 1 || counters.recovered != 1) {
            std::cerr << "Expected one recovered and one unrecoverable boundary\n";
            return 1;
        }
        if (reconciler.state() != core::SyncState::Synced) {
            std::cerr << "Reconciler must be Synced after a tolerated gap\n";
            return 1;
        }
    }

    // Duplicates and out-of-order arrivals are ignored.
    {
        core::CandleWindow window(spec.windowCapacity);
        FakeFetcher fetcher;
        core::GapReconciler reconciler("BTCUSDT", spec, window, fetcher);
        int calls = 0;
        reconciler.setOnAccepted([&](const std::string&, const domain::Candle&) { ++calls; });

        if (reconciler.state() != core::SyncState::Uninitialized) {
            std::cerr << "New reconciler must be Uninitialized\n";
            return 1;
        }
        reconciler.onCandle(makeCandle("BTCUSDT", "1m", 1200, 60));
        reconciler.onCandle(makeCandle("BTCUSDT", "1m", 1260, 60));
        reconciler.onCandle(makeCandle("BTCUSDT", "1m", 1260, 60));
        reconciler.onCandle(makeCandle("BTCUSDT", "1m", 1200, 60));

        if (window.size() != 2 || calls != 2 || reconciler.counters().rejected != 2) {
            std::cerr << "Re-delivery must be a no-op (size=" << window.size() << ", calls=" << calls << ")\n";
            return 1;
        }
        if (!fetcher.exactCalls().empty()) {
            std::cerr << "Duplicates must not trigger fetches\n";
            return 1;
        }
    }

    // Integrity violations are dropped and counted.
    {
        core::CandleWindow window(spec.windowCapacity);
        FakeFetcher fetcher;
        core::GapReconciler reconciler("BTCUSDT", spec, window, fetcher);
        reconciler.setInitialLastTimestamp(1200);

        reconciler.onCandle(makeCandle("BTCUSDT", "1m", 1290, 60));
        reconciler.onCandle(makeCandle("ETHUSDT", "1m", 1260, 60));
        auto broken = makeCandle("BTCUSDT", "1m", 1260, 60);
        broken.close = broken.high + 5.0;
        reconciler.onCandle(broken);

        if (window.size() != 0 || reconciler.counters().dropped != 3 || reconciler.lastTimestamp() != 1200) {
            std::cerr << "Invalid candles must be dropped without touching state\n";
            return 1;
        }
    }

    // Callback failures do not undo acceptance.
    {
        core::CandleWindow window(spec.windowCapacity);
        FakeFetcher fetcher;
        core::GapReconciler reconciler("BTCUSDT", spec, window, fetcher);
        reconciler.setOnAccepted([](const std::string&, const domain::Candle&) {
            throw std::runtime_error("consumer down");
        });
        reconciler.onCandle(makeCandle("BTCUSDT", "1m", 60, 60));
        reconciler.onCandle(makeCandle("BTCUSDT", "1m", 120, 60));
        if (window.size() != 2 || reconciler.lastTimestamp() != 120) {
            std::cerr << "Consumer exceptions must be contained\n";
            return 1;
        }
    }

    return 0;
}
