#include <iostream>
#include <vector>

#include "app/GapFiller.hpp"
#include "support/Fakes.hpp"

using tfsync::testing::FakeFetcher;
using tfsync::testing::makeCandle;
using tfsync::testing::makeSeries;
using tfsync::testing::MemorySink;

int main() {
    domain::TimeframeSpec spec;
    spec.timeframe = "1m";
    spec.intervalSeconds = 60;

    {
        FakeFetcher fetcher;
        MemorySink sink;
        sink.seed(makeSeries("BTCUSDT", "1m", 60, 0, 3));
        sink.seed({makeCandle("BTCUSDT", "1m", 600, 60), makeCandle("BTCUSDT", "1m", 1200, 60)});
        fetcher.add(makeSeries("BTCUSDT", "1m", 60, 0, 21));

        app::GapFiller filler(fetcher, sink);
        const auto result = filler.run({"BTCUSDT"}, {spec});
        if (result.pairs.size() != 1 || result.pairs[0].gaps != 2 || result.pairs[0].missing != 16) {
            std::cerr << "Gap scan mismatch\n";
            return 1;
        }
        if (result.totalFilled() != 16 || result.totalRemaining() != 0) {
            std::cerr << "Expected every hole filled, filled=" << result.totalFilled() << "\n";
            return 1;
        }
        if (!sink.findGaps("BTCUSDT", "1m", 60).empty() || sink.stored("BTCUSDT", "1m").size() != 21) {
            std::cerr << "Store still has holes after the fill\n";
            return 1;
        }
        const auto calls = fetcher.rangeCalls();
        if (calls.size() != 2 || calls[0].start != 180 || calls[0].end != 540 || calls[0].limit != 7) {
            std::cerr << "Range fetch must cover exactly the hole\n";
            return 1;
        }
    }

    {
        FakeFetcher fetcher;
        MemorySink sink;
        sink.seed({makeCandle("ETHUSDT", "1m", 0, 60), makeCandle("ETHUSDT", "1m", 300, 60)});
        fetcher.add(makeCandle("ETHUSDT", "1m", 60, 60));
        fetcher.add(makeCandle("ETHUSDT", "1m", 180, 60));

        app::GapFiller filler(fetcher, sink);
        const auto pair = filler.fillPair("ETHUSDT", spec);
        if (pair.gaps != 1 || pair.missing != 4 || pair.filled != 2 || pair.remainingGaps != 1) {
            std::cerr << "Partial fill must be reported as remaining\n";
            return 1;
        }
        if (sink.findGaps("ETHUSDT", "1m", 60).size() != 2 || sink.flushCalls() == 0) {
            std::cerr << "Partial fill must persist what was found\n";
            return 1;
        }
    }

    {
        FakeFetcher fetcher;
        MemorySink sink;
        sink.seed(makeSeries("BTCUSDT", "1m", 60, 0, 5));
        app::GapFiller filler(fetcher, sink);
        const auto pair = filler.fillPair("BTCUSDT", spec);
        if (pair.gaps != 0 || !fetcher.rangeCalls().empty()) {
            std::cerr << "Contiguous series must not fetch\n";
            return 1;
        }
    }

    return 0;
}
