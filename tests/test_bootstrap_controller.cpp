#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "app/BootstrapController.hpp"
#include "app/MultiTimeframeOrchestrator.hpp"
#include "support/Fakes.hpp"

using app::BootstrapController;
using tfsync::common::BootstrapMode;
using tfsync::testing::FakeFetcher;
using tfsync::testing::makeSeries;
using tfsync::testing::MemorySink;

namespace {

// Last closed 1m candle opens at 59940.
constexpr domain::TimestampSec kNow = 60'030;
constexpr domain::TimestampSec kBoundary = 59'940;

std::vector<domain::TimeframeSpec> oneMinute() {
    domain::TimeframeSpec spec;
    spec.timeframe = "1m";
    spec.intervalSeconds = 60;
    spec.windowCapacity = 5;
    spec.rank = 1;
    spec.initialCandles = 10;
    return {spec};
}

BootstrapController::Options options(BootstrapMode mode, double maxGapHours) {
    BootstrapController::Options opts;
    opts.mode = mode;
    opts.maxGapHours = maxGapHours;
    opts.workers = 2;
    return opts;
}

BootstrapController::NowSource fixedNow() {
    return [] { return kNow; };
}

}  // namespace

int main() {
    using namespace std::chrono_literals;
    const auto specs = oneMinute();
    const auto& spec = specs.front();

    // Store already at the boundary: nothing to fetch.
    {
        boost::asio::io_context io;
        FakeFetcher fetcher;
        MemorySink sink;
        sink.seed(makeSeries("BTCUSDT", "1m", 60, kBoundary - 19 * 60, 20));
        app::MultiTimeframeOrchestrator orchestrator(io, "BTCUSDT", specs, fetcher, &sink, 1ms);
        BootstrapController controller(options(BootstrapMode::Incremental, 168.0), fetcher, sink, fixedNow());

        const auto pair = controller.bootstrapPair(orchestrator, spec);
        if (pair.action != BootstrapController::Action::UpToDate || !fetcher.rangeCalls().empty()) {
            std::cerr << "Gap of zero must not fetch (action=" << app::to_string(pair.action) << ")\n";
            return 1;
        }
        if (orchestrator.window("1m")->size() != 5 || orchestrator.reconciler("1m")->lastTimestamp() != kBoundary) {
            std::cerr << "Window must be seeded with the newest persisted candles\n";
            return 1;
        }
        if (orchestrator.reconciler("1m")->state() != core::SyncState::Synced) {
            std::cerr << "Seeded reconciler must be Synced\n";
            return 1;
        }
    }

    // Small gap: only the missing range is fetched and persisted.
    {
        boost::asio::io_context io;
        FakeFetcher fetcher;
        MemorySink sink;
        const domain::TimestampSec last = kBoundary - 10 * 60;
        sink.seed(makeSeries("BTCUSDT", "1m", 60, last - 4 * 60, 5));
        fetcher.add(makeSeries("BTCUSDT", "1m", 60, last - 4 * 60, 16));
        app::MultiTimeframeOrchestrator orchestrator(io, "BTCUSDT", specs, fetcher, &sink, 1ms);
        BootstrapController controller(options(BootstrapMode::Incremental, 1.0), fetcher, sink, fixedNow());

        const auto pair = controller.bootstrapPair(orchestrator, spec);
        const auto calls = fetcher.rangeCalls();
        if (pair.action != BootstrapController::Action::GapFetched || calls.size() != 1) {
            std::cerr << "Expected one gap fetch (action=" << app::to_string(pair.action) << ")\n";
            return 1;
        }
        if (calls[0].limit != 10 || calls[0].start != last + 60 || calls[0].end != kBoundary) {
            std::cerr << "Gap fetch must be sized to the missing count, limit=" << calls[0].limit << "\n";
            return 1;
        }
        if (pair.gapCandles != 10 || pair.fetched != 10 || sink.stored("BTCUSDT", "1m").back() != kBoundary) {
            std::cerr << "Missing range not persisted\n";
            return 1;
        }
        if (!sink.deleted().empty() || sink.flushCalls() == 0) {
            std::cerr << "Gap fill must not delete and must flush\n";
            return 1;
        }
        if (orchestrator.reconciler("1m")->lastTimestamp() != kBoundary) {
            std::cerr << "Reconciler not seeded at the boundary\n";
            return 1;
        }
    }

    // Gap above the limit: delete and reload the initial count.
    {
        boost::asio::io_context io;
        FakeFetcher fetcher;
        MemorySink sink;
        sink.seed(makeSeries("BTCUSDT", "1m", 60, 0, 3));
        fetcher.add(makeSeries("BTCUSDT", "1m", 60, kBoundary - 29 * 60, 30));
        app::MultiTimeframeOrchestrator orchestrator(io, "BTCUSDT", specs, fetcher, &sink, 1ms);
        BootstrapController controller(options(BootstrapMode::Incremental, 1.0), fetcher, sink, fixedNow());

        const auto pair = controller.bootstrapPair(orchestrator, spec);
        const auto calls = fetcher.rangeCalls();
        if (pair.action != BootstrapController::Action::Reloaded || sink.deleted().size() != 1) {
            std::cerr << "Large gap must delete the series (action=" << app::to_string(pair.action) << ")\n";
            return 1;
        }
        if (calls.size() != 1 || calls[0].limit != spec.initialCandles || calls[0].start.has_value()) {
            std::cerr << "Reload must fetch the initial count\n";
            return 1;
        }
        const auto stored = sink.stored("BTCUSDT", "1m");
        if (stored.size() != spec.initialCandles || stored.front() != kBoundary - 9 * 60) {
            std::cerr << "Reload must replace the stale series, stored=" << stored.size() << "\n";
            return 1;
        }
    }

    // Fresh start always deletes first; an empty store behaves the same without the delete.
    {
        boost::asio::io_context io;
        FakeFetcher fetcher;
        MemorySink sink;
        sink.seed(makeSeries("BTCUSDT", "1m", 60, kBoundary - 60, 2));
        fetcher.add(makeSeries("BTCUSDT", "1m", 60, kBoundary - 29 * 60, 30));
        app::MultiTimeframeOrchestrator orchestrator(io, "BTCUSDT", specs, fetcher, &sink, 1ms);
        BootstrapController controller(options(BootstrapMode::FreshStart, 168.0), fetcher, sink, fixedNow());

        const auto pair = controller.bootstrapPair(orchestrator, spec);
        if (pair.action != BootstrapController::Action::FreshLoad || sink.deleted().size() != 1
            || pair.fetched != spec.initialCandles) {
            std::cerr << "Fresh start mismatch\n";
            return 1;
        }

        FakeFetcher emptyStoreFetcher;
        MemorySink emptySink;
        emptyStoreFetcher.add(makeSeries("BTCUSDT", "1m", 60, kBoundary - 29 * 60, 30));
        app::MultiTimeframeOrchestrator other(io, "BTCUSDT", specs, emptyStoreFetcher, &emptySink, 1ms);
        BootstrapController incremental(options(BootstrapMode::Incremental, 168.0), emptyStoreFetcher, emptySink,
                                        fixedNow());
        const auto fresh = incremental.bootstrapPair(other, spec);
        if (fresh.action != BootstrapController::Action::FreshLoad || !emptySink.deleted().empty()) {
            std::cerr << "Empty store must fall back to a fresh load\n";
            return 1;
        }
    }

    // Store reads fail after the fetch: seed from the fetched tail.
    {
        boost::asio::io_context io;
        FakeFetcher fetcher;
        MemorySink sink;
        sink.setBlindReads(true);
        fetcher.add(makeSeries("BTCUSDT", "1m", 60, kBoundary - 29 * 60, 30));
        app::MultiTimeframeOrchestrator orchestrator(io, "BTCUSDT", specs, fetcher, &sink, 1ms);
        BootstrapController controller(options(BootstrapMode::Incremental, 168.0), fetcher, sink, fixedNow());

        const auto pair = controller.bootstrapPair(orchestrator, spec);
        if (!pair.ok() || pair.seeded != spec.windowCapacity
            || orchestrator.window("1m")->lastTimestamp() != kBoundary) {
            std::cerr << "Fetched tail must seed the window when the store is empty\n";
            return 1;
        }
    }

    // One symbol with data, one without: overall success, per-pair failure reported.
    {
        boost::asio::io_context io;
        FakeFetcher fetcher;
        MemorySink sink;
        fetcher.add(makeSeries("BTCUSDT", "1m", 60, kBoundary - 29 * 60, 30));
        app::MultiTimeframeOrchestrator btc(io, "BTCUSDT", specs, fetcher, &sink, 1ms);
        app::MultiTimeframeOrchestrator eth(io, "ETHUSDT", specs, fetcher, &sink, 1ms);
        BootstrapController controller(options(BootstrapMode::Incremental, 168.0), fetcher, sink, fixedNow());

        const auto report = controller.run({&btc, &eth});
        if (report.pairs.size() != 2 || report.succeeded() != 1 || report.failed() != 1 || !report.success()) {
            std::cerr << "Report mismatch ok=" << report.succeeded() << " failed=" << report.failed() << "\n";
            return 1;
        }
        if (report.pairs[0].symbol != "BTCUSDT" || !report.pairs[0].ok() || report.pairs[1].ok()) {
            std::cerr << "Per-pair outcome mismatch\n";
            return 1;
        }

        const auto none = controller.run({&eth});
        if (none.success()) {
            std::cerr << "Zero bootstrapped pairs must be a failure\n";
            return 1;
        }
    }

    return 0;
}
