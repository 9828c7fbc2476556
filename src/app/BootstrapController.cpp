#include "app/BootstrapController.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <mutex>
#include <tuple>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "app/MultiTimeframeOrchestrator.hpp"
#include "common/Log.hpp"
#include "domain/CandleValidation.hpp"
#include "domain/Timeframe.hpp"

namespace app {
namespace {

domain::TimestampSec systemNowSec() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::vector<domain::Candle> tail(const std::vector<domain::Candle>& candles, std::size_t n) {
    if (candles.size() <= n) {
        return candles;
    }
    return std::vector<domain::Candle>(candles.end() - static_cast<std::ptrdiff_t>(n), candles.end());
}

}  // namespace

const char* to_string(BootstrapController::Action action) noexcept {
    switch (action) {
    case BootstrapController::Action::UpToDate:
        return "up_to_date";
    case BootstrapController::Action::GapFetched:
        return "gap_fetched";
    case BootstrapController::Action::Reloaded:
        return "reloaded";
    case BootstrapController::Action::FreshLoad:
        return "fresh_load";
    case BootstrapController::Action::Failed:
        return "failed";
    }
    return "unknown";
}

std::size_t BootstrapController::Report::succeeded() const {
    return static_cast<std::size_t>(
        std::count_if(pairs.begin(), pairs.end(), [](const PairReport& pair) { return pair.ok(); }));
}

std::size_t BootstrapController::Report::failed() const {
    return pairs.size() - succeeded();
}

BootstrapController::BootstrapController(Options options,
                                         domain::IHistoricalFetcher& fetcher,
                                         domain::ICandleSink& sink,
                                         NowSource now)
    : options_(std::move(options)), fetcher_(fetcher), sink_(sink), now_(std::move(now)) {
    if (!now_) {
        now_ = systemNowSec;
    }
    if (options_.workers == 0) {
        options_.workers = 1;
    }
}

BootstrapController::Report BootstrapController::run(const std::vector<MultiTimeframeOrchestrator*>& orchestrators) {
    LOG_INFO("Bootstrap starting mode=" << tfsync::common::to_string(options_.mode)
                                        << " symbols=" << orchestrators.size()
                                        << " max_gap_hours=" << options_.maxGapHours);

    std::mutex reportMutex;
    Report report;

    boost::asio::thread_pool pool(std::min(options_.workers, std::max<std::size_t>(orchestrators.size(), 1)));
    for (auto* orchestrator : orchestrators) {
        if (orchestrator == nullptr) {
            continue;
        }
        boost::asio::post(pool, [this, orchestrator, &reportMutex, &report] {
            for (const auto& spec : orchestrator->specs()) {
                auto pair = bootstrapPair(*orchestrator, spec);
                std::lock_guard<std::mutex> lock(reportMutex);
                report.pairs.push_back(std::move(pair));
            }
        });
    }
    pool.join();

    std::sort(report.pairs.begin(), report.pairs.end(), [](const PairReport& lhs, const PairReport& rhs) {
        return std::tie(lhs.symbol, lhs.timeframe) < std::tie(rhs.symbol, rhs.timeframe);
    });

    if (report.success()) {
        LOG_INFO("Bootstrap finished ok=" << report.succeeded() << " failed=" << report.failed());
    } else {
        LOG_ERR("Bootstrap failed for every pair (" << report.pairs.size() << ")");
    }
    return report;
}

BootstrapController::PairReport BootstrapController::bootstrapPair(MultiTimeframeOrchestrator& orchestrator,
                                                                   const domain::TimeframeSpec& spec) {
    PairReport pair;
    pair.symbol = orchestrator.symbol();
    pair.timeframe = spec.timeframe;

    try {
        const auto interval = spec.intervalSeconds;
        const auto boundary = domain::last_closed_open(now_(), interval);
        std::vector<domain::Candle> fetched;

        std::optional<domain::Candle> last;
        if (options_.mode == tfsync::common::BootstrapMode::Incremental) {
            last = sink_.getLastPersisted(pair.symbol, spec.timeframe);
        }

        if (!last) {
            if (options_.mode == tfsync::common::BootstrapMode::FreshStart
                && !sink_.deleteSeries(pair.symbol, spec.timeframe)) {
                LOG_WARN("Bootstrap " << pair.symbol << '/' << spec.timeframe << " could not clear persisted series");
            }
            fetched = fetchAndPersist_(pair.symbol, spec, spec.initialCandles, std::nullopt, boundary);
            pair.action = Action::FreshLoad;
        } else {
            const auto gap = std::max<domain::TimestampSec>(0, (boundary - last->openTs) / interval);
            const double gapHours = static_cast<double>(gap) * static_cast<double>(interval) / 3600.0;
            pair.gapCandles = static_cast<std::size_t>(gap);

            if (gap == 0) {
                pair.action = Action::UpToDate;
            } else if (gapHours <= options_.maxGapHours) {
                LOG_INFO("Bootstrap " << pair.symbol << '/' << spec.timeframe << " gap of " << gap
                                      << " candle(s) (" << gapHours << "h), fetching missing range");
                fetched = fetchAndPersist_(pair.symbol, spec, pair.gapCandles, last->openTs + interval, boundary);
                pair.action = Action::GapFetched;
            } else {
                LOG_WARN("Bootstrap " << pair.symbol << '/' << spec.timeframe << " gap of " << gapHours
                                      << "h exceeds " << options_.maxGapHours << "h, reloading series");
                fetched = reload_(pair.symbol, spec, boundary);
                pair.action = Action::Reloaded;
            }
        }
        pair.fetched = fetched.size();

        auto seed = sink_.loadRecent(pair.symbol, spec.timeframe, spec.windowCapacity);
        if (seed.empty() && !fetched.empty()) {
            LOG_WARN("Bootstrap " << pair.symbol << '/' << spec.timeframe
                                  << " store returned nothing, seeding from fetched candles");
            seed = tail(fetched, spec.windowCapacity);
        }

        if (seed.empty()) {
            pair.action = Action::Failed;
            pair.error = "no candles available";
            LOG_ERR("Bootstrap " << pair.symbol << '/' << spec.timeframe << " has no candles to seed");
            return pair;
        }

        orchestrator.seed(spec.timeframe, seed);
        pair.seeded = seed.size();
        pair.lastTs = seed.back().openTs;
        LOG_INFO("Bootstrap " << pair.symbol << '/' << spec.timeframe << ' ' << to_string(pair.action)
                              << " fetched=" << pair.fetched << " seeded=" << pair.seeded
                              << " last_ts=" << *pair.lastTs);
    } catch (const std::exception& ex) {
        pair.action = Action::Failed;
        pair.error = ex.what();
        LOG_ERR("Bootstrap " << pair.symbol << '/' << spec.timeframe << " failed: " << ex.what());
    }
    return pair;
}

std::vector<domain::Candle> BootstrapController::reload_(const std::string& symbol,
                                                         const domain::TimeframeSpec& spec,
                                                         domain::TimestampSec boundary) {
    if (!sink_.deleteSeries(symbol, spec.timeframe)) {
        LOG_WARN("Bootstrap " << symbol << '/' << spec.timeframe << " could not delete stale series");
    }
    return fetchAndPersist_(symbol, spec, spec.initialCandles, std::nullopt, boundary);
}

std::vector<domain::Candle> BootstrapController::fetchAndPersist_(const std::string& symbol,
                                                                  const domain::TimeframeSpec& spec,
                                                                  std::size_t limit,
                                                                  std::optional<domain::TimestampSec> start,
                                                                  domain::TimestampSec boundary) {
    if (limit == 0) {
        return {};
    }

    auto raw = fetcher_.fetchRange(symbol, spec.timeframe, limit, start, boundary);

    std::vector<domain::Candle> closed;
    closed.reserve(raw.size());
    std::size_t unclosed = 0;
    for (auto& candle : raw) {
        if (candle.openTs > boundary) {
            ++unclosed;
            continue;
        }
        if (auto violation = domain::integrity_violation(candle, symbol, spec.timeframe, spec.intervalSeconds)) {
            LOG_WARN("Bootstrap " << symbol << '/' << spec.timeframe << " dropping open_ts=" << candle.openTs
                                  << ": " << *violation);
            continue;
        }
        closed.push_back(std::move(candle));
    }
    if (unclosed > 0) {
        LOG_DEBUG("Bootstrap " << symbol << '/' << spec.timeframe << " discarded " << unclosed
                               << " unclosed candle(s)");
    }
    if (closed.empty()) {
        LOG_WARN("Bootstrap " << symbol << '/' << spec.timeframe << " fetch returned no usable candles");
        return closed;
    }

    sink_.appendBatchAsync(closed);
    sink_.flush();
    return closed;
}

}  // namespace app
