#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "domain/Ports.hpp"
#include "domain/Types.hpp"

namespace app {

class MultiTimeframeOrchestrator;

// Brings the persisted series of every (symbol, timeframe) up to the last
// closed boundary, then seeds the orchestrators from the store.
class BootstrapController {
public:
    struct Options {
        tfsync::common::BootstrapMode mode = tfsync::common::BootstrapMode::Incremental;
        double maxGapHours = 168.0;
        // Symbols bootstrapped concurrently.
        std::size_t workers = 4;
    };

    enum class Action {
        UpToDate,
        GapFetched,
        Reloaded,
        FreshLoad,
        Failed,
    };

    struct PairReport {
        std::string symbol;
        std::string timeframe;
        Action action{Action::Failed};
        std::size_t gapCandles{0};
        std::size_t fetched{0};
        std::size_t seeded{0};
        std::optional<domain::TimestampSec> lastTs{};
        std::string error;

        bool ok() const noexcept { return action != Action::Failed; }
    };

    struct Report {
        std::vector<PairReport> pairs;

        std::size_t succeeded() const;
        std::size_t failed() const;
        bool success() const { return succeeded() > 0; }
    };

    using NowSource = std::function<domain::TimestampSec()>;

    BootstrapController(Options options,
                        domain::IHistoricalFetcher& fetcher,
                        domain::ICandleSink& sink,
                        NowSource now = {});

    Report run(const std::vector<MultiTimeframeOrchestrator*>& orchestrators);

    // Single pair, on the calling thread. Never throws.
    PairReport bootstrapPair(MultiTimeframeOrchestrator& orchestrator, const domain::TimeframeSpec& spec);

private:
    std::vector<domain::Candle> fetchAndPersist_(const std::string& symbol,
                                                 const domain::TimeframeSpec& spec,
                                                 std::size_t limit,
                                                 std::optional<domain::TimestampSec> start,
                                                 domain::TimestampSec boundary);
    std::vector<domain::Candle> reload_(const std::string& symbol,
                                        const domain::TimeframeSpec& spec,
                                        domain::TimestampSec boundary);

    Options options_;
    domain::IHistoricalFetcher& fetcher_;
    domain::ICandleSink& sink_;
    NowSource now_;
};

const char* to_string(BootstrapController::Action action) noexcept;

}  // namespace app
