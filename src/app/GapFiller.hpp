#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/Ports.hpp"
#include "domain/Types.hpp"

namespace app {

// Offline pass over the store: every hole the sink reports is re-fetched and
// persisted. Complements the live reconciler, which leaves unrecoverable gaps
// open.
class GapFiller {
public:
    struct PairResult {
        std::string symbol;
        std::string timeframe;
        std::size_t gaps{0};
        std::size_t missing{0};
        std::size_t filled{0};
        std::size_t remainingGaps{0};
    };

    struct Result {
        std::vector<PairResult> pairs;

        std::size_t totalFilled() const;
        std::size_t totalRemaining() const;
    };

    GapFiller(domain::IHistoricalFetcher& fetcher, domain::ICandleSink& sink);

    Result run(const std::vector<std::string>& symbols, const std::vector<domain::TimeframeSpec>& specs);
    PairResult fillPair(const std::string& symbol, const domain::TimeframeSpec& spec);

private:
    domain::IHistoricalFetcher& fetcher_;
    domain::ICandleSink& sink_;
};

}  // namespace app
