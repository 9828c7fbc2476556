#include "app/GapFiller.hpp"

#include <exception>
#include <utility>

#include "common/Log.hpp"
#include "domain/CandleValidation.hpp"

namespace app {

std::size_t GapFiller::Result::totalFilled() const {
    std::size_t total = 0;
    for (const auto& pair : pairs) {
        total += pair.filled;
    }
    return total;
}

std::size_t GapFiller::Result::totalRemaining() const {
    std::size_t total = 0;
    for (const auto& pair : pairs) {
        total += pair.remainingGaps;
    }
    return total;
}

GapFiller::GapFiller(domain::IHistoricalFetcher& fetcher, domain::ICandleSink& sink)
    : fetcher_(fetcher), sink_(sink) {}

GapFiller::Result GapFiller::run(const std::vector<std::string>& symbols,
                                 const std::vector<domain::TimeframeSpec>& specs) {
    Result result;
    for (const auto& symbol : symbols) {
        for (const auto& spec : specs) {
            result.pairs.push_back(fillPair(symbol, spec));
        }
    }
    LOG_INFO("GapFiller finished filled=" << result.totalFilled()
                                          << " remaining_gaps=" << result.totalRemaining());
    return result;
}

GapFiller::PairResult GapFiller::fillPair(const std::string& symbol, const domain::TimeframeSpec& spec) {
    PairResult result;
    result.symbol = symbol;
    result.timeframe = spec.timeframe;

    std::vector<domain::GapRange> gaps;
    try {
        gaps = sink_.findGaps(symbol, spec.timeframe, spec.intervalSeconds);
    } catch (const std::exception& ex) {
        LOG_ERR("GapFiller " << symbol << '/' << spec.timeframe << " gap scan failed: " << ex.what());
        return result;
    }
    result.gaps = gaps.size();
    if (gaps.empty()) {
        LOG_INFO("GapFiller " << symbol << '/' << spec.timeframe << " has no gaps");
        return result;
    }

    for (const auto& gap : gaps) {
        result.missing += gap.missingCount;
        LOG_INFO("GapFiller " << symbol << '/' << spec.timeframe << " filling [" << gap.firstMissing << ", "
                              << gap.lastMissing << "] (" << gap.missingCount << " candle(s))");

        auto fetched =
            fetcher_.fetchRange(symbol, spec.timeframe, gap.missingCount, gap.firstMissing, gap.lastMissing);

        std::vector<domain::Candle> valid;
        valid.reserve(fetched.size());
        for (auto& candle : fetched) {
            if (candle.openTs < gap.firstMissing || candle.openTs > gap.lastMissing) {
                continue;
            }
            if (auto violation = domain::integrity_violation(candle, symbol, spec.timeframe, spec.intervalSeconds)) {
                LOG_WARN("GapFiller " << symbol << '/' << spec.timeframe << " dropping open_ts=" << candle.openTs
                                      << ": " << *violation);
                continue;
            }
            valid.push_back(std::move(candle));
        }

        if (valid.size() < gap.missingCount) {
            ++result.remainingGaps;
        }
        result.filled += valid.size();
        if (!valid.empty()) {
            sink_.appendBatchAsync(std::move(valid));
        }
    }
    sink_.flush();

    LOG_INFO("GapFiller " << symbol << '/' << spec.timeframe << " gaps=" << result.gaps
                          << " filled=" << result.filled << '/' << result.missing
                          << " remaining_gaps=" << result.remainingGaps);
    return result;
}

}  // namespace app
