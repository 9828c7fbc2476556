#include "adapters/binance/BinanceRestClient.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "adapters/binance/KlineJson.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "domain/Timeframe.hpp"

namespace adapters::binance {
namespace {

using tfsync::common::metrics::Registry;

// 4xx other than rate limiting: retrying cannot help.
class RejectedRequestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

domain::TimestampSec system_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::optional<std::chrono::seconds> parse_retry_after(const std::string& header) {
    if (header.empty() || !std::all_of(header.begin(), header.end(), [](unsigned char ch) {
            return std::isdigit(ch) != 0;
        })) {
        return std::nullopt;
    }
    try {
        return std::chrono::seconds(std::stoll(header));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

void ensure_success(const infra::http::JsonResponse& response, const std::string& target) {
    const unsigned status = response.status;
    if (status == 200U) {
        return;
    }
    std::ostringstream oss;
    oss << "GET " << target << " returned HTTP " << status;
    if (status == 429U || status == 418U) {
        throw domain::RateLimitedError(oss.str(), parse_retry_after(response.retry_after_header));
    }
    if (status >= 500U && status < 600U) {
        throw domain::TransportError(oss.str());
    }
    if (!response.body.empty()) {
        oss << ": " << response.body.substr(0, 200);
    }
    throw RejectedRequestError(oss.str());
}

std::string klines_target(const std::string& symbol,
                          const std::string& timeframe,
                          std::optional<std::int64_t> startMs,
                          std::optional<std::int64_t> endMs,
                          std::size_t limit) {
    std::ostringstream target;
    target << "/api/v3/klines?symbol=" << symbol << "&interval=" << timeframe;
    if (startMs) {
        target << "&startTime=" << *startMs;
    }
    if (endMs) {
        target << "&endTime=" << *endMs;
    }
    target << "&limit=" << limit;
    return target.str();
}

}  // namespace

BinanceRestClient::BinanceRestClient(Options options, Transport transport, Sleeper sleeper, NowSource now)
    : options_(std::move(options)),
      transport_(std::move(transport)),
      sleep_(std::move(sleeper)),
      now_(std::move(now)) {
    if (!transport_) {
        transport_ = [](const std::string& host, const std::string& target, int timeoutSec) {
            return infra::http::https_get_json_response(host, target, timeoutSec);
        };
    }
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
    if (!now_) {
        now_ = &system_now;
    }
    options_.maxAttempts = std::max(1, options_.maxAttempts);
}

std::vector<domain::Candle> BinanceRestClient::fetchRange(const std::string& symbol,
                                                          const std::string& timeframe,
                                                          std::size_t limit,
                                                          std::optional<domain::TimestampSec> start,
                                                          std::optional<domain::TimestampSec> end) {
    if (symbol.empty() || limit == 0) {
        return {};
    }

    try {
        const auto interval = domain::timeframe_seconds(timeframe);
        const auto upper = end.value_or(domain::last_closed_open(now_(), interval));
        if (start && *start > upper) {
            return {};
        }

        auto fetched = start ? fetchForward_(symbol, timeframe, interval, limit, *start, upper)
                             : fetchBackward_(symbol, timeframe, interval, limit, upper);
        if (!fetched) {
            LOG_ERR("BinanceRestClient fetchRange " << symbol << '/' << timeframe
                                                    << " failed, returning no candles");
            return {};
        }

        std::map<domain::TimestampSec, domain::Candle> byOpen;
        for (auto& candle : *fetched) {
            if (candle.openTs > upper || (start && candle.openTs < *start)) {
                continue;
            }
            byOpen.insert_or_assign(candle.openTs, std::move(candle));
        }

        std::vector<domain::Candle> result;
        result.reserve(std::min(limit, byOpen.size()));
        auto it = byOpen.begin();
        if (byOpen.size() > limit) {
            std::advance(it, static_cast<std::ptrdiff_t>(byOpen.size() - limit));
        }
        std::size_t misaligned = 0;
        for (; it != byOpen.end(); ++it) {
            if (!domain::is_aligned(it->first, interval)) {
                ++misaligned;
                LOG_WARN("BinanceRestClient " << symbol << '/' << timeframe << " misaligned open_ts=" << it->first);
            }
            result.push_back(std::move(it->second));
        }
        if (misaligned > 0) {
            Registry::instance().incrementCounter("rest_misaligned_total", misaligned);
        }

        LOG_DEBUG("BinanceRestClient " << symbol << '/' << timeframe << " fetched " << result.size()
                                       << " candle(s)");
        return result;
    } catch (const std::exception& ex) {
        LOG_ERR("BinanceRestClient fetchRange " << symbol << '/' << timeframe << " error: " << ex.what());
    }
    return {};
}

std::optional<domain::Candle> BinanceRestClient::fetchExact(const std::string& symbol,
                                                            const std::string& timeframe,
                                                            domain::TimestampSec openTs) {
    try {
        const auto interval = domain::timeframe_seconds(timeframe);
        const auto target = klines_target(symbol, timeframe, openTs * 1000, (openTs + interval) * 1000 - 1, 2);
        auto page = requestKlines_(symbol, timeframe, target);
        if (!page) {
            return std::nullopt;
        }
        for (auto& candle : *page) {
            if (candle.openTs == openTs) {
                return std::move(candle);
            }
        }
        LOG_DEBUG("BinanceRestClient " << symbol << '/' << timeframe << " no candle at open_ts=" << openTs);
    } catch (const std::exception& ex) {
        LOG_ERR("BinanceRestClient fetchExact " << symbol << '/' << timeframe << " open_ts=" << openTs
                                                << " error: " << ex.what());
    }
    return std::nullopt;
}

std::optional<std::vector<domain::Candle>> BinanceRestClient::fetchForward_(const std::string& symbol,
                                                                            const std::string& timeframe,
                                                                            std::int64_t intervalSeconds,
                                                                            std::size_t limit,
                                                                            domain::TimestampSec start,
                                                                            domain::TimestampSec end) {
    std::vector<domain::Candle> collected;
    auto cursor = start;

    while (collected.size() < limit && cursor <= end) {
        const auto pageLimit = std::min(kPageLimit, limit - collected.size());
        const auto target = klines_target(symbol, timeframe, cursor * 1000, end * 1000, pageLimit);
        if (!collected.empty()) {
            sleep_(options_.pageDelay);
        }

        auto page = requestKlines_(symbol, timeframe, target);
        if (!page) {
            return std::nullopt;
        }
        if (page->empty()) {
            break;
        }

        const auto lastOpen = page->back().openTs;
        const auto received = page->size();
        collected.insert(collected.end(), std::make_move_iterator(page->begin()), std::make_move_iterator(page->end()));
        if (received < pageLimit || lastOpen < cursor) {
            break;
        }
        cursor = lastOpen + intervalSeconds;
    }
    return collected;
}

std::optional<std::vector<domain::Candle>> BinanceRestClient::fetchBackward_(const std::string& symbol,
                                                                             const std::string& timeframe,
                                                                             std::int64_t intervalSeconds,
                                                                             std::size_t limit,
                                                                             domain::TimestampSec end) {
    std::vector<std::vector<domain::Candle>> pages;
    std::size_t total = 0;
    auto cursor = end;

    while (total < limit) {
        const auto pageLimit = std::min(kPageLimit, limit - total);
        const auto target = klines_target(symbol, timeframe, std::nullopt, cursor * 1000, pageLimit);
        if (!pages.empty()) {
            sleep_(options_.pageDelay);
        }

        auto page = requestKlines_(symbol, timeframe, target);
        if (!page) {
            return std::nullopt;
        }
        if (page->empty()) {
            break;
        }

        const auto firstOpen = page->front().openTs;
        const auto received = page->size();
        total += received;
        pages.push_back(std::move(*page));
        if (received < pageLimit || firstOpen > cursor) {
            break;
        }
        cursor = firstOpen - intervalSeconds;
    }

    std::vector<domain::Candle> collected;
    collected.reserve(total);
    for (auto it = pages.rbegin(); it != pages.rend(); ++it) {
        collected.insert(collected.end(), std::make_move_iterator(it->begin()), std::make_move_iterator(it->end()));
    }
    return collected;
}

std::optional<std::vector<domain::Candle>> BinanceRestClient::requestKlines_(const std::string& symbol,
                                                                            const std::string& timeframe,
                                                                            const std::string& target) {
    LOG_DEBUG("BinanceRestClient GET " << options_.host << target);

    for (int attempt = 1; attempt <= options_.maxAttempts; ++attempt) {
        std::chrono::milliseconds wait{0};
        try {
            const auto response = transport_(options_.host, target, options_.timeoutSec);
            ensure_success(response, target);
            return parse_rest_klines(response.body, symbol, timeframe);
        } catch (const domain::RateLimitedError& ex) {
            wait = backoffFor_(attempt);
            if (const auto hint = ex.retryAfter()) {
                wait = std::min<std::chrono::milliseconds>(*hint, options_.backoffCap);
            }
            LOG_WARN("BinanceRestClient rate limited (attempt " << attempt << '/' << options_.maxAttempts
                                                                << "): " << ex.what());
        } catch (const domain::TransportError& ex) {
            wait = backoffFor_(attempt);
            LOG_WARN("BinanceRestClient transport error (attempt " << attempt << '/' << options_.maxAttempts
                                                                   << "): " << ex.what());
        } catch (const domain::DataIntegrityError& ex) {
            LOG_ERR("BinanceRestClient malformed response for " << target << ": " << ex.what());
            return std::nullopt;
        } catch (const RejectedRequestError& ex) {
            LOG_ERR("BinanceRestClient request rejected: " << ex.what());
            return std::nullopt;
        }

        if (attempt == options_.maxAttempts) {
            break;
        }
        Registry::instance().incrementCounter("rest_retries_total");
        LOG_INFO("BinanceRestClient retrying in " << wait.count() << " ms");
        sleep_(wait);
    }

    LOG_ERR("BinanceRestClient giving up on " << target << " after " << options_.maxAttempts << " attempts");
    Registry::instance().incrementCounter("rest_failures_total");
    return std::nullopt;
}

std::chrono::milliseconds BinanceRestClient::backoffFor_(int attempt) const {
    const auto exponent = std::min(std::max(attempt - 1, 0), 20);
    const auto delay = options_.backoffBase * (1LL << exponent);
    return std::min<std::chrono::milliseconds>(delay, options_.backoffCap);
}

}  // namespace adapters::binance
