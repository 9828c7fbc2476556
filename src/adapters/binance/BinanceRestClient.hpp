#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::binance {

class BinanceRestClient : public domain::IHistoricalFetcher {
public:
    struct Options {
        std::string host = "api.binance.com";
        int timeoutSec = 5;
        int maxAttempts = 5;
        std::chrono::milliseconds backoffBase{1000};
        std::chrono::milliseconds backoffCap{30000};
        // Pause between consecutive pages of one range request.
        std::chrono::milliseconds pageDelay{120};
    };

    using Transport =
        std::function<infra::http::JsonResponse(const std::string& host, const std::string& target, int timeoutSec)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using NowSource = std::function<domain::TimestampSec()>;

    // Empty callables fall back to the HTTPS client, std::this_thread::sleep_for
    // and the system clock.
    explicit BinanceRestClient(Options options, Transport transport = {}, Sleeper sleeper = {}, NowSource now = {});
    ~BinanceRestClient() override = default;

    std::vector<domain::Candle> fetchRange(const std::string& symbol,
                                           const std::string& timeframe,
                                           std::size_t limit,
                                           std::optional<domain::TimestampSec> start = std::nullopt,
                                           std::optional<domain::TimestampSec> end = std::nullopt) override;

    std::optional<domain::Candle> fetchExact(const std::string& symbol,
                                             const std::string& timeframe,
                                             domain::TimestampSec openTs) override;

    static constexpr std::size_t kPageLimit = 1000;

private:
    // Both return nullopt if any page fails.
    std::optional<std::vector<domain::Candle>> fetchForward_(const std::string& symbol,
                                                             const std::string& timeframe,
                                                             std::int64_t intervalSeconds,
                                                             std::size_t limit,
                                                             domain::TimestampSec start,
                                                             domain::TimestampSec end);
    std::optional<std::vector<domain::Candle>> fetchBackward_(const std::string& symbol,
                                                              const std::string& timeframe,
                                                              std::int64_t intervalSeconds,
                                                              std::size_t limit,
                                                              domain::TimestampSec end);

    // nullopt once retries are exhausted or the request is not retriable.
    std::optional<std::vector<domain::Candle>> requestKlines_(const std::string& symbol,
                                                             const std::string& timeframe,
                                                             const std::string& target);
    std::chrono::milliseconds backoffFor_(int attempt) const;

    Options options_;
    Transport transport_;
    Sleeper sleep_;
    NowSource now_;
};

}  // namespace adapters::binance
