#include <iostream>
#include <string>

#include "domain/CandleValidation.hpp"
#include "domain/Errors.hpp"
#include "domain/Timeframe.hpp"
#include "support/Fakes.hpp"

using tfsync::testing::makeCandle;

int main() {
    {
        const struct {
            const char* label;
            long long seconds;
        } cases[] = {{"1m", 60}, {"5m", 300}, {"15m", 900}, {"1h", 3600}, {"4h", 14400}, {"1d", 86400}, {"1w", 604800}};
        for (const auto& c : cases) {
            const auto seconds = domain::timeframe_seconds(c.label);
            if (seconds != c.seconds) {
                std::cerr << "timeframe_seconds(" << c.label << ") = " << seconds << ", expected " << c.seconds
                          << "\n";
                return 1;
            }
            if (domain::timeframe_label(seconds) != c.label) {
                std::cerr << "timeframe_label(" << seconds << ") = " << domain::timeframe_label(seconds) << "\n";
                return 1;
            }
        }
    }

    for (const char* bad : {"", "m", "1x", "0m", "15", "1hh"}) {
        try {
            (void)domain::timeframe_seconds(bad);
            std::cerr << "Expected ConfigurationError for '" << bad << "'\n";
            return 1;
        } catch (const domain::ConfigurationError&) {
        }
    }

    if (!domain::is_aligned(960, 60) || domain::is_aligned(1000, 60)) {
        std::cerr << "is_aligned mismatch\n";
        return 1;
    }
    if (domain::align_down(1000, 60) != 960) {
        std::cerr << "align_down(1000, 60) = " << domain::align_down(1000, 60) << "\n";
        return 1;
    }
    if (domain::last_closed_open(1000, 60) != 900 || domain::last_closed_open(960, 60) != 900) {
        std::cerr << "last_closed_open mismatch\n";
        return 1;
    }

    {
        const auto good = makeCandle("BTCUSDT", "1m", 960, 60);
        if (domain::integrity_violation(good, "BTCUSDT", "1m", 60)) {
            std::cerr << "Valid candle reported as violation\n";
            return 1;
        }

        auto misaligned = makeCandle("BTCUSDT", "1m", 1000, 60);
        if (!domain::integrity_violation(misaligned, "BTCUSDT", "1m", 60)) {
            std::cerr << "Misaligned candle not reported\n";
            return 1;
        }

        auto inverted = good;
        inverted.low = inverted.high + 1.0;
        if (!domain::integrity_violation(inverted, "BTCUSDT", "1m", 60)) {
            std::cerr << "low > high not reported\n";
            return 1;
        }

        auto negative = good;
        negative.volume = -1.0;
        if (!domain::integrity_violation(negative, "BTCUSDT", "1m", 60)) {
            std::cerr << "Negative volume not reported\n";
            return 1;
        }

        if (!domain::integrity_violation(good, "ETHUSDT", "1m", 60)
            || !domain::integrity_violation(good, "BTCUSDT", "5m", 60)) {
            std::cerr << "Symbol/timeframe mismatch not reported\n";
            return 1;
        }

        try {
            domain::require_integrity(misaligned, 60);
            std::cerr << "require_integrity did not throw\n";
            return 1;
        } catch (const domain::DataIntegrityError&) {
        }
    }

    return 0;
}
