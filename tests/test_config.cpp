#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "domain/Errors.hpp"

using tfsync::common::BootstrapMode;
using tfsync::common::Config;

namespace {

Config parse(std::vector<std::string> args) {
    args.insert(args.begin(), "tfsync");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool rejects(const std::vector<std::string>& args) {
    try {
        (void)parse(args);
    } catch (const domain::ConfigurationError&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    for (const char* name : {"LOG_LEVEL", "SYMBOLS", "TIMEFRAMES", "WINDOW_SIZE", "INITIAL_CANDLES", "BOOTSTRAP_MODE",
                             "MAX_GAP_HOURS", "DUCKDB_PATH", "COALESCE_MS"}) {
        ::unsetenv(name);
    }

    {
        const auto config = parse({});
        const auto specs = config.timeframeSpecs();
        if (specs.size() != 4 || specs.front().timeframe != "1h" || specs.back().timeframe != "1m") {
            std::cerr << "Default timeframes must be ordered slowest first\n";
            return 1;
        }
        for (std::size_t i = 0; i < specs.size(); ++i) {
            if (specs[i].rank != static_cast<int>(i) + 1 || specs[i].windowCapacity != 600
                || specs[i].initialCandles != 1000) {
                std::cerr << "Default spec mismatch for " << specs[i].timeframe << "\n";
                return 1;
            }
        }
        if (config.bootstrapMode != BootstrapMode::Incremental || config.maxGapHours != 168.0
            || config.coalesceMs != 100 || config.fillGaps) {
            std::cerr << "Default settings mismatch\n";
            return 1;
        }
    }

    {
        const auto config = parse({"--symbols=btcusdt, ethusdt,BTCUSDT", "--timeframes", "1m,4h,15m",
                                   "--window-sizes=1m:50", "--initial-candles=4h:200", "--ranks=15m:1,4h:2",
                                   "--fresh-start", "--max-gap-hours=12.5", "--coalesce-ms", "250", "--fill-gaps"});
        if (config.symbols != std::vector<std::string>{"BTCUSDT", "ETHUSDT"}) {
            std::cerr << "Symbols must be uppercased and deduplicated in order\n";
            return 1;
        }
        const auto specs = config.timeframeSpecs();
        if (specs[0].timeframe != "4h" || specs[0].rank != 2 || specs[0].initialCandles != 200
            || specs[1].timeframe != "15m" || specs[1].rank != 1 || specs[2].timeframe != "1m"
            || specs[2].rank != 3 || specs[2].windowCapacity != 50 || specs[2].intervalSeconds != 60) {
            std::cerr << "Per-timeframe overrides not applied\n";
            return 1;
        }
        if (config.bootstrapMode != BootstrapMode::FreshStart || config.maxGapHours != 12.5
            || config.coalesceMs != 250 || !config.fillGaps) {
            std::cerr << "CLI settings not applied\n";
            return 1;
        }
    }

    {
        ::setenv("SYMBOLS", "solusdt", 1);
        ::setenv("BOOTSTRAP_MODE", "fresh", 1);
        const auto fromEnv = parse({});
        const auto overridden = parse({"--symbols=xrpusdt", "--bootstrap=incremental"});
        ::unsetenv("SYMBOLS");
        ::unsetenv("BOOTSTRAP_MODE");
        if (fromEnv.symbols != std::vector<std::string>{"SOLUSDT"} || fromEnv.bootstrapMode != BootstrapMode::FreshStart) {
            std::cerr << "Environment not applied\n";
            return 1;
        }
        if (overridden.symbols != std::vector<std::string>{"XRPUSDT"}
            || overridden.bootstrapMode != BootstrapMode::Incremental) {
            std::cerr << "CLI must override the environment\n";
            return 1;
        }
    }

    const std::vector<std::vector<std::string>> invalid{
        {"--timeframes=1m,2x"},
        {"--timeframes=1m,1m"},
        {"--timeframes=60s,1m"},
        {"--ranks=1m:1"},
        {"--ranks=1d:1"},
        {"--window-size=0"},
        {"--bootstrap=sometimes"},
        {"--max-gap-hours=-1"},
        {"--rest-backoff-ms=5000", "--rest-backoff-cap-ms=100"},
        {"--log-level=loud"},
        {"--symbols=,"},
    };
    for (const auto& args : invalid) {
        if (!rejects(args)) {
            std::cerr << "Expected ConfigurationError for " << args.front() << "\n";
            return 1;
        }
    }

    return 0;
}
