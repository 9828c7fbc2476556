#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>
#include <vector>

#include "adapters/binance/BinanceRestClient.hpp"
#include "adapters/binance/BinanceWsClient.hpp"
#include "adapters/duckdb/DuckCandleSink.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "app/GapFiller.hpp"
#include "app/SyncService.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) {
            joined.append(",");
        }
        joined.append(value);
    }
    return joined;
}

adapters::binance::BinanceRestClient::Options restOptions(const tfsync::common::Config& config) {
    adapters::binance::BinanceRestClient::Options options;
    options.host = config.restHost;
    options.timeoutSec = config.requestTimeoutSec;
    options.maxAttempts = config.restMaxAttempts;
    options.backoffBase = std::chrono::milliseconds(config.restBackoffMs);
    options.backoffCap = std::chrono::milliseconds(config.restBackoffCapMs);
    options.pageDelay = std::chrono::milliseconds(config.restPageDelayMs);
    return options;
}

adapters::binance::BinanceWsClient::Options wsOptions(const tfsync::common::Config& config) {
    adapters::binance::BinanceWsClient::Options options;
    options.host = config.wsHost;
    options.port = config.wsPort;
    options.maxReconnectAttempts = config.wsMaxReconnects;
    options.backoffBase = std::chrono::milliseconds(config.wsBackoffMs);
    options.backoffCap = std::chrono::milliseconds(config.wsBackoffCapMs);
    return options;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
            std::fputs("std::terminate: failed to inspect exception\n", stderr);
        }
        std::_Exit(1);
    });

    tfsync::common::Config config;
    try {
        config = tfsync::common::Config::fromArgs(argc, argv);
    } catch (const domain::ConfigurationError& ex) {
        LOG_ERR("Invalid configuration: " << ex.what());
        return EXIT_FAILURE;
    }
    tfsync::log::setLevel(config.logLevel);

    LOG_INFO("Configuration loaded");
    LOG_INFO("  Symbols: " << joinList(config.symbols));
    LOG_INFO("  Timeframes: " << joinList(config.timeframes));
    LOG_INFO("  Bootstrap: " << tfsync::common::to_string(config.bootstrapMode)
                             << " max_gap_hours=" << config.maxGapHours);
    LOG_INFO("  DuckDB: " << config.duckdbPath);
    LOG_INFO("  REST: " << config.restHost << " attempts=" << config.restMaxAttempts
                        << " workers=" << config.restWorkers);
    LOG_INFO("  WS: " << config.wsHost << ':' << config.wsPort << " max_reconnects=" << config.wsMaxReconnects);
    LOG_INFO("  Coalesce: " << config.coalesceMs << " ms");

    try {
        adapters::duckdb::DuckStore store(config.duckdbPath);
        store.migrate();
        adapters::duckdb::DuckCandleSink sink(store);
        adapters::binance::BinanceRestClient rest(restOptions(config));

        if (config.fillGaps) {
            app::GapFiller filler(rest, sink);
            const auto result = filler.run(config.symbols, config.timeframeSpecs());
            sink.shutdown();
            LOG_INFO("Gap fill done, exiting\n" << tfsync::common::metrics::Registry::instance().summary());
            return result.totalRemaining() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        adapters::binance::BinanceWsClient ws(wsOptions(config));
        app::SyncService service(config, rest, sink, ws);
        if (!service.start()) {
            sink.shutdown();
            return EXIT_FAILURE;
        }

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);
        LOG_INFO("Sync running. Waiting for signal...");

        while (gSignalStatus == 0) {
            if (ws.state() == domain::StreamState::Disconnected) {
                LOG_ERR("Stream gave up reconnecting, stopping");
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (gSignalStatus != 0) {
            LOG_INFO("Signal " << gSignalStatus << " received, stopping services...");
        }
        LOG_INFO("Starting graceful shutdown");
        service.shutdown();
        sink.shutdown();
        LOG_INFO("Shutdown complete\n" << tfsync::common::metrics::Registry::instance().summary());
        return gSignalStatus != 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }
}
