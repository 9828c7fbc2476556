#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "app/BootstrapController.hpp"
#include "app/MultiTimeframeOrchestrator.hpp"
#include "common/Config.hpp"
#include "domain/Ports.hpp"

namespace app {

// Wires bootstrap, per-symbol orchestrators and the live stream together.
class SyncService {
public:
    SyncService(tfsync::common::Config config,
                domain::IHistoricalFetcher& fetcher,
                domain::ICandleSink& sink,
                domain::IStreamSubscriber& stream);
    ~SyncService();

    SyncService(const SyncService&) = delete;
    SyncService& operator=(const SyncService&) = delete;

    // Must be called before start(). Defaults to logging every candle.
    void setConsumer(MultiTimeframeOrchestrator::Consumer consumer);

    // Bootstraps every pair and starts streaming. Returns false, with nothing
    // left running, if no pair could be bootstrapped.
    bool start();

    // Stream first, then orchestrators, then the drain thread. Idempotent.
    void shutdown();

    MultiTimeframeOrchestrator* orchestrator(const std::string& symbol) const;
    const std::optional<BootstrapController::Report>& bootstrapReport() const noexcept { return report_; }
    void logStatus() const;

private:
    void stopIo_();

    const tfsync::common::Config config_;
    domain::IHistoricalFetcher& fetcher_;
    domain::ICandleSink& sink_;
    domain::IStreamSubscriber& stream_;
    MultiTimeframeOrchestrator::Consumer consumer_;

    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_;
    std::thread ioThread_;

    std::vector<std::unique_ptr<MultiTimeframeOrchestrator>> orchestrators_;
    std::optional<BootstrapController::Report> report_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
};

}  // namespace app
