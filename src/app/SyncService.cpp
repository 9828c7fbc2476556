#include "app/SyncService.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include "common/Log.hpp"
#include "domain/Ports.hpp"

namespace app {
namespace {

void logCandle(const std::string& symbol, const std::string& timeframe, const domain::Candle& candle) {
    LOG_INFO("Candle " << symbol << '/' << timeframe << " open_ts=" << candle.openTs << " o=" << candle.open
                       << " h=" << candle.high << " l=" << candle.low << " c=" << candle.close
                       << " v=" << candle.volume);
}

}  // namespace

SyncService::SyncService(tfsync::common::Config config,
                         domain::IHistoricalFetcher& fetcher,
                         domain::ICandleSink& sink,
                         domain::IStreamSubscriber& stream)
    : config_(std::move(config)), fetcher_(fetcher), sink_(sink), stream_(stream), consumer_(logCandle) {}

SyncService::~SyncService() {
    shutdown();
}

void SyncService::setConsumer(MultiTimeframeOrchestrator::Consumer consumer) {
    if (started_.load()) {
        LOG_WARN("SyncService consumer change ignored after start");
        return;
    }
    consumer_ = std::move(consumer);
}

bool SyncService::start() {
    if (started_.exchange(true)) {
        LOG_WARN("SyncService already started");
        return true;
    }

    const auto specs = config_.timeframeSpecs();
    const std::chrono::milliseconds coalesce(config_.coalesceMs);
    for (const auto& symbol : config_.symbols) {
        auto orchestrator =
            std::make_unique<MultiTimeframeOrchestrator>(io_, symbol, specs, fetcher_, &sink_, coalesce);
        orchestrator->setConsumer(consumer_);
        orchestrators_.push_back(std::move(orchestrator));
    }

    workGuard_.emplace(io_.get_executor());
    ioThread_ = std::thread([this] {
        try {
            io_.run();
        } catch (const std::exception& ex) {
            LOG_ERR("SyncService drain loop terminated: " << ex.what());
        }
    });

    BootstrapController::Options options;
    options.mode = config_.bootstrapMode;
    options.maxGapHours = config_.maxGapHours;
    options.workers = config_.restWorkers;
    BootstrapController bootstrap(options, fetcher_, sink_);

    std::vector<MultiTimeframeOrchestrator*> targets;
    targets.reserve(orchestrators_.size());
    for (const auto& orchestrator : orchestrators_) {
        targets.push_back(orchestrator.get());
    }
    report_ = bootstrap.run(targets);
    if (!report_->success()) {
        LOG_ERR("SyncService not started: no pair could be bootstrapped");
        shutdown();
        return false;
    }

    for (const auto& orchestrator : orchestrators_) {
        orchestrator->markInitialized();
        for (const auto& spec : specs) {
            if (!stream_.subscribe(orchestrator->symbol(), spec.timeframe, *orchestrator)) {
                LOG_WARN("SyncService could not subscribe " << orchestrator->symbol() << '/' << spec.timeframe);
            }
        }
    }

    stream_.start();
    LOG_INFO("SyncService running symbols=" << orchestrators_.size() << " timeframes=" << specs.size());
    return true;
}

void SyncService::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    LOG_INFO("SyncService shutting down");

    stream_.stop();
    for (const auto& orchestrator : orchestrators_) {
        orchestrator->shutdown();
    }
    stopIo_();
    sink_.flush();
    logStatus();
}

void SyncService::stopIo_() {
    workGuard_.reset();
    io_.stop();
    if (ioThread_.joinable()) {
        ioThread_.join();
    }
}

MultiTimeframeOrchestrator* SyncService::orchestrator(const std::string& symbol) const {
    for (const auto& orchestrator : orchestrators_) {
        if (orchestrator->symbol() == symbol) {
            return orchestrator.get();
        }
    }
    return nullptr;
}

void SyncService::logStatus() const {
    LOG_INFO("SyncService stream state=" << domain::to_string(stream_.state()));
    for (const auto& orchestrator : orchestrators_) {
        const auto status = orchestrator->status();
        for (const auto& tf : status.timeframes) {
            LOG_INFO("  " << status.symbol << '/' << tf.timeframe << " rank=" << tf.rank << " count=" << tf.count
                          << " last_ts=" << (tf.lastTs ? std::to_string(*tf.lastTs) : std::string{"-"})
                          << " state=" << core::to_string(tf.state) << " accepted=" << tf.counters.accepted
                          << " rejected=" << tf.counters.rejected << " recovered=" << tf.counters.recovered
                          << " unrecoverable=" << tf.counters.unrecoverable);
        }
    }
}

}  // namespace app
