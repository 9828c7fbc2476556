#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "adapters/duckdb/DuckStore.hpp"
#include "domain/Ports.hpp"

namespace adapters::duckdb {

// ICandleSink over the `candles` table. Appends are queued to a single writer
// thread and committed one batch per transaction; duplicates are ignored.
// Reads open their own connection and do not wait for the writer.
class DuckCandleSink : public domain::ICandleSink {
public:
    explicit DuckCandleSink(DuckStore& store);
    ~DuckCandleSink() override;

    DuckCandleSink(const DuckCandleSink&) = delete;
    DuckCandleSink& operator=(const DuckCandleSink&) = delete;

    void appendAsync(const domain::Candle& candle) override;
    void appendBatchAsync(std::vector<domain::Candle> candles) override;
    void flush() override;

    std::optional<domain::Candle> getLastPersisted(const std::string& symbol,
                                                   const std::string& timeframe) override;
    std::vector<domain::Candle> loadRecent(const std::string& symbol,
                                           const std::string& timeframe,
                                           std::size_t limit) override;
    bool deleteSeries(const std::string& symbol, const std::string& timeframe) override;
    std::vector<domain::GapRange> findGaps(const std::string& symbol,
                                           const std::string& timeframe,
                                           std::int64_t intervalSeconds) override;

    // Writes everything still queued, then stops the writer thread.
    void shutdown() override;

    std::uint64_t failedWrites() const noexcept { return failedWrites_.load(std::memory_order_relaxed); }

private:
    struct WriteJob {
        std::vector<domain::Candle> candles;
        std::shared_ptr<std::promise<void>> barrier;
    };

    void enqueue_(WriteJob job);
    void writerLoop_();
    void writeBatch_(const std::vector<domain::Candle>& candles);

    DuckStore& store_;

    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::deque<WriteJob> queue_;
    bool stopping_ = false;

    // Held for every mutation of the table.
    std::mutex writerMutex_;
    std::atomic<std::uint64_t> failedWrites_{0};
    std::thread writer_;
};

}  // namespace adapters::duckdb
