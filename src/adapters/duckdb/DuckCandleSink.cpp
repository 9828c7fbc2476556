#include "adapters/duckdb/DuckCandleSink.hpp"

#include <algorithm>
#include <exception>
#include <limits>
#include <stdexcept>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace adapters::duckdb {
namespace {

using tfsync::common::metrics::Registry;

// DuckDB's own vector alias keeps Execute(values) on the non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

constexpr auto kInsertCandle =
    "INSERT OR IGNORE INTO candles "
    "(symbol, timeframe, open_ts, close_ts, open, high, low, close, volume, "
    "quote_volume, trade_count, taker_buy_base, taker_buy_quote) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

constexpr auto kSelectColumns =
    "SELECT open_ts, close_ts, open, high, low, close, volume, "
    "quote_volume, trade_count, taker_buy_base, taker_buy_quote FROM candles ";

::duckdb::Value optionalDouble(const std::optional<double>& value) {
    return value ? ::duckdb::Value::DOUBLE(*value) : ::duckdb::Value();
}

std::optional<double> readOptionalDouble(const ::duckdb::Value& value) {
    if (value.IsNull()) {
        return std::nullopt;
    }
    return value.GetValue<double>();
}

std::unique_ptr<::duckdb::QueryResult> execute(::duckdb::Connection& connection,
                                               const std::string& query,
                                               DuckdbValueVector& parameters) {
    auto statement = connection.Prepare(query);
    if (!statement || statement->HasError()) {
        throw std::runtime_error("prepare failed: " +
                                 (statement ? statement->GetError() : std::string{"unknown error"}));
    }
    auto result = statement->Execute(parameters);
    if (!result || result->HasError()) {
        throw std::runtime_error("query failed: " + (result ? result->GetError() : std::string{"unknown error"}));
    }
    return result;
}

std::vector<domain::Candle> readCandles(::duckdb::QueryResult& result,
                                        const std::string& symbol,
                                        const std::string& timeframe) {
    std::vector<domain::Candle> candles;
    while (auto chunk = result.Fetch()) {
        const auto count = chunk->size();
        for (::duckdb::idx_t row = 0; row < count; ++row) {
            domain::Candle candle{};
            candle.symbol = symbol;
            candle.timeframe = timeframe;
            candle.openTs = chunk->GetValue(0, row).GetValue<std::int64_t>();
            candle.closeTs = chunk->GetValue(1, row).GetValue<std::int64_t>();
            candle.open = chunk->GetValue(2, row).GetValue<double>();
            candle.high = chunk->GetValue(3, row).GetValue<double>();
            candle.low = chunk->GetValue(4, row).GetValue<double>();
            candle.close = chunk->GetValue(5, row).GetValue<double>();
            candle.volume = chunk->GetValue(6, row).GetValue<double>();
            candle.quoteVolume = readOptionalDouble(chunk->GetValue(7, row));
            if (const auto trades = chunk->GetValue(8, row); !trades.IsNull()) {
                candle.tradeCount = trades.GetValue<std::int64_t>();
            }
            candle.takerBuyBase = readOptionalDouble(chunk->GetValue(9, row));
            candle.takerBuyQuote = readOptionalDouble(chunk->GetValue(10, row));
            candles.push_back(std::move(candle));
        }
    }
    return candles;
}

}  // namespace

DuckCandleSink::DuckCandleSink(DuckStore& store) : store_(store) {
    writer_ = std::thread([this]() { writerLoop_(); });
}

DuckCandleSink::~DuckCandleSink() {
    shutdown();
}

void DuckCandleSink::appendAsync(const domain::Candle& candle) {
    enqueue_(WriteJob{{candle}, nullptr});
}

void DuckCandleSink::appendBatchAsync(std::vector<domain::Candle> candles) {
    if (candles.empty()) {
        return;
    }
    enqueue_(WriteJob{std::move(candles), nullptr});
}

void DuckCandleSink::enqueue_(WriteJob job) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stopping_) {
            if (!job.candles.empty()) {
                failedWrites_.fetch_add(job.candles.size(), std::memory_order_relaxed);
                LOG_WARN("DuckCandleSink stopped; discarding " << job.candles.size() << " candle(s)");
            }
            if (job.barrier) {
                job.barrier->set_value();
            }
            return;
        }
        queue_.push_back(std::move(job));
    }
    queueCv_.notify_one();
}

void DuckCandleSink::flush() {
    auto barrier = std::make_shared<std::promise<void>>();
    auto done = barrier->get_future();
    enqueue_(WriteJob{{}, std::move(barrier)});
    done.wait();
}

void DuckCandleSink::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    queueCv_.notify_all();
    if (writer_.joinable()) {
        writer_.join();
    }
}

void DuckCandleSink::writerLoop_() {
    while (true) {
        WriteJob job;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        if (!job.candles.empty()) {
            writeBatch_(job.candles);
        }
        if (job.barrier) {
            job.barrier->set_value();
        }
    }
    LOG_DEBUG("DuckCandleSink writer thread finished");
}

void DuckCandleSink::writeBatch_(const std::vector<domain::Candle>& candles) {
    std::lock_guard<std::mutex> writerLock(writerMutex_);
    try {
        ::duckdb::Connection connection(store_.database());
        connection.BeginTransaction();
        try {
            auto statement = connection.Prepare(kInsertCandle);
            if (!statement || statement->HasError()) {
                throw std::runtime_error("prepare failed: " +
                                         (statement ? statement->GetError() : std::string{"unknown error"}));
            }

            DuckdbValueVector parameters;
            parameters.reserve(13);
            for (const auto& candle : candles) {
                parameters.clear();
                parameters.emplace_back(candle.symbol);
                parameters.emplace_back(candle.timeframe);
                parameters.emplace_back(::duckdb::Value::BIGINT(candle.openTs));
                parameters.emplace_back(::duckdb::Value::BIGINT(candle.closeTs));
                parameters.emplace_back(::duckdb::Value::DOUBLE(candle.open));
                parameters.emplace_back(::duckdb::Value::DOUBLE(candle.high));
                parameters.emplace_back(::duckdb::Value::DOUBLE(candle.low));
                parameters.emplace_back(::duckdb::Value::DOUBLE(candle.close));
                parameters.emplace_back(::duckdb::Value::DOUBLE(candle.volume));
                parameters.emplace_back(optionalDouble(candle.quoteVolume));
                parameters.emplace_back(candle.tradeCount ? ::duckdb::Value::BIGINT(*candle.tradeCount)
                                                          : ::duckdb::Value());
                parameters.emplace_back(optionalDouble(candle.takerBuyBase));
                parameters.emplace_back(optionalDouble(candle.takerBuyQuote));

                auto result = statement->Execute(parameters);
                if (!result || result->HasError()) {
                    throw std::runtime_error("insert failed: " +
                                             (result ? result->GetError() : std::string{"unknown error"}));
                }
            }
            connection.Commit();
        } catch (const std::exception&) {
            connection.Rollback();
            throw;
        }
    } catch (const std::exception& ex) {
        failedWrites_.fetch_add(candles.size(), std::memory_order_relaxed);
        Registry::instance().incrementCounter("sink_write_failures_total", candles.size());
        LOG_ERR("DuckCandleSink failed to persist " << candles.size() << " candle(s): " << ex.what());
    }
}

std::optional<domain::Candle> DuckCandleSink::getLastPersisted(const std::string& symbol,
                                                               const std::string& timeframe) {
    auto recent = loadRecent(symbol, timeframe, 1);
    if (recent.empty()) {
        return std::nullopt;
    }
    return std::move(recent.back());
}

std::vector<domain::Candle> DuckCandleSink::loadRecent(const std::string& symbol,
                                                       const std::string& timeframe,
                                                       std::size_t limit) {
    if (limit == 0) {
        return {};
    }
    try {
        ::duckdb::Connection connection(store_.database());
        DuckdbValueVector parameters;
        parameters.emplace_back(symbol);
        parameters.emplace_back(timeframe);
        parameters.emplace_back(::duckdb::Value::BIGINT(static_cast<std::int64_t>(
            std::min<std::size_t>(limit, static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max())))));

        auto result = execute(connection,
                              std::string{kSelectColumns} +
                                  "WHERE symbol = ? AND timeframe = ? ORDER BY open_ts DESC LIMIT ?",
                              parameters);
        auto candles = readCandles(*result, symbol, timeframe);
        std::reverse(candles.begin(), candles.end());
        return candles;
    } catch (const std::exception& ex) {
        LOG_ERR("DuckCandleSink loadRecent " << symbol << '/' << timeframe << " failed: " << ex.what());
    }
    return {};
}

bool DuckCandleSink::deleteSeries(const std::string& symbol, const std::string& timeframe) {
    // Queued writes for the series must land before the delete, not after it.
    flush();

    std::lock_guard<std::mutex> writerLock(writerMutex_);
    try {
        ::duckdb::Connection connection(store_.database());
        DuckdbValueVector parameters;
        parameters.emplace_back(symbol);
        parameters.emplace_back(timeframe);
        execute(connection, "DELETE FROM candles WHERE symbol = ? AND timeframe = ?", parameters);
        LOG_INFO("DuckCandleSink deleted series " << symbol << '/' << timeframe);
        return true;
    } catch (const std::exception& ex) {
        LOG_ERR("DuckCandleSink deleteSeries " << symbol << '/' << timeframe << " failed: " << ex.what());
    }
    return false;
}

std::vector<domain::GapRange> DuckCandleSink::findGaps(const std::string& symbol,
                                                       const std::string& timeframe,
                                                       std::int64_t intervalSeconds) {
    if (intervalSeconds <= 0) {
        return {};
    }

    static constexpr auto kGapQuery = R"SQL(
        SELECT prev_ts, open_ts FROM (
            SELECT open_ts, LAG(open_ts) OVER (ORDER BY open_ts) AS prev_ts
            FROM candles
            WHERE symbol = ? AND timeframe = ?
        )
        WHERE prev_ts IS NOT NULL AND open_ts - prev_ts > ?
        ORDER BY open_ts
    )SQL";

    std::vector<domain::GapRange> gaps;
    try {
        ::duckdb::Connection connection(store_.database());
        DuckdbValueVector parameters;
        parameters.emplace_back(symbol);
        parameters.emplace_back(timeframe);
        parameters.emplace_back(::duckdb::Value::BIGINT(intervalSeconds));

        auto result = execute(connection, kGapQuery, parameters);
        while (auto chunk = result->Fetch()) {
            for (::duckdb::idx_t row = 0; row < chunk->size(); ++row) {
                const auto prev = chunk->GetValue(0, row).GetValue<std::int64_t>();
                const auto next = chunk->GetValue(1, row).GetValue<std::int64_t>();
                domain::GapRange gap{};
                gap.firstMissing = prev + intervalSeconds;
                gap.lastMissing = next - intervalSeconds;
                gap.missingCount = static_cast<std::size_t>((next - prev) / intervalSeconds - 1);
                if (gap.missingCount > 0) {
                    gaps.push_back(gap);
                }
            }
        }
    } catch (const std::exception& ex) {
        LOG_ERR("DuckCandleSink findGaps " << symbol << '/' << timeframe << " failed: " << ex.what());
    }
    return gaps;
}

}  // namespace adapters::duckdb
