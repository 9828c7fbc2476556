#include "adapters/duckdb/DuckStore.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

constexpr auto kInMemory = ":memory:";

constexpr auto kCreateCandlesTable = R"SQL(
    CREATE TABLE IF NOT EXISTS candles (
        symbol          VARCHAR NOT NULL,
        timeframe       VARCHAR NOT NULL,
        open_ts         BIGINT  NOT NULL,
        close_ts        BIGINT  NOT NULL,
        open            DOUBLE  NOT NULL,
        high            DOUBLE  NOT NULL,
        low             DOUBLE  NOT NULL,
        close           DOUBLE  NOT NULL,
        volume          DOUBLE  NOT NULL,
        quote_volume    DOUBLE,
        trade_count     BIGINT,
        taker_buy_base  DOUBLE,
        taker_buy_quote DOUBLE,
        received_at     TIMESTAMP DEFAULT current_timestamp,
        PRIMARY KEY (symbol, timeframe, open_ts)
    )
)SQL";

}  // namespace

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {
    if (dbPath_ != kInMemory) {
        const fs::path path{dbPath_};
        if (path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                throw std::runtime_error("DuckStore: unable to create directory '" + path.parent_path().string() +
                                         "': " + ec.message());
            }
        }
    }
    db_ = std::make_unique<::duckdb::DuckDB>(dbPath_ == kInMemory ? nullptr : dbPath_.c_str());
    LOG_INFO("DuckStore opened " << dbPath_);
}

DuckStore::~DuckStore() = default;

void DuckStore::migrate() {
    ::duckdb::Connection connection(*db_);

    auto result = connection.Query(kCreateCandlesTable);
    if (!result || result->HasError()) {
        const std::string errorMessage =
            result ? result->GetError() : std::string("unknown error creating candles table");
        throw std::runtime_error("DuckStore: migration failed: " + errorMessage);
    }

    LOG_INFO("DuckStore migration finished for " << dbPath_);
}

}  // namespace adapters::duckdb
