#pragma once

#include <memory>
#include <string>

namespace duckdb {
class DuckDB;
}  // namespace duckdb

namespace adapters::duckdb {

// Owns the process-wide DuckDB instance. ":memory:" opens a transient database.
class DuckStore {
public:
    explicit DuckStore(std::string dbPath = "data/market.duckdb");
    ~DuckStore();

    DuckStore(const DuckStore&) = delete;
    DuckStore& operator=(const DuckStore&) = delete;

    // Creates the candles table if it does not exist. Throws std::runtime_error.
    void migrate();

    ::duckdb::DuckDB& database() { return *db_; }
    const std::string& path() const noexcept { return dbPath_; }

private:
    std::string dbPath_;
    std::unique_ptr<::duckdb::DuckDB> db_;
};

}  // namespace adapters::duckdb
