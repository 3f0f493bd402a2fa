#ifndef SCIGRAPH_STORAGE_DUCKDB_STORE_H_
#define SCIGRAPH_STORAGE_DUCKDB_STORE_H_

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "scigraph/core/config.h"
#include "scigraph/storage/columnar_store.h"

namespace duckdb {
class DuckDB;
class Connection;
} // namespace duckdb

namespace scigraph {
namespace storage {

/**
 * @brief ColumnarStore backed by one in-process DuckDB database
 *
 * The database lives in memory; input tables are scanned directly from
 * Parquet files by the queries themselves. A single connection is shared
 * and every call is serialized on it.
 *
 * @throws core::StoreUnavailableError if the engine cannot be started
 */
class DuckDBStore : public ColumnarStore {
public:
    explicit DuckDBStore(const core::StoreConfig& config = core::StoreConfig::Default());
    ~DuckDBStore() override;

    DuckDBStore(const DuckDBStore&) = delete;
    DuckDBStore& operator=(const DuckDBStore&) = delete;

    core::Result<RowSet> run(const std::string& sql) override;

    core::Result<void> register_strings(
        const std::string& table,
        const std::string& column,
        const std::vector<std::string>& values) override;

    bool file_exists(const std::string& path) const override;

    const core::StoreConfig& config() const { return config_; }

private:
    core::Result<RowSet> run_locked(const std::string& sql);

    core::StoreConfig config_;
    std::unique_ptr<duckdb::DuckDB> database_;
    std::unique_ptr<duckdb::Connection> connection_;
    std::mutex mutex_;
};

} // namespace storage
} // namespace scigraph

#endif // SCIGRAPH_STORAGE_DUCKDB_STORE_H_
