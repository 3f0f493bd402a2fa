#include "scigraph/storage/duckdb_store.h"

#include <chrono>
#include <filesystem>

#include "duckdb.hpp"
#include "scigraph/common/logger.h"
#include "scigraph/core/error.h"

namespace scigraph {
namespace storage {

namespace {

Value ConvertValue(const duckdb::Value& value) {
    if (value.IsNull()) {
        return std::monostate{};
    }
    using duckdb::LogicalTypeId;
    switch (value.type().id()) {
        case LogicalTypeId::BOOLEAN:
            return value.GetValue<bool>();
        case LogicalTypeId::TINYINT:
        case LogicalTypeId::SMALLINT:
        case LogicalTypeId::INTEGER:
        case LogicalTypeId::BIGINT:
        case LogicalTypeId::UTINYINT:
        case LogicalTypeId::USMALLINT:
        case LogicalTypeId::UINTEGER:
        case LogicalTypeId::UBIGINT:
        case LogicalTypeId::HUGEINT:
            return value.GetValue<int64_t>();
        case LogicalTypeId::FLOAT:
        case LogicalTypeId::DOUBLE:
        case LogicalTypeId::DECIMAL:
            return value.GetValue<double>();
        default:
            return value.ToString();
    }
}

// DuckDB reports unreadable or missing files as IO errors
bool IsMissingInput(const std::string& message) {
    return message.find("IO Error") != std::string::npos ||
           message.find("No files found") != std::string::npos;
}

} // namespace

DuckDBStore::DuckDBStore(const core::StoreConfig& config) : config_(config) {
    try {
        database_ = std::make_unique<duckdb::DuckDB>(nullptr);
        connection_ = std::make_unique<duckdb::Connection>(*database_);
    } catch (const std::exception& e) {
        throw core::StoreUnavailableError("Failed to start DuckDB: " + std::string(e.what()));
    }

    const std::vector<std::string> settings = {
        "SET memory_limit=" + QuoteLiteral(config_.memory_limit),
        "SET threads=" + std::to_string(config_.threads),
        std::string("SET preserve_insertion_order=") +
            (config_.preserve_insertion_order ? "true" : "false"),
    };
    for (const auto& statement : settings) {
        auto result = run_locked(statement);
        if (!result.ok()) {
            throw core::StoreUnavailableError("Failed to configure DuckDB: " + result.error());
        }
    }
    SCIGRAPH_DEBUG("DuckDB store ready (memory_limit={}, threads={})",
                   config_.memory_limit, config_.threads);
}

DuckDBStore::~DuckDBStore() = default;

core::Result<RowSet> DuckDBStore::run(const std::string& sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    return run_locked(sql);
}

core::Result<RowSet> DuckDBStore::run_locked(const std::string& sql) {
    auto start = std::chrono::steady_clock::now();
    auto result = connection_->Query(sql);

    if (result->HasError()) {
        const std::string message = result->GetError();
        if (IsMissingInput(message)) {
            return core::Result<RowSet>::error(core::StoreUnavailableError(message + "\nquery: " + sql));
        }
        return core::Result<RowSet>::error(core::QueryExecutionError(message, sql));
    }

    std::vector<std::string> names(result->names.begin(), result->names.end());
    RowSet rows(std::move(names));
    const auto column_count = result->ColumnCount();
    const auto row_count = result->RowCount();
    for (duckdb::idx_t r = 0; r < row_count; ++r) {
        std::vector<Value> row;
        row.reserve(column_count);
        for (duckdb::idx_t c = 0; c < column_count; ++c) {
            row.push_back(ConvertValue(result->GetValue(c, r)));
        }
        rows.add_row(std::move(row));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    SCIGRAPH_DEBUG("Query returned {} rows in {} ms", rows.row_count(), elapsed);
    return core::Result<RowSet>(std::move(rows));
}

core::Result<void> DuckDBStore::register_strings(
    const std::string& table,
    const std::string& column,
    const std::vector<std::string>& values) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto created = run_locked("CREATE OR REPLACE TABLE " + QuoteIdentifier(table) +
                              " (" + QuoteIdentifier(column) + " VARCHAR)");
    if (!created.ok()) {
        return core::Result<void>::error_from(created);
    }

    try {
        duckdb::Appender appender(*connection_, table);
        for (const auto& value : values) {
            appender.BeginRow();
            appender.Append(value.c_str());
            appender.EndRow();
        }
        appender.Close();
    } catch (const std::exception& e) {
        return core::Result<void>::error("Failed to register table " + table + ": " + e.what(),
                                         core::Error::Code::QUERY_EXECUTION);
    }
    SCIGRAPH_DEBUG("Registered {} values in table {}", values.size(), table);
    return core::Result<void>();
}

bool DuckDBStore::file_exists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace storage
} // namespace scigraph
