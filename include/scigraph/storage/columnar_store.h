#ifndef SCIGRAPH_STORAGE_COLUMNAR_STORE_H_
#define SCIGRAPH_STORAGE_COLUMNAR_STORE_H_

#include <string>
#include <vector>

#include "scigraph/core/result.h"
#include "scigraph/storage/row_set.h"

namespace scigraph {
namespace storage {

/**
 * @brief Analytical SQL engine over a directory of Parquet files
 *
 * Implementations execute one statement at a time and return the fully
 * materialized result. Failures are reported through the result code:
 * STORE_UNAVAILABLE for missing or unreadable input files and
 * QUERY_EXECUTION for everything else the engine rejects.
 */
class ColumnarStore {
public:
    virtual ~ColumnarStore() = default;

    virtual core::Result<RowSet> run(const std::string& sql) = 0;

    /**
     * @brief Creates (or replaces) a one-column table holding the given values
     *
     * Used to join an in-memory id set back into subsequent queries.
     */
    virtual core::Result<void> register_strings(
        const std::string& table,
        const std::string& column,
        const std::vector<std::string>& values) = 0;

    virtual bool file_exists(const std::string& path) const = 0;
};

// Single-quoted SQL string literal with embedded quotes doubled
std::string QuoteLiteral(const std::string& value);

// Double-quoted SQL identifier with embedded quotes doubled
std::string QuoteIdentifier(const std::string& name);

// Table expression scanning one Parquet file
std::string ReadParquet(const std::string& path);

} // namespace storage
} // namespace scigraph

#endif // SCIGRAPH_STORAGE_COLUMNAR_STORE_H_
