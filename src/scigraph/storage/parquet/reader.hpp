#pragma once

#include <arrow/api.h>
#include <parquet/arrow/reader.h>
#include <string>
#include <memory>
#include <vector>
#include "scigraph/core/result.h"

namespace scigraph {
namespace storage {
namespace parquet {

/**
 * @brief Reads cache artifacts back from Parquet
 *
 * A missing file is NOT_FOUND. Anything that cannot be decoded (foreign
 * bytes, truncated footer, absent column) is CACHE_CORRUPTION so callers can
 * discard the file and recompute.
 */
class ParquetReader {
public:
    ParquetReader() = default;
    ~ParquetReader();

    ParquetReader(const ParquetReader&) = delete;
    ParquetReader& operator=(const ParquetReader&) = delete;

    core::Result<void> Open(const std::string& path);

    core::Result<std::shared_ptr<arrow::Table>> ReadTable();
    // Reads only the named columns; every one of them must exist
    core::Result<std::shared_ptr<arrow::Table>> ReadColumns(const std::vector<std::string>& columns);

    core::Result<void> Close();

    int GetNumRowGroups() const;
    int64_t num_rows() const;
    std::shared_ptr<arrow::Schema> schema() const { return schema_; }

private:
    core::Result<void> NotOpen() const;

    std::string path_;
    std::shared_ptr<arrow::io::ReadableFile> source_;
    std::unique_ptr<::parquet::arrow::FileReader> reader_;
    std::shared_ptr<arrow::Schema> schema_;
};

} // namespace parquet
} // namespace storage
} // namespace scigraph
