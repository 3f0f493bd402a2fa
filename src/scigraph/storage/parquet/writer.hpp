#pragma once

#include <arrow/api.h>
#include <parquet/arrow/writer.h>
#include <string>
#include <memory>
#include "scigraph/core/result.h"

namespace scigraph {
namespace storage {
namespace parquet {

/**
 * @brief Layout of the files written by ParquetWriter
 *
 * Cache artifacts are small and read back whole, so the defaults favor one
 * dictionary-encoded row group per file.
 */
struct WriterOptions {
    int64_t max_row_group_length = 64 * 1024;
    ::parquet::Compression::type compression = ::parquet::Compression::ZSTD;
    bool dictionary = true;
};

/**
 * @brief Streams record batches of a single schema into one Parquet file
 *
 * The file is only valid after Close() succeeds; callers that need an
 * all-or-nothing write stage the file and rename it (see DiskCache).
 */
class ParquetWriter {
public:
    ParquetWriter() = default;
    ~ParquetWriter();

    ParquetWriter(const ParquetWriter&) = delete;
    ParquetWriter& operator=(const ParquetWriter&) = delete;

    core::Result<void> Open(const std::string& path, std::shared_ptr<arrow::Schema> schema,
                            const WriterOptions& options = WriterOptions());
    // Shorthand used by tests to force several row groups
    core::Result<void> Open(const std::string& path, std::shared_ptr<arrow::Schema> schema,
                            int64_t max_row_group_length);

    // The batch schema must equal the schema given to Open()
    core::Result<void> WriteBatch(const std::shared_ptr<arrow::RecordBatch>& batch);

    // Writes the footer; the writer can be reopened afterwards
    core::Result<void> Close();

    bool is_open() const { return writer_ != nullptr; }
    int64_t rows_written() const { return rows_written_; }
    const std::string& GetPath() const { return path_; }

private:
    core::Result<void> Failure(const std::string& what, const arrow::Status& status) const;

    std::string path_;
    std::shared_ptr<arrow::Schema> schema_;
    std::shared_ptr<arrow::io::FileOutputStream> sink_;
    std::unique_ptr<::parquet::arrow::FileWriter> writer_;
    int64_t rows_written_ = 0;
};

// Opens, writes one batch and closes
core::Result<void> WriteParquetFile(const std::string& path,
                                    const std::shared_ptr<arrow::RecordBatch>& batch);

} // namespace parquet
} // namespace storage
} // namespace scigraph
