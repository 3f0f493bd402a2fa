#include "scigraph/storage/parquet/reader.hpp"
#include <arrow/io/file.h>
#include <arrow/table.h>
#include <parquet/arrow/reader.h>
#include <parquet/exception.h>
#include <parquet/file_reader.h>

namespace scigraph {
namespace storage {
namespace parquet {

namespace {

using TableResult = core::Result<std::shared_ptr<arrow::Table>>;

TableResult CorruptTable(const std::string& path, const std::string& what) {
    return TableResult::error(path + ": " + what, core::Error::Code::CACHE_CORRUPTION);
}

} // namespace

ParquetReader::~ParquetReader() {
    if (source_ && !source_->closed()) {
        auto status = source_->Close();
        (void)status;
    }
}

core::Result<void> ParquetReader::NotOpen() const {
    return core::Result<void>::error("Parquet reader is not open", core::Error::Code::INTERNAL);
}

core::Result<void> ParquetReader::Open(const std::string& path) {
    reader_.reset();
    schema_.reset();
    path_ = path;

    auto source = arrow::io::ReadableFile::Open(path_);
    if (!source.ok()) {
        return core::Result<void>::error("Cannot open " + path_ + ": " + source.status().ToString(),
                                         core::Error::Code::NOT_FOUND);
    }
    source_ = *source;

    // ParquetFileReader::Open throws on a truncated or foreign file
    arrow::Status status;
    try {
        status = ::parquet::arrow::FileReader::Make(arrow::default_memory_pool(),
                                                    ::parquet::ParquetFileReader::Open(source_),
                                                    &reader_);
    } catch (const ::parquet::ParquetException& e) {
        status = arrow::Status::IOError(e.what());
    }
    if (status.ok()) {
        status = reader_->GetSchema(&schema_);
    }
    if (!status.ok()) {
        reader_.reset();
        return core::Result<void>::error(path_ + " is not a readable Parquet file: " + status.ToString(),
                                         core::Error::Code::CACHE_CORRUPTION);
    }
    return core::Result<void>();
}

core::Result<std::shared_ptr<arrow::Table>> ParquetReader::ReadTable() {
    if (!reader_) {
        return TableResult::error_from(NotOpen());
    }
    std::shared_ptr<arrow::Table> table;
    auto status = reader_->ReadTable(&table);
    if (!status.ok() || !table) {
        return CorruptTable(path_, "cannot read table: " + status.ToString());
    }
    return TableResult(table);
}

core::Result<std::shared_ptr<arrow::Table>> ParquetReader::ReadColumns(const std::vector<std::string>& columns) {
    if (!reader_) {
        return TableResult::error_from(NotOpen());
    }
    std::vector<int> indices;
    indices.reserve(columns.size());
    for (const auto& name : columns) {
        const int index = schema_->GetFieldIndex(name);
        if (index < 0) {
            return CorruptTable(path_, "missing column '" + name + "'");
        }
        indices.push_back(index);
    }
    std::shared_ptr<arrow::Table> table;
    auto status = reader_->ReadTable(indices, &table);
    if (!status.ok() || !table) {
        return CorruptTable(path_, "cannot read columns: " + status.ToString());
    }
    return TableResult(table);
}

core::Result<void> ParquetReader::Close() {
    reader_.reset();
    if (source_) {
        auto status = source_->Close();
        source_.reset();
        if (!status.ok()) {
            return core::Result<void>::error("Cannot close " + path_ + ": " + status.ToString());
        }
    }
    return core::Result<void>();
}

int ParquetReader::GetNumRowGroups() const {
    return reader_ ? reader_->num_row_groups() : 0;
}

int64_t ParquetReader::num_rows() const {
    return reader_ ? reader_->parquet_reader()->metadata()->num_rows() : 0;
}

} // namespace parquet
} // namespace storage
} // namespace scigraph
