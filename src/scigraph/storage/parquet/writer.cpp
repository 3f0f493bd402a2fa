#include "scigraph/storage/parquet/writer.hpp"
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

namespace scigraph {
namespace storage {
namespace parquet {

ParquetWriter::~ParquetWriter() {
    // An unclosed file has no footer and is unreadable anyway
    if (writer_) {
        auto status = writer_->Close();
        (void)status;
    }
    if (sink_ && !sink_->closed()) {
        auto status = sink_->Close();
        (void)status;
    }
}

core::Result<void> ParquetWriter::Failure(const std::string& what, const arrow::Status& status) const {
    return core::Result<void>::error(what + " " + path_ + ": " + status.ToString(),
                                     core::Error::Code::STORE_UNAVAILABLE);
}

core::Result<void> ParquetWriter::Open(const std::string& path, std::shared_ptr<arrow::Schema> schema,
                                       int64_t max_row_group_length) {
    WriterOptions options;
    options.max_row_group_length = max_row_group_length;
    return Open(path, std::move(schema), options);
}

core::Result<void> ParquetWriter::Open(const std::string& path, std::shared_ptr<arrow::Schema> schema,
                                       const WriterOptions& options) {
    if (writer_) {
        return core::Result<void>::error("Writer already open on " + path_, core::Error::Code::INTERNAL);
    }
    if (!schema) {
        return core::Result<void>::error("No schema given for " + path, core::Error::Code::INVALID_ARGUMENT);
    }
    path_ = path;
    schema_ = std::move(schema);
    rows_written_ = 0;

    auto sink = arrow::io::FileOutputStream::Open(path_);
    if (!sink.ok()) {
        return Failure("Cannot create", sink.status());
    }
    sink_ = *sink;

    ::parquet::WriterProperties::Builder properties;
    properties.compression(options.compression)
        ->max_row_group_length(options.max_row_group_length)
        ->enable_statistics();
    if (options.dictionary) {
        properties.enable_dictionary();
    } else {
        properties.disable_dictionary();
    }

    // Keep the Arrow schema so string and int widths survive the round trip
    auto arrow_properties = ::parquet::ArrowWriterProperties::Builder().store_schema()->build();

    auto writer = ::parquet::arrow::FileWriter::Open(*schema_, arrow::default_memory_pool(), sink_,
                                                     properties.build(), arrow_properties);
    if (!writer.ok()) {
        auto closed = sink_->Close();
        (void)closed;
        sink_.reset();
        return Failure("Cannot start Parquet file", writer.status());
    }
    writer_ = std::move(writer).ValueOrDie();
    return core::Result<void>();
}

core::Result<void> ParquetWriter::WriteBatch(const std::shared_ptr<arrow::RecordBatch>& batch) {
    if (!writer_) {
        return core::Result<void>::error("Write to a Parquet writer that is not open",
                                         core::Error::Code::INTERNAL);
    }
    if (!batch->schema()->Equals(*schema_, false)) {
        return core::Result<void>::error("Batch schema " + batch->schema()->ToString() +
                                         " does not match " + path_,
                                         core::Error::Code::SCHEMA);
    }
    auto status = writer_->WriteRecordBatch(*batch);
    if (!status.ok()) {
        return Failure("Cannot write batch to", status);
    }
    rows_written_ += batch->num_rows();
    return core::Result<void>();
}

core::Result<void> ParquetWriter::Close() {
    arrow::Status status;
    if (writer_) {
        status = writer_->Close();
        writer_.reset();
    }
    if (sink_) {
        if (status.ok() && !sink_->closed()) {
            status = sink_->Close();
        }
        sink_.reset();
    }
    if (!status.ok()) {
        return Failure("Cannot finish", status);
    }
    return core::Result<void>();
}

core::Result<void> WriteParquetFile(const std::string& path,
                                    const std::shared_ptr<arrow::RecordBatch>& batch) {
    ParquetWriter writer;
    auto opened = writer.Open(path, batch->schema());
    if (!opened.ok()) {
        return opened;
    }
    auto written = writer.WriteBatch(batch);
    if (!written.ok()) {
        return written;
    }
    return writer.Close();
}

} // namespace parquet
} // namespace storage
} // namespace scigraph
