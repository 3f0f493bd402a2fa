#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "scigraph/core/result.h"
#include "scigraph/core/types.h"

namespace scigraph {
namespace storage {
namespace parquet {

/**
 * @brief Converts between engine types and the Arrow layouts of the cache files
 *
 * Id sets: one utf8 column `paperid`.
 * Paper tables: paperid, year, doctype, is_retracted, cited_by_count, patent_count.
 * Edge lists: two utf8 endpoint columns (names chosen by the caller) and an int64 `weight`.
 */
class SchemaMapper {
public:
    static std::shared_ptr<arrow::Schema> IdSetSchema();
    static std::shared_ptr<arrow::Schema> PaperTableSchema();
    static std::shared_ptr<arrow::Schema> EdgeListSchema(const std::string& source_column,
                                                         const std::string& target_column);

    // Ids are written in sorted order so identical sets produce identical files
    static core::Result<std::shared_ptr<arrow::RecordBatch>> ToRecordBatch(
        const core::PaperIdSet& ids);

    static core::Result<std::shared_ptr<arrow::RecordBatch>> ToRecordBatch(
        const std::vector<core::Paper>& papers);

    static core::Result<std::shared_ptr<arrow::RecordBatch>> ToRecordBatch(
        const std::vector<core::EdgeRecord>& edges,
        const std::string& source_column,
        const std::string& target_column);

    // Conversions back fail with Error::Code::SCHEMA when a required column
    // is absent or has an unexpected type
    static core::Result<core::PaperIdSet> ToIdSet(const std::shared_ptr<arrow::Table>& table);

    static core::Result<std::vector<core::Paper>> ToPapers(const std::shared_ptr<arrow::Table>& table);

    static core::Result<std::vector<core::EdgeRecord>> ToEdges(
        const std::shared_ptr<arrow::Table>& table,
        const std::string& source_column,
        const std::string& target_column);
};

} // namespace parquet
} // namespace storage
} // namespace scigraph
