#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <arrow/api.h>
#include <gtest/gtest.h>

#include "scigraph/core/config.h"
#include "scigraph/storage/parquet/writer.hpp"

namespace scigraph {
namespace testutil {

/**
 * Accumulates corpus rows and writes them as the six Parquet tables the
 * engine reads, using the column names of the production corpus.
 */
class CorpusBuilder {
public:
    CorpusBuilder& paper(const std::string& id, int32_t year, int64_t citations = 0, int64_t patents = 0,
                         const std::string& doctype = "article", bool retracted = false) {
        papers_.push_back({id, year, doctype, retracted, citations, patents});
        return *this;
    }

    CorpusBuilder& author(const std::string& paper_id, const std::string& author_id,
                          const std::string& institution_id, const std::string& position = "first") {
        authorships_.push_back({paper_id, author_id, institution_id, position});
        return *this;
    }

    CorpusBuilder& assign_field(const std::string& paper_id, const std::string& field_id) {
        assignments_.push_back({paper_id, field_id});
        return *this;
    }

    CorpusBuilder& field(const std::string& field_id, const std::string& display_name) {
        fields_.push_back({field_id, display_name});
        return *this;
    }

    CorpusBuilder& cite(const std::string& citing, const std::string& cited) {
        references_.push_back({citing, cited});
        return *this;
    }

    CorpusBuilder& patent(const std::string& paper_id, const std::string& patent_id) {
        patent_links_.push_back({paper_id, patent_id});
        return *this;
    }

    // Skips the patent-link table, as in corpora without patent data
    CorpusBuilder& without_patent_table() {
        write_patents_ = false;
        return *this;
    }

    void Write(const core::CorpusPaths& paths) const {
        WriteTable(paths.papers(), PapersBatch());
        WriteTable(paths.paper_refs(), PairBatch("citing_paperid", "cited_paperid", references_));
        WriteTable(paths.authorships(), AuthorshipBatch());
        WriteTable(paths.paper_fields(), PairBatch("paperid", "fieldid", assignments_));
        WriteTable(paths.fields(), PairBatch("fieldid", "display_name", fields_));
        if (write_patents_) {
            WriteTable(paths.patent_links(), PairBatch("paperid", "patent", patent_links_));
        }
    }

private:
    struct PaperRow {
        std::string id;
        int32_t year;
        std::string doctype;
        bool retracted;
        int64_t citations;
        int64_t patents;
    };

    struct AuthorshipRow {
        std::string paper_id;
        std::string author_id;
        std::string institution_id;
        std::string position;
    };

    using Pair = std::pair<std::string, std::string>;

    static void WriteTable(const std::string& path, const std::shared_ptr<arrow::RecordBatch>& batch) {
        ASSERT_NE(batch, nullptr) << path;
        auto written = storage::parquet::WriteParquetFile(path, batch);
        ASSERT_TRUE(written.ok()) << path << ": " << written.error();
    }

    static std::shared_ptr<arrow::Array> Finish(arrow::ArrayBuilder& builder) {
        std::shared_ptr<arrow::Array> array;
        EXPECT_TRUE(builder.Finish(&array).ok());
        return array;
    }

    std::shared_ptr<arrow::RecordBatch> PapersBatch() const {
        arrow::StringBuilder ids;
        arrow::Int32Builder years;
        arrow::StringBuilder doctypes;
        arrow::BooleanBuilder retracted;
        arrow::Int64Builder citations;
        arrow::Int64Builder patents;
        for (const auto& row : papers_) {
            EXPECT_TRUE(ids.Append(row.id).ok());
            EXPECT_TRUE(years.Append(row.year).ok());
            EXPECT_TRUE(doctypes.Append(row.doctype).ok());
            EXPECT_TRUE(retracted.Append(row.retracted).ok());
            EXPECT_TRUE(citations.Append(row.citations).ok());
            EXPECT_TRUE(patents.Append(row.patents).ok());
        }
        auto schema = arrow::schema({
            arrow::field("paperid", arrow::utf8()),
            arrow::field("year", arrow::int32()),
            arrow::field("doctype", arrow::utf8()),
            arrow::field("is_retracted", arrow::boolean()),
            arrow::field("cited_by_count", arrow::int64()),
            arrow::field("patent_count", arrow::int64()),
        });
        return arrow::RecordBatch::Make(schema, static_cast<int64_t>(papers_.size()),
                                        {Finish(ids), Finish(years), Finish(doctypes), Finish(retracted),
                                         Finish(citations), Finish(patents)});
    }

    std::shared_ptr<arrow::RecordBatch> AuthorshipBatch() const {
        arrow::StringBuilder papers;
        arrow::StringBuilder authors;
        arrow::StringBuilder institutions;
        arrow::StringBuilder positions;
        for (const auto& row : authorships_) {
            EXPECT_TRUE(papers.Append(row.paper_id).ok());
            EXPECT_TRUE(authors.Append(row.author_id).ok());
            EXPECT_TRUE(institutions.Append(row.institution_id).ok());
            EXPECT_TRUE(positions.Append(row.position).ok());
        }
        auto schema = arrow::schema({
            arrow::field("paperid", arrow::utf8()),
            arrow::field("authorid", arrow::utf8()),
            arrow::field("institutionid", arrow::utf8()),
            arrow::field("author_position", arrow::utf8()),
        });
        return arrow::RecordBatch::Make(schema, static_cast<int64_t>(authorships_.size()),
                                        {Finish(papers), Finish(authors), Finish(institutions),
                                         Finish(positions)});
    }

    static std::shared_ptr<arrow::RecordBatch> PairBatch(const std::string& first, const std::string& second,
                                                         const std::vector<Pair>& rows) {
        arrow::StringBuilder a;
        arrow::StringBuilder b;
        for (const auto& row : rows) {
            EXPECT_TRUE(a.Append(row.first).ok());
            EXPECT_TRUE(b.Append(row.second).ok());
        }
        auto schema = arrow::schema({
            arrow::field(first, arrow::utf8()),
            arrow::field(second, arrow::utf8()),
        });
        return arrow::RecordBatch::Make(schema, static_cast<int64_t>(rows.size()), {Finish(a), Finish(b)});
    }

    std::vector<PaperRow> papers_;
    std::vector<AuthorshipRow> authorships_;
    std::vector<Pair> assignments_;
    std::vector<Pair> fields_;
    std::vector<Pair> references_;
    std::vector<Pair> patent_links_;
    bool write_patents_ = true;
};

} // namespace testutil
} // namespace scigraph
