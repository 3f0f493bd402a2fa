#include "scigraph/pipeline/sample_materializer.h"

#include <algorithm>
#include <filesystem>
#include <vector>

#include "scigraph/common/logger.h"
#include "scigraph/query/select_builder.h"

namespace scigraph {
namespace pipeline {

using query::Predicate;
using query::SelectBuilder;
using storage::ReadParquet;

namespace {

constexpr const char* kSampleIdsTable = "sample_ids";

Predicate JoinOn(const std::string& lhs, const std::string& rhs) {
    return Predicate::CompareColumns(lhs, Predicate::Op::EQ, rhs);
}

} // namespace

SampleMaterializer::SampleMaterializer(std::shared_ptr<storage::ColumnarStore> store,
                                       core::CorpusPaths source,
                                       core::CorpusPaths target)
    : store_(std::move(store)), source_(std::move(source)), target_(std::move(target)) {
    if (!store_) {
        throw core::InvalidArgumentError("SampleMaterializer requires a store");
    }
}

core::Result<int64_t> SampleMaterializer::copy_to(const std::string& select_sql, const std::string& path) {
    auto result = store_->run("COPY (\n" + select_sql + "\n) TO " + storage::QuoteLiteral(path) +
                              " (FORMAT PARQUET)");
    if (!result.ok()) {
        return core::Result<int64_t>::error_from(result);
    }
    // COPY reports the number of rows written
    int64_t written = 0;
    if (result.value().row_count() > 0 && result.value().column_count() > 0) {
        written = result.value().get_int(0, 0).value_or(0);
    }
    SCIGRAPH_INFO("Wrote {} rows to {}", written, path);
    return core::Result<int64_t>(written);
}

core::Result<SampleSummary> SampleMaterializer::materialize(const core::PaperTable& papers) {
    using R = core::Result<SampleSummary>;

    std::error_code ec;
    std::filesystem::create_directories(target_.directory, ec);
    if (ec) {
        return R::error("Failed to create sample directory " + target_.directory + ": " + ec.message(),
                        core::Error::Code::STORE_UNAVAILABLE);
    }

    std::vector<std::string> ids;
    ids.reserve(papers.size());
    for (const auto& paper : papers.papers) {
        ids.push_back(paper.paper_id);
    }
    std::sort(ids.begin(), ids.end());
    auto registered = store_->register_strings(kSampleIdsTable, "paperid", ids);
    if (!registered.ok()) {
        return R::error_from(registered);
    }

    SampleSummary summary;
    summary.directory = target_.directory;

    // Tables keyed directly by paperid
    struct PaperKeyed {
        std::string source;
        std::string target;
        int64_t* count;
        bool optional;
    };
    const std::vector<PaperKeyed> keyed = {
        {source_.papers(), target_.papers(), &summary.papers, false},
        {source_.authorships(), target_.authorships(), &summary.authorships, false},
        {source_.paper_fields(), target_.paper_fields(), &summary.field_assignments, false},
        {source_.patent_links(), target_.patent_links(), &summary.patent_links, true},
    };
    for (const auto& table : keyed) {
        if (table.optional && !store_->file_exists(table.source)) {
            SCIGRAPH_WARN("Optional table {} not found; skipping", table.source);
            continue;
        }
        SelectBuilder rows;
        rows.select({"t.*"})
            .from(ReadParquet(table.source), "t")
            .inner_join(kSampleIdsTable, "s", JoinOn("t.paperid", "s.paperid"));
        auto copied = copy_to(rows.build(), table.target);
        if (!copied.ok()) {
            return R::error_from(copied);
        }
        *table.count = copied.value();
    }

    // References touching the subset on either end
    SelectBuilder refs;
    refs.distinct()
        .select({"r.*"})
        .from(ReadParquet(source_.paper_refs()), "r")
        .left_join(kSampleIdsTable, "citing", JoinOn("r.citing_paperid", "citing.paperid"))
        .left_join(kSampleIdsTable, "cited", JoinOn("r.cited_paperid", "cited.paperid"))
        .where(Predicate::Any({
            Predicate::IsNotNull("citing.paperid"),
            Predicate::IsNotNull("cited.paperid"),
        }));
    auto copied_refs = copy_to(refs.build(), target_.paper_refs());
    if (!copied_refs.ok()) {
        return R::error_from(copied_refs);
    }
    summary.references = copied_refs.value();

    // Fields referenced by the copied assignments
    SelectBuilder fields;
    fields.distinct()
        .select({"f.*"})
        .from(ReadParquet(source_.fields()), "f")
        .inner_join("(SELECT DISTINCT fieldid FROM " + ReadParquet(target_.paper_fields()) + ")",
                    "used", JoinOn("f.fieldid", "used.fieldid"));
    auto copied_fields = copy_to(fields.build(), target_.fields());
    if (!copied_fields.ok()) {
        return R::error_from(copied_fields);
    }
    summary.fields = copied_fields.value();

    SCIGRAPH_INFO("Sample materialized in {}: {} papers, {} references",
                  summary.directory, summary.papers, summary.references);
    return R(std::move(summary));
}

} // namespace pipeline
} // namespace scigraph
