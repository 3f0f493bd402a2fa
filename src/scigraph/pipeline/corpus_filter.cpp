#include "scigraph/pipeline/corpus_filter.h"

#include <algorithm>

#include "scigraph/common/logger.h"
#include "scigraph/pipeline/filter_signature.h"
#include "scigraph/query/select_builder.h"

namespace scigraph {
namespace pipeline {

using query::Predicate;
using query::SelectBuilder;
using storage::ArtifactKind;
using storage::CacheKey;
using storage::ReadParquet;

namespace {

constexpr const char* kFilteredIdsTable = "filtered_ids";
constexpr const char* kPatentIdsTable = "patent_query_ids";

std::vector<std::string> SortedIds(const core::PaperIdSet& ids) {
    std::vector<std::string> sorted(ids.begin(), ids.end());
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

core::Result<core::PaperIdSet> CollectIds(const storage::RowSet& rows, core::PaperIdSet ids) {
    if (!rows.has_column("paperid")) {
        return core::Result<core::PaperIdSet>::error("Id query result has no paperid column",
                                                     core::Error::Code::SCHEMA);
    }
    for (auto& id : rows.string_column("paperid")) {
        ids.insert(std::move(id));
    }
    return core::Result<core::PaperIdSet>(std::move(ids));
}

} // namespace

CorpusFilter::CorpusFilter(std::shared_ptr<storage::ColumnarStore> store,
                           core::CorpusPaths paths,
                           core::FilterCriteria criteria,
                           storage::DiskCache& cache,
                           int current_year)
    : store_(std::move(store)),
      paths_(std::move(paths)),
      criteria_(std::move(criteria)),
      cache_(cache),
      current_year_(current_year),
      signature_(FilterSignature(criteria_)) {
    if (!store_) {
        throw core::InvalidArgumentError("CorpusFilter requires a store");
    }
    SCIGRAPH_DEBUG("Corpus filter {} -> signature {}", SerializeCriteria(criteria_), signature_);
}

std::string CorpusFilter::id_query(int lookback_years) const {
    SelectBuilder institution_papers;
    institution_papers.distinct()
        .select({"paperid"})
        .from(ReadParquet(paths_.authorships()))
        .where(Predicate::All({
            Predicate::Eq("institutionid", criteria_.institution_id),
            Predicate::Eq("author_position", core::ToString(criteria_.author_position)),
        }));

    SelectBuilder field_papers;
    field_papers.distinct()
        .select({"paperid"})
        .from(ReadParquet(paths_.paper_fields()))
        .where(Predicate::Eq("fieldid", criteria_.field_id));

    const int64_t start_year = static_cast<int64_t>(current_year_) - lookback_years;
    Predicate paper_filter = Predicate::All({
        Predicate::Between("p.year", start_year, static_cast<int64_t>(current_year_)),
        Predicate::Eq("p.doctype", core::ToString(criteria_.doctype)),
        criteria_.exclude_retracted ? Predicate::Eq("p.is_retracted", false) : Predicate(),
    });

    SelectBuilder ids;
    ids.with("institution_papers", institution_papers.build())
        .with("field_papers", field_papers.build())
        .distinct()
        .select({"p.paperid"})
        .from(ReadParquet(paths_.papers()), "p")
        .inner_join("institution_papers", "ip",
                    Predicate::CompareColumns("p.paperid", Predicate::Op::EQ, "ip.paperid"))
        .inner_join("field_papers", "fp",
                    Predicate::CompareColumns("p.paperid", Predicate::Op::EQ, "fp.paperid"))
        .where(std::move(paper_filter));
    return ids.build();
}

core::Result<std::shared_ptr<const core::PaperIdSet>> CorpusFilter::filtered_paper_ids(int lookback_years) {
    using R = core::Result<std::shared_ptr<const core::PaperIdSet>>;
    if (lookback_years < 0) {
        return R::error("lookback window must be non-negative, got " + std::to_string(lookback_years),
                        core::Error::Code::INVALID_ARGUMENT);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto cached = ids_by_window_.find(lookback_years);
    if (cached != ids_by_window_.end()) {
        return R(cached->second);
    }

    const CacheKey key(ArtifactKind::PAPER_IDS, lookback_years, signature_);
    auto lookup = cache_.load_ids(key);
    if (lookup.hit()) {
        SCIGRAPH_DEBUG("Loaded {} filtered paper ids for {}yr from {}",
                       lookup.value.size(), lookback_years, cache_.path_for(key));
        auto ids = std::make_shared<const core::PaperIdSet>(std::move(lookup.value));
        ids_by_window_[lookback_years] = ids;
        return R(ids);
    }
    if (lookup.corrupt()) {
        SCIGRAPH_WARN("Discarding unreadable cache file {}: {}", cache_.path_for(key), lookup.detail);
    }

    auto computed = lookback_years >= kStreamingWindowYears
        ? query_ids_streamed(lookback_years)
        : query_ids(lookback_years);
    if (!computed.ok()) {
        return R::error_from(computed);
    }
    auto ids = std::make_shared<const core::PaperIdSet>(computed.take_value());
    SCIGRAPH_INFO("Filtered corpus for {}yr window: {} papers", lookback_years, ids->size());

    auto stored = cache_.store_ids(key, *ids);
    if (!stored.ok()) {
        SCIGRAPH_WARN("Filtered id set for {}yr not persisted: {}", lookback_years, stored.error());
    }
    retire_legacy_ids(lookback_years, *ids);

    ids_by_window_[lookback_years] = ids;
    return R(ids);
}

core::Result<core::PaperIdSet> CorpusFilter::query_ids(int lookback_years) {
    auto rows = store_->run(id_query(lookback_years));
    if (!rows.ok()) {
        return core::Result<core::PaperIdSet>::error_from(rows);
    }
    return CollectIds(rows.value(), core::PaperIdSet());
}

core::Result<core::PaperIdSet> CorpusFilter::query_ids_streamed(int lookback_years) {
    const std::string temp_path =
        cache_.path_for(CacheKey(ArtifactKind::TEMP_PAPER_IDS, lookback_years, signature_));

    auto fallback = [&](const std::string& reason) {
        SCIGRAPH_WARN("Streamed id query for {}yr failed ({}), running it directly",
                      lookback_years, reason);
        if (cache_.exists(temp_path)) {
            auto removed = cache_.remove(temp_path);
            if (!removed.ok()) {
                SCIGRAPH_WARN("{}", removed.error());
            }
        }
        return query_ids(lookback_years);
    };

    auto dir = cache_.ensure_directory();
    if (!dir.ok()) {
        return fallback(dir.error());
    }

    auto copied = store_->run("COPY (\n" + id_query(lookback_years) + "\n) TO " +
                              storage::QuoteLiteral(temp_path) + " (FORMAT PARQUET)");
    if (!copied.ok()) {
        return fallback(copied.error());
    }

    core::PaperIdSet ids;
    for (int64_t offset = 0;; offset += kStreamChunkRows) {
        SelectBuilder chunk;
        chunk.select({"paperid"})
            .from(ReadParquet(temp_path))
            .order_by("paperid")
            .limit(kStreamChunkRows)
            .offset(offset);
        auto rows = store_->run(chunk.build());
        if (!rows.ok()) {
            return fallback(rows.error());
        }
        if (rows.value().empty()) {
            break;
        }
        auto collected = CollectIds(rows.value(), std::move(ids));
        if (!collected.ok()) {
            return fallback(collected.error());
        }
        ids = collected.take_value();
        SCIGRAPH_DEBUG("Read {} streamed ids at offset {}", rows.value().row_count(), offset);
    }

    auto removed = cache_.remove(temp_path);
    if (!removed.ok()) {
        SCIGRAPH_WARN("{}", removed.error());
    }
    return core::Result<core::PaperIdSet>(std::move(ids));
}

void CorpusFilter::retire_legacy_ids(int lookback_years, const core::PaperIdSet& fresh) {
    auto legacy = cache_.load_legacy_ids(lookback_years);
    if (legacy.status == storage::CacheLookup<core::PaperIdSet>::Status::MISS) {
        return;
    }

    const std::string path = cache_.legacy_path(ArtifactKind::PAPER_IDS, lookback_years);
    if (legacy.corrupt()) {
        SCIGRAPH_WARN("Legacy cache file {} is unreadable: {}", path, legacy.detail);
    } else if (legacy.value != fresh) {
        SCIGRAPH_WARN("Legacy cache file {} is stale ({} ids, current filter yields {})",
                      path, legacy.value.size(), fresh.size());
    } else {
        SCIGRAPH_INFO("Legacy cache file {} matches the current filter", path);
    }

    auto removed = cache_.remove(path);
    if (!removed.ok()) {
        SCIGRAPH_WARN("Could not retire legacy cache file: {}", removed.error());
        return;
    }
    SCIGRAPH_INFO("Retired legacy cache file {}", path);
}

core::Result<std::shared_ptr<const core::PaperTable>> CorpusFilter::filtered_papers(int lookback_years) {
    using R = core::Result<std::shared_ptr<const core::PaperTable>>;
    if (lookback_years < 0) {
        return R::error("lookback window must be non-negative, got " + std::to_string(lookback_years),
                        core::Error::Code::INVALID_ARGUMENT);
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto cached = papers_by_window_.find(lookback_years);
    if (cached != papers_by_window_.end()) {
        return R(cached->second);
    }

    const CacheKey key(ArtifactKind::PAPER_TABLE, lookback_years, signature_);
    auto lookup = cache_.load_papers(key);
    if (lookup.hit()) {
        SCIGRAPH_DEBUG("Loaded {} filtered papers for {}yr from {}",
                       lookup.value.size(), lookback_years, cache_.path_for(key));
        auto table = std::make_shared<const core::PaperTable>(std::move(lookup.value));
        papers_by_window_[lookback_years] = table;
        return R(table);
    }
    if (lookup.corrupt()) {
        SCIGRAPH_WARN("Discarding unreadable cache file {}: {}", cache_.path_for(key), lookup.detail);
    }

    auto ids = filtered_paper_ids(lookback_years);
    if (!ids.ok()) {
        return R::error_from(ids);
    }

    core::PaperTable table;
    if (!ids.value()->empty()) {
        auto queried = query_papers(*ids.value());
        if (!queried.ok()) {
            return R::error_from(queried);
        }
        table = queried.take_value();
    }
    table.provenance = core::TableProvenance{lookback_years, signature_};

    if (!table.empty()) {
        auto stored = cache_.store_papers(key, table);
        if (!stored.ok()) {
            SCIGRAPH_WARN("Filtered paper table for {}yr not persisted: {}", lookback_years, stored.error());
        }
    }

    auto shared = std::make_shared<const core::PaperTable>(std::move(table));
    papers_by_window_[lookback_years] = shared;
    return R(shared);
}

core::Result<core::PaperTable> CorpusFilter::query_papers(const core::PaperIdSet& ids) {
    using R = core::Result<core::PaperTable>;

    auto registered = store_->register_strings(kFilteredIdsTable, "paperid", SortedIds(ids));
    if (!registered.ok()) {
        return R::error_from(registered);
    }

    SelectBuilder papers;
    papers.select({"p.*"})
        .from(ReadParquet(paths_.papers()), "p")
        .inner_join(kFilteredIdsTable, "f",
                    Predicate::CompareColumns("p.paperid", Predicate::Op::EQ, "f.paperid"))
        .order_by("p.paperid");
    auto result = store_->run(papers.build());
    if (!result.ok()) {
        return R::error_from(result);
    }

    const storage::RowSet& rows = result.value();
    auto id_col = rows.column_index("paperid");
    auto year_col = rows.column_index("year");
    if (!id_col || !year_col) {
        return R::error(core::SchemaError("Paper table is missing required column '" +
                                          std::string(id_col ? "year" : "paperid") + "'"));
    }
    auto doctype_col = rows.column_index("doctype");
    auto retracted_col = rows.column_index("is_retracted");
    auto citations_col = rows.column_index("cited_by_count");
    auto patents_col = rows.column_index("patent_count");

    core::PaperTable table;
    table.papers.reserve(rows.row_count());
    for (size_t r = 0; r < rows.row_count(); ++r) {
        core::Paper paper;
        paper.paper_id = rows.get_string(r, *id_col).value_or("");
        paper.year = static_cast<int32_t>(rows.get_int(r, *year_col).value_or(0));
        if (doctype_col) {
            paper.doctype = core::ParseDocType(rows.get_string(r, *doctype_col).value_or(""));
        }
        if (retracted_col) {
            paper.is_retracted = rows.get_bool(r, *retracted_col).value_or(false);
        }
        if (citations_col) {
            paper.cited_by_count = rows.get_int(r, *citations_col).value_or(0);
        }
        if (patents_col) {
            paper.patent_count = rows.get_int(r, *patents_col).value_or(0);
        }
        table.papers.push_back(std::move(paper));
    }
    return R(std::move(table));
}

core::Result<std::unordered_map<std::string, int64_t>> CorpusFilter::patent_counts(
    const std::vector<std::string>& paper_ids) {
    using Counts = std::unordered_map<std::string, int64_t>;
    using R = core::Result<Counts>;

    Counts counts;
    if (paper_ids.empty()) {
        return R(std::move(counts));
    }
    for (const auto& id : paper_ids) {
        counts[id] = 0;
    }
    if (!store_->file_exists(paths_.patent_links())) {
        SCIGRAPH_WARN("Patent link table {} not found; reporting zero patents", paths_.patent_links());
        return R(std::move(counts));
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::vector<std::string> unique_ids;
    unique_ids.reserve(counts.size());
    for (const auto& entry : counts) {
        unique_ids.push_back(entry.first);
    }
    std::sort(unique_ids.begin(), unique_ids.end());
    auto registered = store_->register_strings(kPatentIdsTable, "paperid", unique_ids);
    if (!registered.ok()) {
        return R::error_from(registered);
    }

    SelectBuilder patents;
    patents.select({"fp.paperid", "COUNT(lp.patent) AS patent_count"})
        .from(kPatentIdsTable, "fp")
        .left_join(ReadParquet(paths_.patent_links()), "lp",
                   Predicate::CompareColumns("fp.paperid", Predicate::Op::EQ, "lp.paperid"))
        .group_by({"fp.paperid"});
    auto result = store_->run(patents.build());
    if (!result.ok()) {
        return R::error_from(result);
    }

    const storage::RowSet& rows = result.value();
    auto id_col = rows.column_index("paperid");
    auto count_col = rows.column_index("patent_count");
    if (!id_col || !count_col) {
        return R::error(core::SchemaError("Patent count query returned unexpected columns"));
    }
    for (size_t r = 0; r < rows.row_count(); ++r) {
        auto id = rows.get_string(r, *id_col);
        if (id) {
            counts[*id] = rows.get_int(r, *count_col).value_or(0);
        }
    }
    return R(std::move(counts));
}

void CorpusFilter::invalidate() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ids_by_window_.clear();
    papers_by_window_.clear();
    SCIGRAPH_DEBUG("Corpus filter caches cleared");
}

} // namespace pipeline
} // namespace scigraph
