#include "scigraph/query/query_executor.h"

#include <ctime>

#include "scigraph/common/logger.h"
#include "scigraph/query/json_codec.h"
#include "scigraph/query/select_builder.h"

namespace scigraph {
namespace query {

using storage::ReadParquet;
using storage::RowSet;

namespace {

constexpr const char* kFieldPapers = "field_papers";

Predicate ColumnsEqual(const std::string& lhs, const std::string& rhs) {
    return Predicate::CompareColumns(lhs, Predicate::Op::EQ, rhs);
}

int SystemYear() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    return local.tm_year + 1900;
}

template<typename Options>
core::Result<QueryResult> EmptyResult(const core::Result<Options>& parsed,
                                      const std::string& operation,
                                      Summary (*summarize)(const RowSet&)) {
    SCIGRAPH_WARN("Ignoring {} request with invalid options: {}", operation, parsed.error());
    QueryResult result;
    result.summary = summarize(result.rows);
    return core::Result<QueryResult>(std::move(result));
}

} // namespace

QueryExecutor::QueryExecutor(std::shared_ptr<storage::ColumnarStore> store,
                             core::CorpusPaths paths,
                             int current_year)
    : store_(std::move(store)),
      paths_(std::move(paths)),
      current_year_(current_year > 0 ? current_year : SystemYear()) {
    if (!store_) {
        throw core::InvalidArgumentError("QueryExecutor requires a store");
    }
}

core::Result<QueryResult> QueryExecutor::run(const std::string& sql,
                                             const std::function<Summary(const RowSet&)>& summarize) {
    auto rows = store_->run(sql);
    if (!rows.ok()) {
        return core::Result<QueryResult>::error_from(rows);
    }

    QueryResult result;
    result.rows = rows.take_value();
    result.row_count = result.rows.row_count();
    result.summary = summarize(result.rows);
    return core::Result<QueryResult>(std::move(result));
}

std::string QueryExecutor::field_papers_query(const std::string& field) const {
    SelectBuilder papers;
    papers.distinct()
        .select({"pf.paperid"})
        .from(ReadParquet(paths_.paper_fields()), "pf")
        .inner_join(ReadParquet(paths_.fields()), "f", ColumnsEqual("pf.fieldid", "f.fieldid"))
        .where(Predicate::ILike("f.display_name", field));
    return papers.build();
}

std::string QueryExecutor::patent_counts_relation() const {
    SelectBuilder counts;
    counts.select({"paperid", "COUNT(*) AS patent_count"})
        .from(ReadParquet(paths_.patent_links()))
        .group_by({"paperid"});
    return "(" + counts.build() + ")";
}

core::Result<QueryResult> QueryExecutor::papers_by_field(const FieldQueryOptions& options) {
    SelectBuilder q;
    q.select({"pf.fieldid", "f.display_name", "COUNT(DISTINCT pf.paperid) AS paper_count"})
        .from(ReadParquet(paths_.paper_fields()), "pf")
        .left_join(ReadParquet(paths_.fields()), "f", ColumnsEqual("pf.fieldid", "f.fieldid"));
    if (options.field_name) {
        q.where(Predicate::ILike("f.display_name", *options.field_name));
    }
    q.group_by({"pf.fieldid", "f.display_name"})
        .order_by("paper_count DESC")
        .order_by("pf.fieldid");
    if (options.limit && *options.limit > 0) {
        q.limit(*options.limit);
    }
    return run(q.build(), SummarizeByField);
}

core::Result<QueryResult> QueryExecutor::papers_by_year(const YearQueryOptions& options) {
    SelectBuilder q;
    q.select({"year", "COUNT(*) AS count"}).from(ReadParquet(paths_.papers()));
    if (options.year) {
        q.where(Predicate::Eq("year", *options.year));
    }
    if (options.start_year) {
        q.where(Predicate::Ge("year", *options.start_year));
    }
    if (options.end_year) {
        q.where(Predicate::Le("year", *options.end_year));
    }
    if (options.years) {
        q.where(Predicate::Ge("year", static_cast<int64_t>(current_year_) - *options.years));
    }
    q.group_by({"year"}).order_by("year");
    return run(q.build(), SummarizeByYear);
}

core::Result<QueryResult> QueryExecutor::papers_by_citations(const CitationQueryOptions& options) {
    // One row per paper: field counts are aggregated before the join
    SelectBuilder field_counts;
    field_counts.select({"paperid", "COUNT(DISTINCT fieldid) AS field_count"})
        .from(ReadParquet(paths_.paper_fields()))
        .group_by({"paperid"});

    SelectBuilder q;
    if (options.field) {
        q.with(kFieldPapers, field_papers_query(*options.field));
    }
    q.select({"p.*", "COALESCE(fc.field_count, 0) AS field_count"})
        .from(ReadParquet(paths_.papers()), "p");
    if (options.field) {
        q.inner_join(kFieldPapers, "fp", ColumnsEqual("p.paperid", "fp.paperid"));
    }
    q.left_join("(" + field_counts.build() + ")", "fc", ColumnsEqual("p.paperid", "fc.paperid"));
    if (options.min_citations) {
        q.where(Predicate::Ge("p.cited_by_count", *options.min_citations));
    }
    if (options.max_citations) {
        q.where(Predicate::Le("p.cited_by_count", *options.max_citations));
    }
    if (options.year) {
        q.where(Predicate::Eq("p.year", *options.year));
    }
    q.order_by("p.cited_by_count DESC").order_by("p.paperid");
    return run(q.build(), SummarizeByCitations);
}

core::Result<QueryResult> QueryExecutor::papers_by_patents(const PatentQueryOptions& options) {
    const std::string actual = "COALESCE(pat.patent_count, 0)";

    SelectBuilder q;
    q.select({"p.*", actual + " AS actual_patent_count"})
        .from(ReadParquet(paths_.papers()), "p")
        .left_join(patent_counts_relation(), "pat", ColumnsEqual("p.paperid", "pat.paperid"));
    if (options.min_patents) {
        q.where(Predicate::Ge(actual, *options.min_patents));
    }
    if (options.has_patents && *options.has_patents) {
        q.where(Predicate::Gt(actual, int64_t{0}));
    }
    if (options.year) {
        q.where(Predicate::Eq("p.year", *options.year));
    }
    q.order_by("actual_patent_count DESC").order_by("p.paperid");
    return run(q.build(), SummarizeByPatents);
}

core::Result<QueryResult> QueryExecutor::papers_advanced(const AdvancedQueryOptions& options) {
    SelectBuilder q;

    // field and fields are alternatives of one group
    std::vector<Literal> exact_names(options.fields.begin(), options.fields.end());
    Predicate field_group = Predicate::Any({
        options.field ? Predicate::ILike("f.display_name", *options.field) : Predicate(),
        Predicate::In("f.display_name", std::move(exact_names)),
    });
    if (!field_group.empty()) {
        SelectBuilder matching;
        matching.distinct()
            .select({"pf.paperid"})
            .from(ReadParquet(paths_.paper_fields()), "pf")
            .inner_join(ReadParquet(paths_.fields()), "f", ColumnsEqual("pf.fieldid", "f.fieldid"))
            .where(field_group);
        q.with(kFieldPapers, matching.build());
    }
    if (options.author_id) {
        SelectBuilder authored;
        authored.distinct()
            .select({"paperid"})
            .from(ReadParquet(paths_.authorships()))
            .where(Predicate::Eq("authorid", *options.author_id));
        q.with("author_papers", authored.build());
    }

    q.distinct().select({"p.*"}).from(ReadParquet(paths_.papers()), "p");
    if (!field_group.empty()) {
        q.inner_join(kFieldPapers, "fp", ColumnsEqual("p.paperid", "fp.paperid"));
    }
    if (options.author_id) {
        q.inner_join("author_papers", "ap", ColumnsEqual("p.paperid", "ap.paperid"));
    }

    if (options.year) {
        q.where(Predicate::Eq("p.year", *options.year));
    }
    if (options.start_year) {
        q.where(Predicate::Ge("p.year", *options.start_year));
    }
    if (options.end_year) {
        q.where(Predicate::Le("p.year", *options.end_year));
    }
    if (options.year_range) {
        q.where(Predicate::Between("p.year", options.year_range->first, options.year_range->second));
    }
    if (options.min_citations) {
        q.where(Predicate::Ge("p.cited_by_count", *options.min_citations));
    }
    if (options.max_citations) {
        q.where(Predicate::Le("p.cited_by_count", *options.max_citations));
    }
    if (options.min_patents) {
        q.where(Predicate::Ge("p.patent_count", *options.min_patents));
    }
    if (options.has_patents && *options.has_patents) {
        q.where(Predicate::Gt("p.patent_count", int64_t{0}));
    }
    q.order_by("p.cited_by_count DESC").order_by("p.paperid");
    if (options.limit && *options.limit > 0) {
        q.limit(*options.limit);
    }
    return run(q.build(), SummarizeAdvanced);
}

core::Result<QueryResult> QueryExecutor::available_fields() {
    SelectBuilder q;
    q.select({"f.fieldid", "f.display_name", "COUNT(DISTINCT pf.paperid) AS paper_count"})
        .from(ReadParquet(paths_.fields()), "f")
        .left_join(ReadParquet(paths_.paper_fields()), "pf", ColumnsEqual("f.fieldid", "pf.fieldid"))
        .group_by({"f.fieldid", "f.display_name"})
        .having(Predicate::Gt("COUNT(DISTINCT pf.paperid)", int64_t{0}))
        .order_by("paper_count DESC")
        .order_by("f.fieldid");
    return run(q.build(), SummarizeAvailableFields);
}

core::Result<QueryResult> QueryExecutor::available_years() {
    SelectBuilder q;
    q.select({"year", "COUNT(*) AS paper_count"})
        .from(ReadParquet(paths_.papers()))
        .group_by({"year"})
        .order_by("year");
    return run(q.build(), SummarizeAvailableYears);
}

core::Result<QueryResult> QueryExecutor::top_authors(const TopAuthorsOptions& options) {
    SelectBuilder q;
    if (options.field_filter) {
        q.with(kFieldPapers, field_papers_query(*options.field_filter));
    }
    q.select({"paa.authorid", "COUNT(DISTINCT paa.paperid) AS paper_count"})
        .from(ReadParquet(paths_.authorships()), "paa");
    if (options.field_filter) {
        q.inner_join(kFieldPapers, "fp", ColumnsEqual("paa.paperid", "fp.paperid"));
    }
    q.where(Predicate::IsNotNull("paa.authorid")).group_by({"paa.authorid"});
    if (options.min_papers) {
        q.having(Predicate::Ge("COUNT(DISTINCT paa.paperid)", *options.min_papers));
    }
    q.order_by("paper_count DESC").order_by("paa.authorid");
    if (options.limit && *options.limit > 0) {
        q.limit(*options.limit);
    }
    return run(q.build(), SummarizeTopAuthors);
}

core::Result<QueryResult> QueryExecutor::field_trends(const FieldTrendsOptions& options) {
    std::string value;
    switch (options.metric) {
        case TrendMetric::CITATIONS: value = "AVG(p.cited_by_count) AS value"; break;
        case TrendMetric::PATENTS: value = "AVG(p.patent_count) AS value"; break;
        case TrendMetric::COUNT:
        default:
            value = "COUNT(DISTINCT p.paperid) AS value";
            break;
    }

    SelectBuilder q;
    if (options.field) {
        q.with(kFieldPapers, field_papers_query(*options.field));
    }
    q.select({"p.year", value}).from(ReadParquet(paths_.papers()), "p");
    if (options.field) {
        q.inner_join(kFieldPapers, "fp", ColumnsEqual("p.paperid", "fp.paperid"));
    }
    if (options.start_year) {
        q.where(Predicate::Ge("p.year", *options.start_year));
    }
    if (options.end_year) {
        q.where(Predicate::Le("p.year", *options.end_year));
    }
    q.group_by({"p.year"}).order_by("p.year");

    const TrendMetric metric = options.metric;
    return run(q.build(), [metric](const RowSet& rows) { return SummarizeFieldTrends(rows, metric); });
}

core::Result<QueryResult> QueryExecutor::citation_patterns(const CitationPatternOptions& options) {
    static const char* kBuckets =
        "CASE "
        "WHEN p.cited_by_count = 0 THEN '0' "
        "WHEN p.cited_by_count BETWEEN 1 AND 10 THEN '1-10' "
        "WHEN p.cited_by_count BETWEEN 11 AND 50 THEN '11-50' "
        "WHEN p.cited_by_count BETWEEN 51 AND 100 THEN '51-100' "
        "ELSE '100+' END AS citation_range";

    SelectBuilder q;
    if (options.field) {
        q.with(kFieldPapers, field_papers_query(*options.field));
    }
    q.select({kBuckets, "COUNT(*) AS paper_count"}).from(ReadParquet(paths_.papers()), "p");
    if (options.field) {
        q.inner_join(kFieldPapers, "fp", ColumnsEqual("p.paperid", "fp.paperid"));
    }
    if (options.year) {
        q.where(Predicate::Eq("p.year", *options.year));
    }
    if (options.min_citations) {
        q.where(Predicate::Ge("p.cited_by_count", *options.min_citations));
    }
    q.group_by({"citation_range"}).order_by("MIN(p.cited_by_count)");
    return run(q.build(), SummarizeCitationPatterns);
}

core::Result<QueryResult> QueryExecutor::patent_distribution(const PatentDistributionOptions& options) {
    SelectBuilder filtered;
    filtered.select({"p.paperid"}).from(ReadParquet(paths_.papers()), "p");
    if (options.field) {
        filtered.inner_join("(" + field_papers_query(*options.field) + ")", "fp",
                            ColumnsEqual("p.paperid", "fp.paperid"));
    }
    if (options.year) {
        filtered.where(Predicate::Eq("p.year", *options.year));
    }

    const std::string bucket = "COALESCE(pat.patent_count, 0)";
    SelectBuilder q;
    q.with("filtered_papers", filtered.build())
        .select({bucket + " AS patent_count", "COUNT(*) AS paper_count"})
        .from("filtered_papers", "fp")
        .left_join(patent_counts_relation(), "pat", ColumnsEqual("fp.paperid", "pat.paperid"))
        .group_by({bucket})
        .order_by(bucket);
    return run(q.build(), SummarizePatentDistribution);
}

const std::vector<std::string>& QueryExecutor::Operations() {
    static const std::vector<std::string> kOperations = {
        "papers_by_field", "papers_by_year", "papers_by_citations", "papers_by_patents",
        "papers_advanced", "available_fields", "available_years", "top_authors",
        "field_trends", "citation_patterns", "patent_distribution",
    };
    return kOperations;
}

core::Result<QueryResult> QueryExecutor::execute(const std::string& operation, const std::string& options_json) {
    if (operation == "papers_by_field") {
        auto options = ParseFieldQueryOptions(options_json);
        return options.ok() ? papers_by_field(options.value())
                            : EmptyResult(options, operation, SummarizeByField);
    }
    if (operation == "papers_by_year") {
        auto options = ParseYearQueryOptions(options_json);
        return options.ok() ? papers_by_year(options.value())
                            : EmptyResult(options, operation, SummarizeByYear);
    }
    if (operation == "papers_by_citations") {
        auto options = ParseCitationQueryOptions(options_json);
        return options.ok() ? papers_by_citations(options.value())
                            : EmptyResult(options, operation, SummarizeByCitations);
    }
    if (operation == "papers_by_patents") {
        auto options = ParsePatentQueryOptions(options_json);
        return options.ok() ? papers_by_patents(options.value())
                            : EmptyResult(options, operation, SummarizeByPatents);
    }
    if (operation == "papers_advanced") {
        auto options = ParseAdvancedQueryOptions(options_json);
        return options.ok() ? papers_advanced(options.value())
                            : EmptyResult(options, operation, SummarizeAdvanced);
    }
    if (operation == "available_fields") {
        return available_fields();
    }
    if (operation == "available_years") {
        return available_years();
    }
    if (operation == "top_authors") {
        auto options = ParseTopAuthorsOptions(options_json);
        return options.ok() ? top_authors(options.value())
                            : EmptyResult(options, operation, SummarizeTopAuthors);
    }
    if (operation == "field_trends") {
        auto options = ParseFieldTrendsOptions(options_json);
        if (!options.ok()) {
            SCIGRAPH_WARN("Ignoring {} request with invalid options: {}", operation, options.error());
            QueryResult result;
            result.summary = SummarizeFieldTrends(result.rows, TrendMetric::COUNT);
            return core::Result<QueryResult>(std::move(result));
        }
        return field_trends(options.value());
    }
    if (operation == "citation_patterns") {
        auto options = ParseCitationPatternOptions(options_json);
        return options.ok() ? citation_patterns(options.value())
                            : EmptyResult(options, operation, SummarizeCitationPatterns);
    }
    if (operation == "patent_distribution") {
        auto options = ParsePatentDistributionOptions(options_json);
        return options.ok() ? patent_distribution(options.value())
                            : EmptyResult(options, operation, SummarizePatentDistribution);
    }
    return core::Result<QueryResult>::error(core::NotFoundError("Unknown query operation: " + operation));
}

} // namespace query
} // namespace scigraph
