#ifndef SCIGRAPH_QUERY_QUERY_EXECUTOR_H_
#define SCIGRAPH_QUERY_QUERY_EXECUTOR_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "scigraph/core/config.h"
#include "scigraph/core/result.h"
#include "scigraph/query/query_options.h"
#include "scigraph/query/summary.h"
#include "scigraph/storage/columnar_store.h"
#include "scigraph/storage/row_set.h"

namespace scigraph {
namespace query {

struct QueryResult {
    storage::RowSet rows;
    size_t row_count = 0;
    Summary summary;
};

/**
 * @brief Parameterized aggregations over a materialized corpus sample
 *
 * Every operation composes one statement with SelectBuilder and runs it on
 * the store. Filters that join the field tables go through a DISTINCT paper
 * id subquery, so a paper matching several fields is still counted once.
 * A filter that matches nothing yields an empty result; store failures are
 * returned as errors.
 */
class QueryExecutor {
public:
    // current_year anchors YearQueryOptions::years; 0 uses the system clock
    QueryExecutor(std::shared_ptr<storage::ColumnarStore> store,
                  core::CorpusPaths paths,
                  int current_year = 0);

    core::Result<QueryResult> papers_by_field(const FieldQueryOptions& options = {});
    core::Result<QueryResult> papers_by_year(const YearQueryOptions& options = {});
    core::Result<QueryResult> papers_by_citations(const CitationQueryOptions& options = {});
    core::Result<QueryResult> papers_by_patents(const PatentQueryOptions& options = {});
    core::Result<QueryResult> papers_advanced(const AdvancedQueryOptions& options = {});
    core::Result<QueryResult> available_fields();
    core::Result<QueryResult> available_years();
    core::Result<QueryResult> top_authors(const TopAuthorsOptions& options = {});
    core::Result<QueryResult> field_trends(const FieldTrendsOptions& options = {});
    core::Result<QueryResult> citation_patterns(const CitationPatternOptions& options = {});
    core::Result<QueryResult> patent_distribution(const PatentDistributionOptions& options = {});

    /**
     * @brief Runs an operation by name with a JSON options object
     *
     * Options that fail to parse produce an empty result with a warning.
     * An unknown operation name is a NOT_FOUND error.
     */
    core::Result<QueryResult> execute(const std::string& operation, const std::string& options_json);

    // Names accepted by execute()
    static const std::vector<std::string>& Operations();

    int current_year() const { return current_year_; }

private:
    core::Result<QueryResult> run(const std::string& sql,
                                  const std::function<Summary(const storage::RowSet&)>& summarize);

    // DISTINCT paper ids whose field display name contains the substring
    std::string field_papers_query(const std::string& field) const;
    // paperid -> number of patent links; an empty relation when the file is absent
    std::string patent_counts_relation() const;

    std::shared_ptr<storage::ColumnarStore> store_;
    core::CorpusPaths paths_;
    int current_year_;
};

} // namespace query
} // namespace scigraph

#endif // SCIGRAPH_QUERY_QUERY_EXECUTOR_H_
