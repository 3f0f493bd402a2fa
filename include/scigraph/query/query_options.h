#ifndef SCIGRAPH_QUERY_QUERY_OPTIONS_H_
#define SCIGRAPH_QUERY_QUERY_OPTIONS_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace scigraph {
namespace query {

// Unset fields place no constraint. Field names are matched as
// case-insensitive substrings of the field display name.

struct FieldQueryOptions {
    std::optional<std::string> field_name;
    std::optional<int64_t> limit;  // Ignored unless positive
};

struct YearQueryOptions {
    std::optional<int64_t> year;
    std::optional<int64_t> start_year;
    std::optional<int64_t> end_year;
    std::optional<int64_t> years;  // Lookback from the current year
};

struct CitationQueryOptions {
    std::optional<int64_t> min_citations;
    std::optional<int64_t> max_citations;
    std::optional<int64_t> year;
    std::optional<std::string> field;
};

struct PatentQueryOptions {
    std::optional<int64_t> min_patents;
    std::optional<bool> has_patents;
    std::optional<int64_t> year;
};

/**
 * @brief Multi-predicate paper search
 *
 * Distinct predicate kinds are ANDed. field and fields form one group whose
 * members are ORed.
 */
struct AdvancedQueryOptions {
    std::optional<std::string> field;
    std::vector<std::string> fields;  // Exact display names
    std::optional<std::string> author_id;
    std::optional<int64_t> year;
    std::optional<int64_t> start_year;
    std::optional<int64_t> end_year;
    std::optional<std::pair<int64_t, int64_t>> year_range;
    std::optional<int64_t> min_citations;
    std::optional<int64_t> max_citations;
    std::optional<int64_t> min_patents;
    std::optional<bool> has_patents;
    std::optional<int64_t> limit;
};

struct TopAuthorsOptions {
    std::optional<int64_t> limit = 10;
    std::optional<int64_t> min_papers;
    std::optional<std::string> field_filter;
};

enum class TrendMetric {
    COUNT,      // Distinct papers per year
    CITATIONS,  // Mean cited_by_count per year
    PATENTS     // Mean patent_count per year
};

const char* ToString(TrendMetric metric);
// Unknown names fall back to COUNT
TrendMetric ParseTrendMetric(const std::string& name);

struct FieldTrendsOptions {
    std::optional<std::string> field;
    std::optional<int64_t> start_year;
    std::optional<int64_t> end_year;
    TrendMetric metric = TrendMetric::COUNT;
};

struct CitationPatternOptions {
    std::optional<int64_t> year;
    std::optional<std::string> field;
    std::optional<int64_t> min_citations;
};

struct PatentDistributionOptions {
    std::optional<int64_t> year;
    std::optional<std::string> field;
};

} // namespace query
} // namespace scigraph

#endif // SCIGRAPH_QUERY_QUERY_OPTIONS_H_
