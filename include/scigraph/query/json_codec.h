#ifndef SCIGRAPH_QUERY_JSON_CODEC_H_
#define SCIGRAPH_QUERY_JSON_CODEC_H_

#include <string>

#include "scigraph/core/result.h"
#include "scigraph/query/query_executor.h"
#include "scigraph/query/query_options.h"
#include "scigraph/query/summary.h"

namespace scigraph {
namespace query {

// Options decoders. Input must be a JSON object (an empty string counts as
// {}); absent or null members stay unset, unknown members are ignored and a
// member of the wrong type is an INVALID_ARGUMENT error.
core::Result<FieldQueryOptions> ParseFieldQueryOptions(const std::string& json);
core::Result<YearQueryOptions> ParseYearQueryOptions(const std::string& json);
core::Result<CitationQueryOptions> ParseCitationQueryOptions(const std::string& json);
core::Result<PatentQueryOptions> ParsePatentQueryOptions(const std::string& json);
core::Result<AdvancedQueryOptions> ParseAdvancedQueryOptions(const std::string& json);
core::Result<TopAuthorsOptions> ParseTopAuthorsOptions(const std::string& json);
core::Result<FieldTrendsOptions> ParseFieldTrendsOptions(const std::string& json);
core::Result<CitationPatternOptions> ParseCitationPatternOptions(const std::string& json);
core::Result<PatentDistributionOptions> ParsePatentDistributionOptions(const std::string& json);

// {"rows": [{column: value}], "row_count": n, "summary": {...}}
std::string ToJson(const QueryResult& result);
std::string ToJson(const Summary& summary);

} // namespace query
} // namespace scigraph

#endif // SCIGRAPH_QUERY_JSON_CODEC_H_
