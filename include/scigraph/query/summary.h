#ifndef SCIGRAPH_QUERY_SUMMARY_H_
#define SCIGRAPH_QUERY_SUMMARY_H_

#include <map>
#include <optional>
#include <string>

#include "scigraph/query/query_options.h"
#include "scigraph/storage/row_set.h"

namespace scigraph {
namespace query {

/**
 * @brief Summary statistics derived from a query result
 *
 * Scalar statistics live in stats(); statistics that name a whole row
 * (top_field, max_year) live in records() as column -> value maps.
 */
class Summary {
public:
    using Record = std::map<std::string, storage::Value>;

    void set(const std::string& key, storage::Value value) { stats_[key] = std::move(value); }
    void set_record(const std::string& key, Record record) { records_[key] = std::move(record); }

    bool has(const std::string& key) const { return stats_.count(key) > 0 || records_.count(key) > 0; }
    std::optional<int64_t> get_int(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<std::string> get_string(const std::string& key) const;
    const Record* record(const std::string& key) const;

    const std::map<std::string, storage::Value>& stats() const { return stats_; }
    const std::map<std::string, Record>& records() const { return records_; }

    bool operator==(const Summary& other) const {
        return stats_ == other.stats_ && records_ == other.records_;
    }

private:
    std::map<std::string, storage::Value> stats_;
    std::map<std::string, Record> records_;
};

// Rows returned in full by the advanced search before callers truncate
constexpr int64_t kAdvancedSampleRows = 100;

// Each function reads only the rows; missing columns count as zero.
Summary SummarizeByField(const storage::RowSet& rows);
Summary SummarizeByYear(const storage::RowSet& rows);
Summary SummarizeByCitations(const storage::RowSet& rows);
Summary SummarizeByPatents(const storage::RowSet& rows);
Summary SummarizeAdvanced(const storage::RowSet& rows);
Summary SummarizeAvailableFields(const storage::RowSet& rows);
Summary SummarizeAvailableYears(const storage::RowSet& rows);
Summary SummarizeTopAuthors(const storage::RowSet& rows);
Summary SummarizeFieldTrends(const storage::RowSet& rows, TrendMetric metric);
Summary SummarizeCitationPatterns(const storage::RowSet& rows);
Summary SummarizePatentDistribution(const storage::RowSet& rows);

} // namespace query
} // namespace scigraph

#endif // SCIGRAPH_QUERY_SUMMARY_H_
