#include "scigraph/query/summary.h"

#include <algorithm>

namespace scigraph {
namespace query {

using storage::RowSet;
using storage::Value;

namespace {

int64_t SumInt(const RowSet& rows, const std::string& column) {
    auto index = rows.column_index(column);
    if (!index) {
        return 0;
    }
    int64_t total = 0;
    for (size_t r = 0; r < rows.row_count(); ++r) {
        total += rows.get_int(r, *index).value_or(0);
    }
    return total;
}

double MeanDouble(const RowSet& rows, const std::string& column) {
    auto index = rows.column_index(column);
    if (!index || rows.empty()) {
        return 0.0;
    }
    double total = 0.0;
    size_t counted = 0;
    for (size_t r = 0; r < rows.row_count(); ++r) {
        if (auto value = rows.get_double(r, *index)) {
            total += *value;
            ++counted;
        }
    }
    return counted == 0 ? 0.0 : total / static_cast<double>(counted);
}

// Index of the first row holding the largest value of the column
std::optional<size_t> ArgMax(const RowSet& rows, const std::string& column) {
    auto index = rows.column_index(column);
    if (!index) {
        return std::nullopt;
    }
    std::optional<size_t> best;
    int64_t best_value = 0;
    for (size_t r = 0; r < rows.row_count(); ++r) {
        auto value = rows.get_int(r, *index);
        if (value && (!best || *value > best_value)) {
            best = r;
            best_value = *value;
        }
    }
    return best;
}

Summary::Record RowRecord(const RowSet& rows, size_t row) {
    Summary::Record record;
    for (size_t c = 0; c < rows.column_count(); ++c) {
        record[rows.columns()[c]] = rows.at(row, c);
    }
    return record;
}

Value Count(size_t n) {
    return Value(static_cast<int64_t>(n));
}

} // namespace

std::optional<int64_t> Summary::get_int(const std::string& key) const {
    auto it = stats_.find(key);
    if (it == stats_.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<int64_t>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

std::optional<double> Summary::get_double(const std::string& key) const {
    auto it = stats_.find(key);
    if (it == stats_.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<double>(&it->second)) {
        return *value;
    }
    if (const auto* value = std::get_if<int64_t>(&it->second)) {
        return static_cast<double>(*value);
    }
    return std::nullopt;
}

std::optional<std::string> Summary::get_string(const std::string& key) const {
    auto it = stats_.find(key);
    if (it == stats_.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<std::string>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

const Summary::Record* Summary::record(const std::string& key) const {
    auto it = records_.find(key);
    return it == records_.end() ? nullptr : &it->second;
}

Summary SummarizeByField(const RowSet& rows) {
    Summary summary;
    summary.set("total_fields", Count(rows.row_count()));
    summary.set("total_papers", Value(SumInt(rows, "paper_count")));
    if (!rows.empty()) {
        summary.set_record("top_field", RowRecord(rows, 0));
    }
    return summary;
}

Summary SummarizeByYear(const RowSet& rows) {
    Summary summary;
    const int64_t total = SumInt(rows, "count");
    summary.set("total_years", Count(rows.row_count()));
    summary.set("total_papers", Value(total));
    summary.set("avg_per_year", Value(rows.empty() ? 0.0
                                                   : static_cast<double>(total) / static_cast<double>(rows.row_count())));
    if (auto busiest = ArgMax(rows, "count")) {
        summary.set_record("max_year", RowRecord(rows, *busiest));
    }
    return summary;
}

Summary SummarizeByCitations(const RowSet& rows) {
    Summary summary;
    summary.set("total_papers", Count(rows.row_count()));
    summary.set("avg_citations", Value(MeanDouble(rows, "cited_by_count")));
    int64_t max_citations = 0;
    if (auto top = ArgMax(rows, "cited_by_count")) {
        max_citations = rows.get_int(*top, *rows.column_index("cited_by_count")).value_or(0);
    }
    summary.set("max_citations", Value(max_citations));
    return summary;
}

Summary SummarizeByPatents(const RowSet& rows) {
    Summary summary;
    summary.set("total_papers", Count(rows.row_count()));
    int64_t with_patents = 0;
    if (auto index = rows.column_index("actual_patent_count")) {
        for (size_t r = 0; r < rows.row_count(); ++r) {
            if (rows.get_int(r, *index).value_or(0) > 0) {
                ++with_patents;
            }
        }
    }
    summary.set("papers_with_patents", Value(with_patents));
    summary.set("avg_patents", Value(MeanDouble(rows, "actual_patent_count")));
    return summary;
}

Summary SummarizeAdvanced(const RowSet& rows) {
    Summary summary;
    summary.set("total_papers", Count(rows.row_count()));
    summary.set("sample_size", Value(std::min<int64_t>(kAdvancedSampleRows, static_cast<int64_t>(rows.row_count()))));
    return summary;
}

Summary SummarizeAvailableFields(const RowSet& rows) {
    Summary summary;
    summary.set("total_fields", Count(rows.row_count()));
    summary.set("total_papers", Value(SumInt(rows, "paper_count")));
    return summary;
}

Summary SummarizeAvailableYears(const RowSet& rows) {
    Summary summary;
    summary.set("total_years", Count(rows.row_count()));
    summary.set("total_papers", Value(SumInt(rows, "paper_count")));
    return summary;
}

Summary SummarizeTopAuthors(const RowSet& rows) {
    Summary summary;
    summary.set("total_authors", Count(rows.row_count()));
    int64_t top = 0;
    if (auto index = rows.column_index("paper_count")) {
        if (!rows.empty()) {
            top = rows.get_int(0, *index).value_or(0);
        }
    }
    summary.set("top_author_papers", Value(top));
    return summary;
}

Summary SummarizeFieldTrends(const RowSet& rows, TrendMetric metric) {
    Summary summary;
    summary.set("total_years", Count(rows.row_count()));
    summary.set("metric", Value(std::string(ToString(metric))));
    return summary;
}

Summary SummarizeCitationPatterns(const RowSet& rows) {
    Summary summary;
    summary.set("total_papers", Value(SumInt(rows, "paper_count")));
    return summary;
}

Summary SummarizePatentDistribution(const RowSet& rows) {
    Summary summary;
    int64_t papers = 0;
    int64_t with_patents = 0;
    int64_t patents = 0;
    auto patent_index = rows.column_index("patent_count");
    auto paper_index = rows.column_index("paper_count");
    if (patent_index && paper_index) {
        for (size_t r = 0; r < rows.row_count(); ++r) {
            const int64_t bucket = rows.get_int(r, *patent_index).value_or(0);
            const int64_t count = rows.get_int(r, *paper_index).value_or(0);
            papers += count;
            patents += bucket * count;
            if (bucket > 0) {
                with_patents += count;
            }
        }
    }
    summary.set("total_papers", Value(papers));
    summary.set("papers_with_patents", Value(with_patents));
    summary.set("avg_patents", Value(papers > 0 ? static_cast<double>(patents) / static_cast<double>(papers) : 0.0));
    return summary;
}

} // namespace query
} // namespace scigraph
