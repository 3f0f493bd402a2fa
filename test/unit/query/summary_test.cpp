#include <gtest/gtest.h>

#include "scigraph/query/summary.h"

namespace scigraph {
namespace query {
namespace {

using storage::RowSet;
using storage::Value;

Value Int(int64_t v) { return Value(v); }
Value Str(const char* v) { return Value(std::string(v)); }

TEST(SummaryTest, TypedAccessors) {
    Summary summary;
    summary.set("n", Int(3));
    summary.set("avg", Value(1.5));
    summary.set("metric", Str("count"));

    EXPECT_EQ(summary.get_int("n").value(), 3);
    EXPECT_DOUBLE_EQ(summary.get_double("n").value(), 3.0);
    EXPECT_DOUBLE_EQ(summary.get_double("avg").value(), 1.5);
    EXPECT_FALSE(summary.get_int("avg").has_value());
    EXPECT_EQ(summary.get_string("metric").value(), "count");
    EXPECT_FALSE(summary.get_string("absent").has_value());
    EXPECT_FALSE(summary.has("absent"));
    EXPECT_EQ(summary.record("absent"), nullptr);
}

TEST(SummaryTest, ByFieldUsesFirstRowAsTopField) {
    RowSet rows({"fieldid", "display_name", "paper_count"});
    rows.add_row({Str("F1"), Str("Machine learning"), Int(5)});
    rows.add_row({Str("F2"), Str("Statistics"), Int(2)});

    Summary summary = SummarizeByField(rows);
    EXPECT_EQ(summary.get_int("total_fields").value(), 2);
    EXPECT_EQ(summary.get_int("total_papers").value(), 7);
    const Summary::Record* top = summary.record("top_field");
    ASSERT_NE(top, nullptr);
    EXPECT_EQ(std::get<std::string>(top->at("fieldid")), "F1");
}

TEST(SummaryTest, EmptyResultsHaveZeroStatistics) {
    RowSet rows({"fieldid", "display_name", "paper_count"});
    Summary summary = SummarizeByField(rows);
    EXPECT_EQ(summary.get_int("total_fields").value(), 0);
    EXPECT_EQ(summary.get_int("total_papers").value(), 0);
    EXPECT_FALSE(summary.has("top_field"));

    Summary years = SummarizeByYear(RowSet({"year", "count"}));
    EXPECT_DOUBLE_EQ(years.get_double("avg_per_year").value(), 0.0);
    EXPECT_FALSE(years.has("max_year"));
}

TEST(SummaryTest, ByYearPicksFirstBusiestYear) {
    RowSet rows({"year", "count"});
    rows.add_row({Int(2019), Int(2)});
    rows.add_row({Int(2020), Int(4)});
    rows.add_row({Int(2021), Int(4)});

    Summary summary = SummarizeByYear(rows);
    EXPECT_EQ(summary.get_int("total_years").value(), 3);
    EXPECT_EQ(summary.get_int("total_papers").value(), 10);
    EXPECT_NEAR(summary.get_double("avg_per_year").value(), 10.0 / 3.0, 1e-12);
    const Summary::Record* busiest = summary.record("max_year");
    ASSERT_NE(busiest, nullptr);
    EXPECT_EQ(std::get<int64_t>(busiest->at("year")), 2020);
}

TEST(SummaryTest, CitationStatistics) {
    RowSet rows({"paperid", "cited_by_count"});
    rows.add_row({Str("P1"), Int(10)});
    rows.add_row({Str("P2"), Int(30)});
    rows.add_row({Str("P3"), Value()});

    Summary summary = SummarizeByCitations(rows);
    EXPECT_EQ(summary.get_int("total_papers").value(), 3);
    EXPECT_DOUBLE_EQ(summary.get_double("avg_citations").value(), 20.0);
    EXPECT_EQ(summary.get_int("max_citations").value(), 30);
}

TEST(SummaryTest, PatentStatistics) {
    RowSet rows({"paperid", "actual_patent_count"});
    rows.add_row({Str("P1"), Int(3)});
    rows.add_row({Str("P2"), Int(0)});
    rows.add_row({Str("P3"), Int(1)});
    rows.add_row({Str("P4"), Int(0)});

    Summary summary = SummarizeByPatents(rows);
    EXPECT_EQ(summary.get_int("papers_with_patents").value(), 2);
    EXPECT_DOUBLE_EQ(summary.get_double("avg_patents").value(), 1.0);
}

TEST(SummaryTest, AdvancedSampleSizeIsCapped) {
    RowSet rows({"paperid"});
    for (int i = 0; i < 150; ++i) {
        rows.add_row({Str("P")});
    }
    Summary summary = SummarizeAdvanced(rows);
    EXPECT_EQ(summary.get_int("total_papers").value(), 150);
    EXPECT_EQ(summary.get_int("sample_size").value(), kAdvancedSampleRows);
}

TEST(SummaryTest, PatentDistributionIsWeightedByPaperCount) {
    RowSet rows({"patent_count", "paper_count"});
    rows.add_row({Int(0), Int(6)});
    rows.add_row({Int(1), Int(2)});
    rows.add_row({Int(3), Int(2)});

    Summary summary = SummarizePatentDistribution(rows);
    EXPECT_EQ(summary.get_int("total_papers").value(), 10);
    EXPECT_EQ(summary.get_int("papers_with_patents").value(), 4);
    EXPECT_DOUBLE_EQ(summary.get_double("avg_patents").value(), 0.8);
}

TEST(SummaryTest, TopAuthorsAndTrends) {
    RowSet authors({"authorid", "paper_count"});
    authors.add_row({Str("A1"), Int(9)});
    authors.add_row({Str("A2"), Int(4)});
    Summary summary = SummarizeTopAuthors(authors);
    EXPECT_EQ(summary.get_int("total_authors").value(), 2);
    EXPECT_EQ(summary.get_int("top_author_papers").value(), 9);

    Summary trends = SummarizeFieldTrends(RowSet({"year", "value"}), TrendMetric::CITATIONS);
    EXPECT_EQ(trends.get_string("metric").value(), "citations");
    EXPECT_EQ(trends.get_int("total_years").value(), 0);
}

} // namespace
} // namespace query
} // namespace scigraph
