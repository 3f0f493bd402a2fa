#include <gtest/gtest.h>
#include "scigraph/core/error.h"
#include "scigraph/storage/columnar_store.h"
#include "scigraph/storage/row_set.h"

namespace scigraph {
namespace storage {
namespace {

RowSet SampleRows() {
    RowSet rows({"paperid", "year", "score", "retracted"});
    rows.add_row({std::string("W1"), int64_t{2021}, 0.5, false});
    rows.add_row({std::string("W2"), std::monostate{}, int64_t{3}, true});
    return rows;
}

TEST(RowSetTest, ColumnLookup) {
    RowSet rows = SampleRows();
    EXPECT_EQ(rows.column_count(), 4u);
    EXPECT_EQ(rows.row_count(), 2u);
    EXPECT_EQ(rows.column_index("year").value(), 1u);
    EXPECT_FALSE(rows.column_index("missing").has_value());
    EXPECT_TRUE(rows.has_column("score"));
}

TEST(RowSetTest, TypedAccessors) {
    RowSet rows = SampleRows();
    EXPECT_EQ(rows.get_string(0, 0).value(), "W1");
    EXPECT_EQ(rows.get_int(0, 1).value(), 2021);
    EXPECT_FALSE(rows.get_int(1, 1).has_value());
    EXPECT_DOUBLE_EQ(rows.get_double(0, 2).value(), 0.5);
    // Integers widen to double
    EXPECT_DOUBLE_EQ(rows.get_double(1, 2).value(), 3.0);
    EXPECT_TRUE(rows.get_bool(1, 3).value());
    EXPECT_EQ(rows.get_string(0, 1).value(), "2021");
}

TEST(RowSetTest, RowWidthIsChecked) {
    RowSet rows({"a", "b"});
    EXPECT_THROW(rows.add_row({int64_t{1}}), core::InternalError);
}

TEST(RowSetTest, StringColumnSkipsNulls) {
    RowSet rows({"authorid"});
    rows.add_row({std::string("A1")});
    rows.add_row({std::monostate{}});
    rows.add_row({std::string("A2")});
    EXPECT_EQ(rows.string_column("authorid"), (std::vector<std::string>{"A1", "A2"}));
    EXPECT_TRUE(rows.string_column("nope").empty());
}

TEST(RowSetTest, AppendRequiresSameLayout) {
    RowSet all;
    all.append(SampleRows());
    all.append(SampleRows());
    EXPECT_EQ(all.row_count(), 4u);

    RowSet other({"x"});
    EXPECT_THROW(all.append(other), core::InternalError);
}

TEST(QuotingTest, LiteralsAndIdentifiersAreEscaped) {
    EXPECT_EQ(QuoteLiteral("O'Brien"), "'O''Brien'");
    EXPECT_EQ(QuoteIdentifier("weird\"name"), "\"weird\"\"name\"");
    EXPECT_EQ(ReadParquet("/tmp/a'b.parquet"), "read_parquet('/tmp/a''b.parquet')");
}

} // namespace
} // namespace storage
} // namespace scigraph
