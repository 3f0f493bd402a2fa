#ifndef SCIGRAPH_STORAGE_ROW_SET_H_
#define SCIGRAPH_STORAGE_ROW_SET_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scigraph {
namespace storage {

/**
 * @brief A single cell of a query result
 */
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

inline bool IsNull(const Value& value) {
    return std::holds_alternative<std::monostate>(value);
}

std::string ValueToString(const Value& value);

/**
 * @brief Materialized tabular query result
 *
 * Column names are ordered as the query produced them. Rows are stored
 * row-major; every row holds exactly column_count() values.
 */
class RowSet {
public:
    RowSet() = default;
    explicit RowSet(std::vector<std::string> columns);

    const std::vector<std::string>& columns() const { return columns_; }
    size_t column_count() const { return columns_.size(); }
    size_t row_count() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    std::optional<size_t> column_index(const std::string& name) const;
    bool has_column(const std::string& name) const { return column_index(name).has_value(); }

    // Throws core::InternalError when the row width does not match the columns
    void add_row(std::vector<Value> row);

    // Appends the rows of a result with the same column layout
    void append(const RowSet& other);

    const std::vector<Value>& row(size_t index) const { return rows_.at(index); }
    const Value& at(size_t row, size_t column) const { return rows_.at(row).at(column); }

    // Typed accessors; nullopt for null cells or incompatible types.
    // Integers widen to double; doubles are truncated when read as integers.
    std::optional<std::string> get_string(size_t row, size_t column) const;
    std::optional<int64_t> get_int(size_t row, size_t column) const;
    std::optional<double> get_double(size_t row, size_t column) const;
    std::optional<bool> get_bool(size_t row, size_t column) const;

    // Non-null values of a string column in row order; empty when absent
    std::vector<std::string> string_column(const std::string& name) const;

private:
    std::vector<std::string> columns_;
    std::vector<std::vector<Value>> rows_;
};

} // namespace storage
} // namespace scigraph

#endif // SCIGRAPH_STORAGE_ROW_SET_H_
