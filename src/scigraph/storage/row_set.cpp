#include "scigraph/storage/row_set.h"

#include <sstream>

#include "scigraph/core/error.h"

namespace scigraph {
namespace storage {

std::string ValueToString(const Value& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return "";
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        std::ostringstream out;
        out << *d;
        return out.str();
    }
    return std::get<std::string>(value);
}

RowSet::RowSet(std::vector<std::string> columns) : columns_(std::move(columns)) {}

std::optional<size_t> RowSet::column_index(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i] == name) {
            return i;
        }
    }
    return std::nullopt;
}

void RowSet::add_row(std::vector<Value> row) {
    if (row.size() != columns_.size()) {
        throw core::InternalError("row has " + std::to_string(row.size()) +
                                  " values, expected " + std::to_string(columns_.size()));
    }
    rows_.push_back(std::move(row));
}

void RowSet::append(const RowSet& other) {
    if (columns_.empty() && rows_.empty()) {
        columns_ = other.columns_;
    } else if (other.columns_ != columns_) {
        throw core::InternalError("cannot append rows with a different column layout");
    }
    rows_.insert(rows_.end(), other.rows_.begin(), other.rows_.end());
}

std::optional<std::string> RowSet::get_string(size_t row, size_t column) const {
    const Value& value = at(row, column);
    if (IsNull(value)) {
        return std::nullopt;
    }
    return ValueToString(value);
}

std::optional<int64_t> RowSet::get_int(size_t row, size_t column) const {
    const Value& value = at(row, column);
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return static_cast<int64_t>(*d);
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? 1 : 0;
    }
    return std::nullopt;
}

std::optional<double> RowSet::get_double(size_t row, size_t column) const {
    const Value& value = at(row, column);
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

std::optional<bool> RowSet::get_bool(size_t row, size_t column) const {
    const Value& value = at(row, column);
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b;
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return *i != 0;
    }
    return std::nullopt;
}

std::vector<std::string> RowSet::string_column(const std::string& name) const {
    std::vector<std::string> values;
    auto index = column_index(name);
    if (!index) {
        return values;
    }
    values.reserve(rows_.size());
    for (size_t r = 0; r < rows_.size(); ++r) {
        auto value = get_string(r, *index);
        if (value) {
            values.push_back(std::move(*value));
        }
    }
    return values;
}

} // namespace storage
} // namespace scigraph
