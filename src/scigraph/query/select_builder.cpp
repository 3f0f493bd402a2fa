#include "scigraph/query/select_builder.h"

#include <sstream>

namespace scigraph {
namespace query {

namespace {

std::string JoinStrings(const std::vector<std::string>& parts, const char* glue) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += glue;
        out += parts[i];
    }
    return out;
}

} // namespace

SelectBuilder& SelectBuilder::with(const std::string& name, const std::string& subquery) {
    ctes_.emplace_back(name, subquery);
    return *this;
}

SelectBuilder& SelectBuilder::select(std::vector<std::string> expressions) {
    select_ = std::move(expressions);
    return *this;
}

SelectBuilder& SelectBuilder::distinct(bool value) {
    distinct_ = value;
    return *this;
}

SelectBuilder& SelectBuilder::from(const std::string& table, const std::string& alias) {
    from_ = table;
    from_alias_ = alias;
    return *this;
}

SelectBuilder& SelectBuilder::join(JoinType type, const std::string& table, const std::string& alias,
                                   Predicate on) {
    joins_.push_back(Join{type, table, alias, std::move(on)});
    return *this;
}

SelectBuilder& SelectBuilder::where(Predicate predicate) {
    where_ = Predicate::All({std::move(where_), std::move(predicate)});
    return *this;
}

SelectBuilder& SelectBuilder::group_by(std::vector<std::string> expressions) {
    group_by_ = std::move(expressions);
    return *this;
}

SelectBuilder& SelectBuilder::having(Predicate predicate) {
    having_ = Predicate::All({std::move(having_), std::move(predicate)});
    return *this;
}

SelectBuilder& SelectBuilder::order_by(std::string expression) {
    order_by_.push_back(std::move(expression));
    return *this;
}

SelectBuilder& SelectBuilder::limit(int64_t count) {
    limit_ = count;
    return *this;
}

SelectBuilder& SelectBuilder::offset(int64_t count) {
    offset_ = count;
    return *this;
}

std::string SelectBuilder::build() const {
    std::ostringstream sql;

    if (!ctes_.empty()) {
        sql << "WITH ";
        for (size_t i = 0; i < ctes_.size(); ++i) {
            if (i > 0) sql << ",\n";
            sql << ctes_[i].first << " AS (\n" << ctes_[i].second << "\n)";
        }
        sql << "\n";
    }

    sql << "SELECT ";
    if (distinct_) {
        sql << "DISTINCT ";
    }
    sql << (select_.empty() ? std::string("*") : JoinStrings(select_, ", "));

    sql << "\nFROM " << from_;
    if (!from_alias_.empty()) {
        sql << " " << from_alias_;
    }

    for (const auto& join : joins_) {
        sql << "\n" << (join.type == JoinType::INNER ? "INNER JOIN " : "LEFT JOIN ")
            << join.table;
        if (!join.alias.empty()) {
            sql << " " << join.alias;
        }
        sql << " ON " << join.on.ToSql();
    }

    if (!where_.empty()) {
        sql << "\nWHERE " << where_.ToSql();
    }
    if (!group_by_.empty()) {
        sql << "\nGROUP BY " << JoinStrings(group_by_, ", ");
    }
    if (!having_.empty()) {
        sql << "\nHAVING " << having_.ToSql();
    }
    if (!order_by_.empty()) {
        sql << "\nORDER BY " << JoinStrings(order_by_, ", ");
    }
    if (limit_) {
        sql << "\nLIMIT " << *limit_;
    }
    if (offset_) {
        sql << "\nOFFSET " << *offset_;
    }
    return sql.str();
}

} // namespace query
} // namespace scigraph
