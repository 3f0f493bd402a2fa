#include "scigraph/query/predicate.h"

#include <iomanip>
#include <sstream>

#include "scigraph/storage/columnar_store.h"

namespace scigraph {
namespace query {

const char* OpSymbol(Predicate::Op op) {
    switch (op) {
        case Predicate::Op::EQ: return "=";
        case Predicate::Op::NE: return "!=";
        case Predicate::Op::LT: return "<";
        case Predicate::Op::LE: return "<=";
        case Predicate::Op::GT: return ">";
        case Predicate::Op::GE: return ">=";
    }
    return "=";
}

std::string RenderLiteral(const Literal& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        std::ostringstream out;
        out << std::setprecision(15) << *d;
        return out.str();
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "TRUE" : "FALSE";
    }
    return storage::QuoteLiteral(std::get<std::string>(value));
}

Predicate Predicate::Compare(std::string column, Op op, Literal value) {
    Predicate p;
    p.kind_ = Kind::COMPARE;
    p.op_ = op;
    p.column_ = std::move(column);
    p.values_.push_back(std::move(value));
    return p;
}

Predicate Predicate::CompareColumns(std::string lhs, Op op, std::string rhs) {
    Predicate p;
    p.kind_ = Kind::COMPARE;
    p.op_ = op;
    p.column_ = std::move(lhs);
    p.rhs_column_ = std::move(rhs);
    return p;
}

Predicate Predicate::Between(const std::string& column, Literal low, Literal high) {
    return All({Ge(column, std::move(low)), Le(column, std::move(high))});
}

Predicate Predicate::ILike(std::string column, const std::string& substring) {
    Predicate p;
    p.kind_ = Kind::ILIKE;
    p.column_ = std::move(column);
    p.values_.push_back(std::string("%") + substring + "%");
    return p;
}

Predicate Predicate::In(std::string column, std::vector<Literal> values) {
    if (values.empty()) {
        return Predicate();
    }
    Predicate p;
    p.kind_ = Kind::IN_LIST;
    p.column_ = std::move(column);
    p.values_ = std::move(values);
    return p;
}

Predicate Predicate::IsNull(std::string column) {
    Predicate p;
    p.kind_ = Kind::IS_NULL;
    p.column_ = std::move(column);
    return p;
}

Predicate Predicate::IsNotNull(std::string column) {
    Predicate p;
    p.kind_ = Kind::IS_NOT_NULL;
    p.column_ = std::move(column);
    return p;
}

Predicate Predicate::All(std::vector<Predicate> children) {
    return Combine(Kind::AND, std::move(children));
}

Predicate Predicate::Any(std::vector<Predicate> children) {
    return Combine(Kind::OR, std::move(children));
}

Predicate Predicate::Combine(Kind kind, std::vector<Predicate> children) {
    std::vector<Predicate> kept;
    kept.reserve(children.size());
    for (auto& child : children) {
        if (child.empty()) {
            continue;
        }
        // Same-kind children are flattened into the parent
        if (child.kind_ == kind) {
            for (auto& grandchild : child.children_) {
                kept.push_back(std::move(grandchild));
            }
        } else {
            kept.push_back(std::move(child));
        }
    }

    if (kept.empty()) {
        return Predicate();
    }
    if (kept.size() == 1) {
        return std::move(kept.front());
    }
    Predicate p;
    p.kind_ = kind;
    p.children_ = std::move(kept);
    return p;
}

std::string Predicate::ToSql() const {
    return render(false);
}

std::string Predicate::render(bool nested) const {
    switch (kind_) {
        case Kind::EMPTY:
            return "";
        case Kind::COMPARE:
            return column_ + " " + OpSymbol(op_) + " " +
                   (rhs_column_.empty() ? RenderLiteral(values_.front()) : rhs_column_);
        case Kind::ILIKE:
            return column_ + " ILIKE " + RenderLiteral(values_.front());
        case Kind::IN_LIST: {
            std::string sql = column_ + " IN (";
            for (size_t i = 0; i < values_.size(); ++i) {
                if (i > 0) sql += ", ";
                sql += RenderLiteral(values_[i]);
            }
            return sql + ")";
        }
        case Kind::IS_NULL:
            return column_ + " IS NULL";
        case Kind::IS_NOT_NULL:
            return column_ + " IS NOT NULL";
        case Kind::AND:
        case Kind::OR: {
            const char* glue = kind_ == Kind::AND ? " AND " : " OR ";
            std::string sql;
            for (size_t i = 0; i < children_.size(); ++i) {
                if (i > 0) sql += glue;
                sql += children_[i].render(true);
            }
            // OR groups are always parenthesized; AND only when nested
            if (kind_ == Kind::OR || nested) {
                return "(" + sql + ")";
            }
            return sql;
        }
    }
    return "";
}

} // namespace query
} // namespace scigraph
