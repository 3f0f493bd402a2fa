#ifndef SCIGRAPH_QUERY_PREDICATE_H_
#define SCIGRAPH_QUERY_PREDICATE_H_

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace scigraph {
namespace query {

/**
 * @brief Literal operand of a predicate; rendered quoted and escaped
 */
using Literal = std::variant<int64_t, double, bool, std::string>;

/**
 * @brief Immutable boolean expression tree rendered to a SQL condition
 *
 * Leaves are comparisons, ILIKE substring matches, IN lists and null
 * checks. All() joins its children with AND and Any() with OR. Empty
 * predicates vanish from both: All({}) and Any({}) are empty, and a
 * combinator with a single non-empty child collapses to that child.
 */
class Predicate {
public:
    enum class Kind {
        EMPTY,
        COMPARE,
        ILIKE,
        IN_LIST,
        IS_NULL,
        IS_NOT_NULL,
        AND,
        OR
    };

    enum class Op {
        EQ,
        NE,
        LT,
        LE,
        GT,
        GE
    };

    Predicate() = default;

    static Predicate Compare(std::string column, Op op, Literal value);

    // Column-to-column comparison; both sides are rendered verbatim, so only
    // engine code may construct one. Caller-supplied values travel as Literal.
    static Predicate CompareColumns(std::string lhs, Op op, std::string rhs);

    static Predicate Eq(std::string column, Literal value) { return Compare(std::move(column), Op::EQ, std::move(value)); }
    static Predicate Ne(std::string column, Literal value) { return Compare(std::move(column), Op::NE, std::move(value)); }
    static Predicate Lt(std::string column, Literal value) { return Compare(std::move(column), Op::LT, std::move(value)); }
    static Predicate Le(std::string column, Literal value) { return Compare(std::move(column), Op::LE, std::move(value)); }
    static Predicate Gt(std::string column, Literal value) { return Compare(std::move(column), Op::GT, std::move(value)); }
    static Predicate Ge(std::string column, Literal value) { return Compare(std::move(column), Op::GE, std::move(value)); }

    // column >= low AND column <= high
    static Predicate Between(const std::string& column, Literal low, Literal high);

    // Case-insensitive substring match: column ILIKE '%substring%'
    static Predicate ILike(std::string column, const std::string& substring);

    // Vanishes when values is empty
    static Predicate In(std::string column, std::vector<Literal> values);

    static Predicate IsNull(std::string column);
    static Predicate IsNotNull(std::string column);

    static Predicate All(std::vector<Predicate> children);
    static Predicate Any(std::vector<Predicate> children);

    Kind kind() const { return kind_; }
    bool empty() const { return kind_ == Kind::EMPTY; }
    Op op() const { return op_; }
    const std::string& column() const { return column_; }
    const std::vector<Literal>& values() const { return values_; }
    const std::string& rhs_column() const { return rhs_column_; }
    const std::vector<Predicate>& children() const { return children_; }

    // Empty predicates render as an empty string
    std::string ToSql() const;

private:
    static Predicate Combine(Kind kind, std::vector<Predicate> children);
    std::string render(bool nested) const;

    Kind kind_ = Kind::EMPTY;
    Op op_ = Op::EQ;
    std::string column_;
    std::vector<Literal> values_;
    std::string rhs_column_;
    std::vector<Predicate> children_;
};

const char* OpSymbol(Predicate::Op op);

std::string RenderLiteral(const Literal& value);

} // namespace query
} // namespace scigraph

#endif // SCIGRAPH_QUERY_PREDICATE_H_
