#ifndef SCIGRAPH_QUERY_SELECT_BUILDER_H_
#define SCIGRAPH_QUERY_SELECT_BUILDER_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "scigraph/query/predicate.h"

namespace scigraph {
namespace query {

enum class JoinType {
    INNER,
    LEFT
};

/**
 * @brief Composes a single SELECT statement
 *
 * Repeated where()/having() calls are combined with AND.
 */
class SelectBuilder {
public:
    SelectBuilder& with(const std::string& name, const std::string& subquery);
    SelectBuilder& select(std::vector<std::string> expressions);
    SelectBuilder& distinct(bool value = true);
    SelectBuilder& from(const std::string& table, const std::string& alias = "");
    SelectBuilder& join(JoinType type, const std::string& table, const std::string& alias,
                        Predicate on);
    SelectBuilder& inner_join(const std::string& table, const std::string& alias, Predicate on) {
        return join(JoinType::INNER, table, alias, std::move(on));
    }
    SelectBuilder& left_join(const std::string& table, const std::string& alias, Predicate on) {
        return join(JoinType::LEFT, table, alias, std::move(on));
    }
    SelectBuilder& where(Predicate predicate);
    SelectBuilder& group_by(std::vector<std::string> expressions);
    SelectBuilder& having(Predicate predicate);
    SelectBuilder& order_by(std::string expression);
    SelectBuilder& limit(int64_t count);
    SelectBuilder& offset(int64_t count);

    const Predicate& where_predicate() const { return where_; }
    const Predicate& having_predicate() const { return having_; }
    size_t join_count() const { return joins_.size(); }

    std::string build() const;

private:
    struct Join {
        JoinType type;
        std::string table;
        std::string alias;
        Predicate on;
    };

    std::vector<std::pair<std::string, std::string>> ctes_;
    std::vector<std::string> select_;
    bool distinct_ = false;
    std::string from_;
    std::string from_alias_;
    std::vector<Join> joins_;
    Predicate where_;
    std::vector<std::string> group_by_;
    Predicate having_;
    std::vector<std::string> order_by_;
    std::optional<int64_t> limit_;
    std::optional<int64_t> offset_;
};

} // namespace query
} // namespace scigraph

#endif // SCIGRAPH_QUERY_SELECT_BUILDER_H_
