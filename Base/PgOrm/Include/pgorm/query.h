#ifndef pgorm_QUERY_H
#define pgorm_QUERY_H

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "pgorm/builder_parts/query_state.h"
#include "pgorm/condition.h"
#include "pgorm/error.h"

namespace pgorm {

    class SchemaRegistry;

    // 不可变的查询描述. 每个构建方法都返回新的 Query
    class Query {
      public:
        static Query from(std::string table);

        Query where(Condition condition) const;
        Query whereGroup(std::vector<Condition> conditions) const;
        Query whereAny(std::vector<Condition> conditions) const;
        Query whereRelated(const std::string &association, std::vector<Condition> conditions) const;
        Query whereRelated(const std::string &association, Condition condition) const;

        Query join(const std::string &association, JoinType type = JoinType::Inner) const;
        Query join(const std::string &table, JoinType type, JoinOn on) const;

        Query orderBy(const std::string &field, OrderDirection direction = OrderDirection::Asc) const;
        Query limit(int n) const;
        Query offset(int n) const;
        Query select(std::vector<std::string> fields) const;
        Query preload(std::vector<std::string> associations) const;
        Query preload(const std::string &association) const;

        // 以关联表为根的新查询. 本查询的条件经反向关联 (whereRelated) 带入,
        // limit/offset 保留; 条件组和关联条件无法带入, 返回 InvalidQuery
        std::expected<Query, Error> through(const SchemaRegistry &registry, const std::string &association) const;

        const std::string &table() const;
        const std::vector<std::string> &selections() const;
        const std::vector<Condition> &conditions() const;
        const std::vector<ConditionGroup> &groups() const;
        const std::vector<RelationshipCondition> &relationshipConditions() const;
        const std::vector<JoinClause> &joins() const;
        const std::vector<OrderClause> &orderClauses() const;
        std::optional<int> limitValue() const;
        std::optional<int> offsetValue() const;
        const std::vector<std::string> &preloads() const;

        bool joinsAssociation(const std::string &association) const;

        bool operator==(const Query &other) const {
            return state_ == other.state_;
        }
        bool operator!=(const Query &other) const {
            return !(*this == other);
        }

      private:
        explicit Query(QueryState state);
        QueryState state_;
    };

}  // namespace pgorm

#endif  // pgorm_QUERY_H
