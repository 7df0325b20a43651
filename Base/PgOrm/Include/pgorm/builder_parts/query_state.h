#ifndef pgorm_QUERY_STATE_H
#define pgorm_QUERY_STATE_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pgorm/condition.h"

namespace pgorm {

    enum class JoinType { Inner, Left, Right, Full };
    enum class OrderDirection { Asc, Desc };

    const char *joinTypeSql(JoinType type);

    struct JoinOn {
        std::string left_column;   // 通常为 owner 表列, 可带表名
        std::string right_column;  // 连接表上的列
    };

    struct JoinClause {
        std::string association;  // 按关联名连接时非空
        std::string table;        // 显式连接时的表名
        JoinType type = JoinType::Inner;
        JoinOn on;

        bool operator==(const JoinClause &other) const {
            return association == other.association && table == other.table && type == other.type && on.left_column == other.on.left_column && on.right_column == other.on.right_column;
        }
    };

    struct OrderClause {
        std::string field;
        OrderDirection direction = OrderDirection::Asc;

        bool operator==(const OrderClause &other) const {
            return field == other.field && direction == other.direction;
        }
    };

    struct RelationshipCondition {
        std::string association;
        std::vector<Condition> conditions;

        bool operator==(const RelationshipCondition &other) const {
            return association == other.association && conditions == other.conditions;
        }
    };

    struct QueryState {
        std::string table;
        std::vector<std::string> selections{"*"};
        std::vector<Condition> conditions;
        std::vector<ConditionGroup> groups;
        std::vector<RelationshipCondition> relationship_conditions;
        std::vector<JoinClause> joins;
        std::vector<OrderClause> order_by;
        std::optional<int> limit;
        std::optional<int> offset;
        std::vector<std::string> preloads;

        bool operator==(const QueryState &other) const;
    };

}  // namespace pgorm

#endif  // pgorm_QUERY_STATE_H
