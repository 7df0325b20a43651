#include "pgorm/query.h"

#include <utility>

#include "pgorm/schema_registry.h"

namespace pgorm {

    const char *joinTypeSql(JoinType type) {
        switch (type) {
            case JoinType::Inner:
                return "INNER JOIN";
            case JoinType::Left:
                return "LEFT JOIN";
            case JoinType::Right:
                return "RIGHT JOIN";
            case JoinType::Full:
                return "FULL OUTER JOIN";
        }
        return "INNER JOIN";
    }

    bool QueryState::operator==(const QueryState &other) const {
        return table == other.table && selections == other.selections && conditions == other.conditions && groups == other.groups && relationship_conditions == other.relationship_conditions && joins == other.joins && order_by == other.order_by && limit == other.limit &&
               offset == other.offset && preloads == other.preloads;
    }

    Query::Query(QueryState state) : state_(std::move(state)) {
    }

    Query Query::from(std::string table) {
        QueryState state;
        state.table = std::move(table);
        return Query(std::move(state));
    }

    Query Query::where(Condition condition) const {
        QueryState next = state_;
        next.conditions.push_back(std::move(condition));
        return Query(std::move(next));
    }

    Query Query::whereGroup(std::vector<Condition> conditions) const {
        QueryState next = state_;
        next.groups.push_back(ConditionGroup{std::move(conditions), GroupCombinator::All});
        return Query(std::move(next));
    }

    Query Query::whereAny(std::vector<Condition> conditions) const {
        QueryState next = state_;
        next.groups.push_back(ConditionGroup{std::move(conditions), GroupCombinator::Any});
        return Query(std::move(next));
    }

    Query Query::whereRelated(const std::string &association, std::vector<Condition> conditions) const {
        QueryState next = state_;
        for (auto &rc : next.relationship_conditions) {
            if (rc.association == association) {
                for (auto &c : conditions) rc.conditions.push_back(std::move(c));
                return Query(std::move(next));
            }
        }
        next.relationship_conditions.push_back(RelationshipCondition{association, std::move(conditions)});
        return Query(std::move(next));
    }

    Query Query::whereRelated(const std::string &association, Condition condition) const {
        return whereRelated(association, std::vector<Condition>{std::move(condition)});
    }

    Query Query::join(const std::string &association, JoinType type) const {
        QueryState next = state_;
        JoinClause clause;
        clause.association = association;
        clause.type = type;
        next.joins.push_back(std::move(clause));
        return Query(std::move(next));
    }

    Query Query::join(const std::string &table, JoinType type, JoinOn on) const {
        QueryState next = state_;
        JoinClause clause;
        clause.table = table;
        clause.type = type;
        clause.on = std::move(on);
        next.joins.push_back(std::move(clause));
        return Query(std::move(next));
    }

    Query Query::orderBy(const std::string &field, OrderDirection direction) const {
        QueryState next = state_;
        next.order_by.push_back(OrderClause{field, direction});
        return Query(std::move(next));
    }

    Query Query::limit(int n) const {
        QueryState next = state_;
        next.limit = n;
        return Query(std::move(next));
    }

    Query Query::offset(int n) const {
        QueryState next = state_;
        next.offset = n;
        return Query(std::move(next));
    }

    Query Query::select(std::vector<std::string> fields) const {
        QueryState next = state_;
        next.selections = std::move(fields);
        if (next.selections.empty()) next.selections.push_back("*");
        return Query(std::move(next));
    }

    Query Query::preload(std::vector<std::string> associations) const {
        QueryState next = state_;
        for (auto &name : associations) {
            bool already = false;
            for (const auto &existing : next.preloads) {
                if (existing == name) {
                    already = true;
                    break;
                }
            }
            if (!already) next.preloads.push_back(std::move(name));
        }
        return Query(std::move(next));
    }

    Query Query::preload(const std::string &association) const {
        return preload(std::vector<std::string>{association});
    }

    std::expected<Query, Error> Query::through(const SchemaRegistry &registry, const std::string &association) const {
        const ModelMeta *owner = registry.find(state_.table);
        if (!owner) {
            return std::unexpected(Error(ErrorCode::InvalidRelationship, "Cannot navigate '" + association + "': table '" + state_.table + "' is not registered."));
        }
        const RelationshipInfo *rel = owner->findRelationship(association);
        if (!rel) {
            return std::unexpected(Error(ErrorCode::InvalidRelationship, "Table '" + state_.table + "' has no relationship named '" + association + "'."));
        }
        if (rel->type == AssociationType::ManyToMany) {
            return std::unexpected(Error(ErrorCode::NotImplemented, "Navigating manyToMany relationship '" + association + "' is not implemented."));
        }
        const ModelMeta *related = registry.find(rel->related_table);
        if (!related) {
            return std::unexpected(Error(ErrorCode::InvalidRelationship, "Cannot navigate '" + association + "': table '" + rel->related_table + "' is not registered."));
        }

        // 反向关联: 同一对列, 方向相反
        const RelationshipInfo *inverse = nullptr;
        for (const auto &candidate : related->relationships) {
            if (candidate.type != AssociationType::ManyToMany && candidate.related_table == state_.table && candidate.local_key == rel->foreign_key && candidate.foreign_key == rel->local_key) {
                inverse = &candidate;
                break;
            }
        }
        if (!inverse) {
            return std::unexpected(Error(ErrorCode::InvalidRelationship, "Table '" + rel->related_table + "' declares no relationship back to '" + state_.table + "' on " + rel->foreign_key + "."));
        }
        if (!state_.groups.empty() || !state_.relationship_conditions.empty()) {
            return std::unexpected(Error(ErrorCode::InvalidQuery, "Only plain conditions can be carried through '" + association + "'."));
        }

        Query rerooted = Query::from(rel->related_table).whereRelated(inverse->name, state_.conditions);
        rerooted.state_.limit = state_.limit;
        rerooted.state_.offset = state_.offset;
        return rerooted;
    }

    const std::string &Query::table() const {
        return state_.table;
    }
    const std::vector<std::string> &Query::selections() const {
        return state_.selections;
    }
    const std::vector<Condition> &Query::conditions() const {
        return state_.conditions;
    }
    const std::vector<ConditionGroup> &Query::groups() const {
        return state_.groups;
    }
    const std::vector<RelationshipCondition> &Query::relationshipConditions() const {
        return state_.relationship_conditions;
    }
    const std::vector<JoinClause> &Query::joins() const {
        return state_.joins;
    }
    const std::vector<OrderClause> &Query::orderClauses() const {
        return state_.order_by;
    }
    std::optional<int> Query::limitValue() const {
        return state_.limit;
    }
    std::optional<int> Query::offsetValue() const {
        return state_.offset;
    }
    const std::vector<std::string> &Query::preloads() const {
        return state_.preloads;
    }

    bool Query::joinsAssociation(const std::string &association) const {
        for (const auto &j : state_.joins) {
            if (j.association == association) return true;
        }
        return false;
    }

}  // namespace pgorm
