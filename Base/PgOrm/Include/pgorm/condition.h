#ifndef pgorm_CONDITION_H
#define pgorm_CONDITION_H

#include <string>
#include <variant>
#include <vector>

#include "sqldriver/sql_value.h"

namespace pgorm {

    using SqlValue = pgorm_sqldriver::SqlValue;
    using ConditionValue = std::variant<SqlValue, std::vector<SqlValue>>;

    // 单个比较条件. op 在编译 SQL 时校验, 不在白名单里的运算符是 InvalidQuery
    struct Condition {
        std::string field;
        std::string op;
        ConditionValue value;

        Condition(std::string fieldName, std::string oper, SqlValue v = SqlValue());
        Condition(std::string fieldName, std::string oper, std::vector<SqlValue> values);

        bool isList() const {
            return std::holds_alternative<std::vector<SqlValue>>(value);
        }
        bool operator==(const Condition &other) const;
        bool operator!=(const Condition &other) const {
            return !(*this == other);
        }
    };

    enum class GroupCombinator { All, Any };

    // 组内条件默认 AND, Any 时为 OR; 组与组之间总是 AND
    struct ConditionGroup {
        std::vector<Condition> conditions;
        GroupCombinator combinator = GroupCombinator::All;

        bool operator==(const ConditionGroup &other) const {
            return combinator == other.combinator && conditions == other.conditions;
        }
    };

    // Field("age").greaterThanOrEqual(18)
    class Field {
      public:
        explicit Field(std::string name);

        Condition eq(const SqlValue &v) const;
        Condition notEq(const SqlValue &v) const;
        Condition greaterThan(const SqlValue &v) const;
        Condition greaterThanOrEqual(const SqlValue &v) const;
        Condition lessThan(const SqlValue &v) const;
        Condition lessThanOrEqual(const SqlValue &v) const;
        Condition like(const std::string &pattern) const;
        Condition ilike(const std::string &pattern) const;
        Condition in(std::vector<SqlValue> values) const;
        Condition notIn(std::vector<SqlValue> values) const;
        Condition between(const SqlValue &low, const SqlValue &high) const;
        Condition isNull() const;
        Condition isNotNull() const;

        const std::string &name() const {
            return name_;
        }

      private:
        std::string name_;
    };

}  // namespace pgorm

#endif  // pgorm_CONDITION_H
