#include "pgorm/condition.h"

#include <utility>

namespace pgorm {

    Condition::Condition(std::string fieldName, std::string oper, SqlValue v) : field(std::move(fieldName)), op(std::move(oper)), value(std::move(v)) {
    }

    Condition::Condition(std::string fieldName, std::string oper, std::vector<SqlValue> values) : field(std::move(fieldName)), op(std::move(oper)), value(std::move(values)) {
    }

    bool Condition::operator==(const Condition &other) const {
        return field == other.field && op == other.op && value == other.value;
    }

    Field::Field(std::string name) : name_(std::move(name)) {
    }

    Condition Field::eq(const SqlValue &v) const {
        return Condition(name_, "=", v);
    }
    Condition Field::notEq(const SqlValue &v) const {
        return Condition(name_, "!=", v);
    }
    Condition Field::greaterThan(const SqlValue &v) const {
        return Condition(name_, ">", v);
    }
    Condition Field::greaterThanOrEqual(const SqlValue &v) const {
        return Condition(name_, ">=", v);
    }
    Condition Field::lessThan(const SqlValue &v) const {
        return Condition(name_, "<", v);
    }
    Condition Field::lessThanOrEqual(const SqlValue &v) const {
        return Condition(name_, "<=", v);
    }
    Condition Field::like(const std::string &pattern) const {
        return Condition(name_, "LIKE", SqlValue(pattern));
    }
    Condition Field::ilike(const std::string &pattern) const {
        return Condition(name_, "ILIKE", SqlValue(pattern));
    }
    Condition Field::in(std::vector<SqlValue> values) const {
        return Condition(name_, "IN", std::move(values));
    }
    Condition Field::notIn(std::vector<SqlValue> values) const {
        return Condition(name_, "NOT IN", std::move(values));
    }
    Condition Field::between(const SqlValue &low, const SqlValue &high) const {
        return Condition(name_, "BETWEEN", std::vector<SqlValue>{low, high});
    }
    Condition Field::isNull() const {
        return Condition(name_, "IS NULL");
    }
    Condition Field::isNotNull() const {
        return Condition(name_, "IS NOT NULL");
    }

}  // namespace pgorm
