// SqlDriver/Source/sql_value_core.cpp
#include "sqldriver/sql_value.h"

#include <utility>

namespace pgorm_sqldriver {

    const char* sqlValueTypeName(SqlValueType type) {
        switch (type) {
            case SqlValueType::Null:
                return "Null";
            case SqlValueType::Bool:
                return "Bool";
            case SqlValueType::Int64:
                return "Int64";
            case SqlValueType::Double:
                return "Double";
            case SqlValueType::String:
                return "String";
            case SqlValueType::ByteArray:
                return "ByteArray";
            case SqlValueType::Uuid:
                return "Uuid";
            case SqlValueType::DateTime:
                return "DateTime";
        }
        return "Unknown";
    }

    SqlValue::SqlValue() : storage_(std::monostate{}), type_(SqlValueType::Null) {
    }

    SqlValue::SqlValue(std::nullptr_t) : SqlValue() {
    }

    SqlValue::SqlValue(bool val) : storage_(val), type_(SqlValueType::Bool) {
    }

    SqlValue::SqlValue(double val) : storage_(val), type_(SqlValueType::Double) {
    }

    SqlValue::SqlValue(float val) : storage_(static_cast<double>(val)), type_(SqlValueType::Double) {
    }

    SqlValue::SqlValue(const char* val) {
        if (val) {
            storage_ = std::string(val);
            type_ = SqlValueType::String;
        } else {
            storage_ = std::monostate{};
            type_ = SqlValueType::Null;
        }
    }

    SqlValue::SqlValue(const std::string& val) : storage_(val), type_(SqlValueType::String) {
    }

    SqlValue::SqlValue(std::string&& val) : storage_(std::move(val)), type_(SqlValueType::String) {
    }

    SqlValue::SqlValue(const QString& val) {
        if (val.isNull()) {
            storage_ = std::monostate{};
            type_ = SqlValueType::Null;
        } else {
            storage_ = val.toStdString();
            type_ = SqlValueType::String;
        }
    }

    SqlValue::SqlValue(const QByteArray& val) {
        if (val.isNull()) {
            storage_ = std::monostate{};
            type_ = SqlValueType::Null;
        } else {
            storage_ = val;
            type_ = SqlValueType::ByteArray;
        }
    }

    SqlValue::SqlValue(const QUuid& val) : storage_(val), type_(SqlValueType::Uuid) {
    }

    SqlValue::SqlValue(const QDateTime& val) {
        if (!val.isValid()) {
            storage_ = std::monostate{};
            type_ = SqlValueType::Null;
        } else {
            storage_ = val;
            type_ = SqlValueType::DateTime;
        }
    }

    SqlValueType SqlValue::type() const {
        return type_;
    }

    const char* SqlValue::typeName() const {
        return sqlValueTypeName(type_);
    }

    bool SqlValue::isNull() const {
        return type_ == SqlValueType::Null;
    }

    const std::string& SqlValue::driverTypeName() const {
        return driver_type_name_;
    }

    void SqlValue::setDriverTypeName(const std::string& name) {
        driver_type_name_ = name;
    }

    const SqlValue::Storage& SqlValue::storage() const {
        return storage_;
    }

    bool SqlValue::operator==(const SqlValue& other) const {
        if (type_ != other.type_) return false;
        return storage_ == other.storage_;
    }

    bool SqlValue::operator!=(const SqlValue& other) const {
        return !(*this == other);
    }

}  // namespace pgorm_sqldriver
