// SqlDriver/Include/sqldriver/sql_value.h
#pragma once
#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <QUuid>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

namespace pgorm_sqldriver {

    enum class SqlValueType { Null, Bool, Int64, Double, String, ByteArray, Uuid, DateTime };

    const char* sqlValueTypeName(SqlValueType type);

    class SqlValue {
      public:
        using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, QByteArray, QUuid, QDateTime>;

        // 构造函数
        SqlValue();
        SqlValue(std::nullptr_t);
        SqlValue(bool val);
        SqlValue(double val);
        SqlValue(float val);
        SqlValue(const char* val);
        SqlValue(const std::string& val);
        SqlValue(std::string&& val);
        SqlValue(const QString& val);
        SqlValue(const QByteArray& val);
        SqlValue(const QUuid& val);
        SqlValue(const QDateTime& val);

        // 所有整数类型统一存储为 int64_t
        template <typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
        SqlValue(T val) : storage_(static_cast<int64_t>(val)), type_(SqlValueType::Int64) {
        }

        SqlValueType type() const;
        const char* typeName() const;
        bool isNull() const;

        // 后端原始类型名 (例如 "int8", "timestamptz")，由驱动设置
        const std::string& driverTypeName() const;
        void setDriverTypeName(const std::string& name);

        // 转换, ok 为 false 表示无法转换
        bool toBool(bool* ok = nullptr) const;
        int64_t toInt64(bool* ok = nullptr) const;
        double toDouble(bool* ok = nullptr) const;
        std::string toString(bool* ok = nullptr) const;
        QByteArray toByteArray(bool* ok = nullptr) const;
        QUuid toUuid(bool* ok = nullptr) const;
        QDateTime toDateTime(bool* ok = nullptr) const;

        // 用于日志输出, 字符串加引号
        std::string toDebugString() const;

        const Storage& storage() const;

        // 比较只看类型和值, 不比较 driverTypeName
        bool operator==(const SqlValue& other) const;
        bool operator!=(const SqlValue& other) const;

      private:
        Storage storage_;
        SqlValueType type_ = SqlValueType::Null;
        std::string driver_type_name_;
    };

}  // namespace pgorm_sqldriver
