#include "pgorm/value_codec.h"

#include <QRegularExpression>
#include <charconv>

namespace pgorm {

    namespace {
        bool parse_whole_int64(const std::string &s, int64_t &out) {
            if (s.empty()) return false;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            return ec == std::errc() && ptr == s.data() + s.size();
        }
    }  // namespace

    std::optional<std::string> sql_value_to_map_key(const pgorm_sqldriver::SqlValue &value) {
        using pgorm_sqldriver::SqlValueType;
        switch (value.type()) {
            case SqlValueType::Null:
                return std::nullopt;
            case SqlValueType::Bool:
                return std::string(value.toBool() ? "b_1" : "b_0");
            case SqlValueType::Int64:
                return "i_" + std::to_string(value.toInt64());
            case SqlValueType::Double: {
                bool ok = false;
                int64_t as_int = value.toInt64(&ok);
                if (ok) return "i_" + std::to_string(as_int);
                return "d_" + value.toString();
            }
            case SqlValueType::String: {
                const std::string s = value.toString();
                int64_t as_int = 0;
                // 只有规范写法的整数文本才并入整数键, "01" 与 "1" 是不同的键
                if (parse_whole_int64(s, as_int) && std::to_string(as_int) == s) return "i_" + s;
                static const QRegularExpression uuid_pattern(QStringLiteral("^\\{?[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}\\}?$"));
                if (uuid_pattern.match(QString::fromStdString(s)).hasMatch()) {
                    return "u_" + value.toUuid().toString(QUuid::WithoutBraces).toLower().toStdString();
                }
                return "s_" + s;
            }
            case SqlValueType::ByteArray:
                return "x_" + value.toByteArray().toHex().toStdString();
            case SqlValueType::Uuid:
                return "u_" + value.toUuid().toString(QUuid::WithoutBraces).toLower().toStdString();
            case SqlValueType::DateTime:
                return "t_" + std::to_string(value.toDateTime().toMSecsSinceEpoch());
        }
        return std::nullopt;
    }

    std::optional<pgorm_sqldriver::SqlValue> coerce_to_field_type(const pgorm_sqldriver::SqlValue &value, FieldType type) {
        using pgorm_sqldriver::SqlValue;
        using pgorm_sqldriver::SqlValueType;
        if (value.isNull()) return value;

        bool ok = false;
        SqlValue converted;
        switch (type) {
            case FieldType::String:
                if (value.type() == SqlValueType::String) return value;
                if (value.type() == SqlValueType::ByteArray) return std::nullopt;
                converted = SqlValue(value.toString(&ok));
                break;
            case FieldType::Integer:
                if (value.type() == SqlValueType::Int64) return value;
                converted = SqlValue(value.toInt64(&ok));
                break;
            case FieldType::Float:
                if (value.type() == SqlValueType::Double) return value;
                converted = SqlValue(value.toDouble(&ok));
                break;
            case FieldType::Boolean:
                if (value.type() == SqlValueType::Bool) return value;
                converted = SqlValue(value.toBool(&ok));
                break;
            case FieldType::Uuid:
                if (value.type() == SqlValueType::Uuid) return value;
                converted = SqlValue(value.toUuid(&ok));
                break;
            case FieldType::Timestamp:
                if (value.type() == SqlValueType::DateTime) return value;
                converted = SqlValue(value.toDateTime(&ok));
                break;
            case FieldType::Bytes:
                if (value.type() == SqlValueType::ByteArray) return value;
                if (value.type() != SqlValueType::String) return std::nullopt;
                converted = SqlValue(value.toByteArray(&ok));
                break;
        }
        if (!ok) return std::nullopt;
        converted.setDriverTypeName(value.driverTypeName());
        return converted;
    }

    std::optional<FieldType> field_type_for_driver_type(const std::string &driver_type_name) {
        const std::string &t = driver_type_name;
        if (t == "int2" || t == "int4" || t == "int8" || t == "oid") return FieldType::Integer;
        if (t == "float4" || t == "float8" || t == "numeric") return FieldType::Float;
        if (t == "bool") return FieldType::Boolean;
        if (t == "uuid") return FieldType::Uuid;
        if (t == "timestamp" || t == "timestamptz" || t == "date") return FieldType::Timestamp;
        if (t == "bytea") return FieldType::Bytes;
        return std::nullopt;
    }

}  // namespace pgorm
