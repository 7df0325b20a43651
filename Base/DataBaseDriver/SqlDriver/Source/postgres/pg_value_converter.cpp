// SqlDriver/Source/postgres/pg_value_converter.cpp
#include "sqldriver/postgres/pg_value_converter.h"

namespace pgorm_sqldriver {
    namespace pg_helper {

        std::optional<std::string> toTextParameter(const SqlValue& value) {
            switch (value.type()) {
                case SqlValueType::Null:
                    return std::nullopt;
                case SqlValueType::Bool:
                    return std::string(value.toBool() ? "true" : "false");
                case SqlValueType::ByteArray:
                    // bytea 十六进制输入格式
                    return "\\x" + value.toByteArray().toHex().toStdString();
                default:
                    return value.toString();
            }
        }

        std::string typeNameForOid(unsigned int oid) {
            // 取自 pg_type.dat 的内置 OID
            switch (oid) {
                case 16:
                    return "bool";
                case 17:
                    return "bytea";
                case 18:
                    return "char";
                case 19:
                    return "name";
                case 20:
                    return "int8";
                case 21:
                    return "int2";
                case 23:
                    return "int4";
                case 25:
                    return "text";
                case 26:
                    return "oid";
                case 114:
                    return "json";
                case 700:
                    return "float4";
                case 701:
                    return "float8";
                case 1042:
                    return "bpchar";
                case 1043:
                    return "varchar";
                case 1082:
                    return "date";
                case 1083:
                    return "time";
                case 1114:
                    return "timestamp";
                case 1184:
                    return "timestamptz";
                case 1700:
                    return "numeric";
                case 2950:
                    return "uuid";
                case 3802:
                    return "jsonb";
                default:
                    return "unknown";
            }
        }

        ErrorCategory categoryForSqlState(const std::string& sql_state) {
            if (sql_state.size() != 5) return ErrorCategory::Unknown;
            if (sql_state == "57014") return ErrorCategory::OperationCancelled;
            if (sql_state == "42501") return ErrorCategory::Permissions;

            const std::string cls = sql_state.substr(0, 2);
            if (cls == "08") return ErrorCategory::Connectivity;
            if (cls == "42") return ErrorCategory::Syntax;
            if (cls == "23") return ErrorCategory::Constraint;
            if (cls == "22") return ErrorCategory::DataRelated;
            if (cls == "25" || cls == "40") return ErrorCategory::Transaction;
            if (cls == "28") return ErrorCategory::Permissions;
            if (cls == "53" || cls == "54") return ErrorCategory::Resource;
            if (cls == "0A") return ErrorCategory::FeatureNotSupported;
            if (cls == "57" || cls == "58" || cls == "XX") return ErrorCategory::DatabaseInternal;
            return ErrorCategory::Unknown;
        }

    }  // namespace pg_helper
}  // namespace pgorm_sqldriver
