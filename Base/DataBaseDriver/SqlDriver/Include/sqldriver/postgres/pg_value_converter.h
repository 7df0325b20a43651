// SqlDriver/Include/sqldriver/postgres/pg_value_converter.h
#pragma once
#include <optional>
#include <string>

#include "sqldriver/sql_error.h"
#include "sqldriver/sql_value.h"

namespace pgorm_sqldriver {
    namespace pg_helper {

        // SqlValue -> libpq 文本格式参数, NULL 返回 nullopt
        std::optional<std::string> toTextParameter(const SqlValue& value);

        // 内置类型 OID -> 类型名 ("int8", "text", ...), 未知类型返回 "unknown"
        std::string typeNameForOid(unsigned int oid);

        // SQLSTATE 前两位决定错误类别
        ErrorCategory categoryForSqlState(const std::string& sql_state);

    }  // namespace pg_helper
}  // namespace pgorm_sqldriver
