// SqlDriver/Include/sqldriver/sql_enums.h
#pragma once
#include <optional>
#include <string>

namespace pgorm_sqldriver {

    enum class TransactionIsolationLevel {
        Default,  // 使用服务器默认级别, BEGIN 不带 ISOLATION LEVEL
        ReadUncommitted,
        ReadCommitted,
        RepeatableRead,
        Serializable
    };

    // 返回 "READ COMMITTED" 之类的 SQL 关键字, Default 返回 nullopt
    std::optional<std::string> isolationLevelSql(TransactionIsolationLevel level);

}  // namespace pgorm_sqldriver
