// SqlDriver/Source/sql_enums.cpp
#include "sqldriver/sql_enums.h"

namespace pgorm_sqldriver {

    std::optional<std::string> isolationLevelSql(TransactionIsolationLevel level) {
        switch (level) {
            case TransactionIsolationLevel::ReadUncommitted:
                return std::string("READ UNCOMMITTED");
            case TransactionIsolationLevel::ReadCommitted:
                return std::string("READ COMMITTED");
            case TransactionIsolationLevel::RepeatableRead:
                return std::string("REPEATABLE READ");
            case TransactionIsolationLevel::Serializable:
                return std::string("SERIALIZABLE");
            case TransactionIsolationLevel::Default:
                break;
        }
        return std::nullopt;
    }

}  // namespace pgorm_sqldriver
