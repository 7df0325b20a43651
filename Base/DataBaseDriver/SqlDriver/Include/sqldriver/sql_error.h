// SqlDriver/Include/sqldriver/sql_error.h
#pragma once
#include <string>

namespace pgorm_sqldriver {

    enum class ErrorCategory { NoError, Connectivity, Syntax, Constraint, Permissions, DataRelated, Resource, Transaction, DriverInternal, DatabaseInternal, OperationCancelled, FeatureNotSupported, Unknown };

    const char* errorCategoryName(ErrorCategory category);

    class SqlError {
      public:
        SqlError();
        SqlError(ErrorCategory category, const std::string& databaseText, const std::string& driverText = "", const std::string& nativeErrorCode = "", const std::string& failedQuery = "", const std::string& constraintName = "");

        ErrorCategory category() const;
        std::string databaseText() const;
        std::string driverText() const;
        std::string text() const;
        // PostgreSQL 下为 SQLSTATE (5 个字符)
        std::string nativeErrorCode() const;
        std::string failedQuery() const;
        std::string constraintName() const;
        bool isValid() const;  // category() != ErrorCategory::NoError

        void setCategory(ErrorCategory category);
        void setDatabaseText(const std::string& text);
        void setDriverText(const std::string& text);
        void setNativeErrorCode(const std::string& code);
        void setFailedQuery(const std::string& query);
        void setConstraintName(const std::string& name);
        void clear();

      private:
        ErrorCategory category_ = ErrorCategory::NoError;
        std::string database_text_;
        std::string driver_text_;
        std::string native_error_code_;
        std::string failed_query_;
        std::string constraint_name_;
    };

}  // namespace pgorm_sqldriver
