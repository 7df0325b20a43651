// SqlDriver/Source/sql_error.cpp
#include "sqldriver/sql_error.h"

namespace pgorm_sqldriver {

    const char* errorCategoryName(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::NoError:
                return "NoError";
            case ErrorCategory::Connectivity:
                return "Connectivity";
            case ErrorCategory::Syntax:
                return "Syntax";
            case ErrorCategory::Constraint:
                return "Constraint";
            case ErrorCategory::Permissions:
                return "Permissions";
            case ErrorCategory::DataRelated:
                return "DataRelated";
            case ErrorCategory::Resource:
                return "Resource";
            case ErrorCategory::Transaction:
                return "Transaction";
            case ErrorCategory::DriverInternal:
                return "DriverInternal";
            case ErrorCategory::DatabaseInternal:
                return "DatabaseInternal";
            case ErrorCategory::OperationCancelled:
                return "OperationCancelled";
            case ErrorCategory::FeatureNotSupported:
                return "FeatureNotSupported";
            case ErrorCategory::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    SqlError::SqlError() : category_(ErrorCategory::NoError) {
    }

    SqlError::SqlError(ErrorCategory category, const std::string& databaseText, const std::string& driverText, const std::string& nativeErrorCode, const std::string& failedQuery, const std::string& constraintName)
        : category_(category), database_text_(databaseText), driver_text_(driverText), native_error_code_(nativeErrorCode), failed_query_(failedQuery), constraint_name_(constraintName) {
    }

    ErrorCategory SqlError::category() const {
        return category_;
    }

    std::string SqlError::databaseText() const {
        return database_text_;
    }

    std::string SqlError::driverText() const {
        return driver_text_;
    }

    std::string SqlError::text() const {
        // Combine driver and database text for a comprehensive message
        if (!driver_text_.empty() && !database_text_.empty()) {
            if (driver_text_ == database_text_) return driver_text_;
            return driver_text_ + " (Database: " + database_text_ + ")";
        }
        if (!driver_text_.empty()) return driver_text_;
        return database_text_;
    }

    std::string SqlError::nativeErrorCode() const {
        return native_error_code_;
    }

    std::string SqlError::failedQuery() const {
        return failed_query_;
    }

    std::string SqlError::constraintName() const {
        return constraint_name_;
    }

    bool SqlError::isValid() const {
        return category_ != ErrorCategory::NoError;
    }

    void SqlError::setCategory(ErrorCategory category) {
        category_ = category;
    }

    void SqlError::setDatabaseText(const std::string& text) {
        database_text_ = text;
    }

    void SqlError::setDriverText(const std::string& text) {
        driver_text_ = text;
    }

    void SqlError::setNativeErrorCode(const std::string& code) {
        native_error_code_ = code;
    }

    void SqlError::setFailedQuery(const std::string& query) {
        failed_query_ = query;
    }

    void SqlError::setConstraintName(const std::string& name) {
        constraint_name_ = name;
    }

    void SqlError::clear() {
        category_ = ErrorCategory::NoError;
        database_text_.clear();
        driver_text_.clear();
        native_error_code_.clear();
        failed_query_.clear();
        constraint_name_.clear();
    }

}  // namespace pgorm_sqldriver
