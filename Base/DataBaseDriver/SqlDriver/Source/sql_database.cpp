// SqlDriver/Source/sql_database.cpp
#include "sqldriver/sql_database.h"

#include <utility>

namespace pgorm_sqldriver {

    SqlDatabase::SqlDatabase(const std::string& driver_type, const std::string& connection_name, std::unique_ptr<ISqlDriver> driver) : driver_type_(driver_type), connection_name_(connection_name), driver_(std::move(driver)) {
        if (!driver_) {
            last_error_ = SqlError(ErrorCategory::DriverInternal, "", "Driver '" + driver_type + "' is not registered.");
        }
    }

    SqlDatabase::~SqlDatabase() {
        if (driver_ && driver_->isOpen()) {
            driver_->close();
        }
    }

    SqlDatabase::SqlDatabase(SqlDatabase&& other) noexcept
        : driver_type_(std::move(other.driver_type_)), connection_name_(std::move(other.connection_name_)), driver_(std::move(other.driver_)), parameters_(std::move(other.parameters_)), last_error_(std::move(other.last_error_)) {
    }

    SqlDatabase& SqlDatabase::operator=(SqlDatabase&& other) noexcept {
        if (this != &other) {
            if (driver_ && driver_->isOpen()) driver_->close();
            driver_type_ = std::move(other.driver_type_);
            connection_name_ = std::move(other.connection_name_);
            driver_ = std::move(other.driver_);
            parameters_ = std::move(other.parameters_);
            last_error_ = std::move(other.last_error_);
        }
        return *this;
    }

    void SqlDatabase::updateLastErrorFromDriver() {
        if (driver_) {
            last_error_ = driver_->lastError();
        }
    }

    bool SqlDatabase::open(const ConnectionParameters& params) {
        parameters_ = params;
        return open();
    }

    bool SqlDatabase::open() {
        if (!driver_) {
            last_error_ = SqlError(ErrorCategory::DriverInternal, "", "Driver '" + driver_type_ + "' is not registered.");
            return false;
        }
        if (driver_->isOpen()) {
            driver_->close();
        }
        bool success = driver_->open(parameters_);
        updateLastErrorFromDriver();
        return success;
    }

    void SqlDatabase::close() {
        if (driver_) {
            driver_->close();
            updateLastErrorFromDriver();
        }
    }

    bool SqlDatabase::isOpen() const {
        return driver_ && driver_->isOpen();
    }

    bool SqlDatabase::isValid() const {
        return driver_ != nullptr;
    }

    bool SqlDatabase::ping() {
        if (!isOpen()) {
            last_error_ = SqlError(ErrorCategory::Connectivity, "", "Connection is not open.");
            return false;
        }
        bool success = driver_->ping();
        updateLastErrorFromDriver();
        return success;
    }

    bool SqlDatabase::execute(const std::string& sql, const std::vector<SqlValue>& params, long long* affected_rows) {
        if (!isOpen()) {
            last_error_ = SqlError(ErrorCategory::Connectivity, "", "Connection is not open.", "", sql);
            return false;
        }
        bool success = driver_->execute(sql, params, affected_rows);
        updateLastErrorFromDriver();
        return success;
    }

    bool SqlDatabase::query(const std::string& sql, const std::vector<SqlValue>& params, std::vector<SqlRecord>* rows) {
        if (!isOpen()) {
            last_error_ = SqlError(ErrorCategory::Connectivity, "", "Connection is not open.", "", sql);
            return false;
        }
        bool success = driver_->query(sql, params, rows);
        updateLastErrorFromDriver();
        return success;
    }

    bool SqlDatabase::cancel() {
        return driver_ && driver_->cancel();
    }

    std::string SqlDatabase::driverName() const {
        return driver_ ? driver_->driverName() : driver_type_;
    }

    const std::string& SqlDatabase::connectionName() const {
        return connection_name_;
    }

    const ConnectionParameters& SqlDatabase::connectionParameters() const {
        return parameters_;
    }

    SqlError SqlDatabase::lastError() const {
        return last_error_;
    }

    ISqlDriver* SqlDatabase::driver() const {
        return driver_.get();
    }

}  // namespace pgorm_sqldriver
