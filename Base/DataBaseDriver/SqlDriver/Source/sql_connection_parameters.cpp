// SqlDriver/Source/sql_connection_parameters.cpp
#include "sqldriver/sql_connection_parameters.h"

namespace pgorm_sqldriver {

    // 定义静态常量成员
    const std::string ConnectionParameters::KEY_DRIVER_TYPE = "driver_type";
    const std::string ConnectionParameters::KEY_DB_NAME = "db_name";
    const std::string ConnectionParameters::KEY_USER_NAME = "user_name";
    const std::string ConnectionParameters::KEY_PASSWORD = "password";
    const std::string ConnectionParameters::KEY_HOST_NAME = "host_name";
    const std::string ConnectionParameters::KEY_PORT = "port";
    const std::string ConnectionParameters::KEY_CONNECT_OPTIONS = "connect_options";
    const std::string ConnectionParameters::KEY_APPLICATION_NAME = "application_name";
    const std::string ConnectionParameters::KEY_CONNECTION_TIMEOUT_SECONDS = "connection_timeout_seconds";
    const std::string ConnectionParameters::KEY_STATEMENT_TIMEOUT_MS = "statement_timeout_ms";
    const std::string ConnectionParameters::KEY_SSL_MODE = "ssl_mode";

    // Setters
    void ConnectionParameters::setDriverType(const std::string& v) {
        (*this)[KEY_DRIVER_TYPE] = SqlValue(v);
    }
    void ConnectionParameters::setDbName(const std::string& v) {
        (*this)[KEY_DB_NAME] = SqlValue(v);
    }
    void ConnectionParameters::setUserName(const std::string& v) {
        (*this)[KEY_USER_NAME] = SqlValue(v);
    }
    void ConnectionParameters::setPassword(const std::string& v) {
        (*this)[KEY_PASSWORD] = SqlValue(v);
    }
    void ConnectionParameters::setHostName(const std::string& v) {
        (*this)[KEY_HOST_NAME] = SqlValue(v);
    }
    void ConnectionParameters::setPort(int v) {
        (*this)[KEY_PORT] = SqlValue(v);
    }
    void ConnectionParameters::setConnectOptions(const std::string& v) {
        (*this)[KEY_CONNECT_OPTIONS] = SqlValue(v);
    }
    void ConnectionParameters::setApplicationName(const std::string& v) {
        (*this)[KEY_APPLICATION_NAME] = SqlValue(v);
    }
    void ConnectionParameters::setConnectionTimeoutSeconds(int v) {
        (*this)[KEY_CONNECTION_TIMEOUT_SECONDS] = SqlValue(v);
    }
    void ConnectionParameters::setStatementTimeoutMs(long long v) {
        (*this)[KEY_STATEMENT_TIMEOUT_MS] = SqlValue(v);
    }
    void ConnectionParameters::setSslMode(const std::string& v) {
        (*this)[KEY_SSL_MODE] = SqlValue(v);
    }

    std::optional<std::string> ConnectionParameters::getString(const std::string& key) const {
        auto it = find(key);
        if (it == end() || it->second.isNull()) return std::nullopt;
        bool ok = false;
        std::string s = it->second.toString(&ok);
        if (!ok) return std::nullopt;
        return s;
    }

    std::optional<long long> ConnectionParameters::getInteger(const std::string& key) const {
        auto it = find(key);
        if (it == end() || it->second.isNull()) return std::nullopt;
        bool ok = false;
        int64_t v = it->second.toInt64(&ok);
        if (!ok) return std::nullopt;
        return static_cast<long long>(v);
    }

    // Getters
    std::optional<std::string> ConnectionParameters::driverType() const {
        return getString(KEY_DRIVER_TYPE);
    }
    std::optional<std::string> ConnectionParameters::dbName() const {
        return getString(KEY_DB_NAME);
    }
    std::optional<std::string> ConnectionParameters::userName() const {
        return getString(KEY_USER_NAME);
    }
    std::optional<std::string> ConnectionParameters::password() const {
        return getString(KEY_PASSWORD);
    }
    std::optional<std::string> ConnectionParameters::hostName() const {
        return getString(KEY_HOST_NAME);
    }
    std::optional<int> ConnectionParameters::port() const {
        auto v = getInteger(KEY_PORT);
        if (!v) return std::nullopt;
        return static_cast<int>(*v);
    }
    std::optional<std::string> ConnectionParameters::connectOptions() const {
        return getString(KEY_CONNECT_OPTIONS);
    }
    std::optional<std::string> ConnectionParameters::applicationName() const {
        return getString(KEY_APPLICATION_NAME);
    }
    std::optional<int> ConnectionParameters::connectionTimeoutSeconds() const {
        auto v = getInteger(KEY_CONNECTION_TIMEOUT_SECONDS);
        if (!v) return std::nullopt;
        return static_cast<int>(*v);
    }
    std::optional<long long> ConnectionParameters::statementTimeoutMs() const {
        return getInteger(KEY_STATEMENT_TIMEOUT_MS);
    }
    std::optional<std::string> ConnectionParameters::sslMode() const {
        return getString(KEY_SSL_MODE);
    }

}  // namespace pgorm_sqldriver
