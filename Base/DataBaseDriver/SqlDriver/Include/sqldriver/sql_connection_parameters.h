// SqlDriver/Include/sqldriver/sql_connection_parameters.h
#pragma once

#include <map>
#include <optional>
#include <string>

#include "sqldriver/sql_value.h"

namespace pgorm_sqldriver {

    struct ConnectionParameters : public std::map<std::string, SqlValue> {
        // 定义键常量 (声明)
        static const std::string KEY_DRIVER_TYPE;
        static const std::string KEY_DB_NAME;
        static const std::string KEY_USER_NAME;
        static const std::string KEY_PASSWORD;
        static const std::string KEY_HOST_NAME;
        static const std::string KEY_PORT;
        static const std::string KEY_CONNECT_OPTIONS;
        static const std::string KEY_APPLICATION_NAME;
        static const std::string KEY_CONNECTION_TIMEOUT_SECONDS;
        static const std::string KEY_STATEMENT_TIMEOUT_MS;
        static const std::string KEY_SSL_MODE;

        void setDriverType(const std::string& v);
        void setDbName(const std::string& v);
        void setUserName(const std::string& v);
        void setPassword(const std::string& v);
        void setHostName(const std::string& v);
        void setPort(int v);
        void setConnectOptions(const std::string& v);
        void setApplicationName(const std::string& v);
        void setConnectionTimeoutSeconds(int v);
        void setStatementTimeoutMs(long long v);
        void setSslMode(const std::string& v);

        std::optional<std::string> getString(const std::string& key) const;
        std::optional<long long> getInteger(const std::string& key) const;

        std::optional<std::string> driverType() const;
        std::optional<std::string> dbName() const;
        std::optional<std::string> userName() const;
        std::optional<std::string> password() const;
        std::optional<std::string> hostName() const;
        std::optional<int> port() const;
        std::optional<std::string> connectOptions() const;
        std::optional<std::string> applicationName() const;
        std::optional<int> connectionTimeoutSeconds() const;
        std::optional<long long> statementTimeoutMs() const;
        std::optional<std::string> sslMode() const;
    };

}  // namespace pgorm_sqldriver
