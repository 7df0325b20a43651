#include "pgorm/db_manager.h"

#include <QDebug>
#include <QFile>
#include <QTextStream>
#include <cstdlib>

#include "pgorm/connection_provider.h"
#include "sqldriver/postgres/pg_specific_driver.h"
#include "sqldriver/sql_driver_manager.h"

namespace pgorm {

    namespace {
        std::string stripQuotes(const std::string &value) {
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
                return value.substr(1, value.size() - 2);
            }
            return value;
        }

        class SettingLookup {
          public:
            SettingLookup(const std::map<std::string, std::string> &overrides, std::map<std::string, std::string> file_values) : overrides_(overrides), file_values_(std::move(file_values)) {
            }

            // 依次查找 PGORM_DB_<suffix> 和 DB_<suffix>
            std::optional<std::string> get(const std::string &suffix) const {
                for (const std::string key : {"PGORM_DB_" + suffix, "DB_" + suffix}) {
                    if (auto it = overrides_.find(key); it != overrides_.end()) return it->second;
                    if (const char *env = std::getenv(key.c_str())) return std::string(env);
                    if (auto it = file_values_.find(key); it != file_values_.end()) return it->second;
                }
                return std::nullopt;
            }

          private:
            const std::map<std::string, std::string> &overrides_;
            std::map<std::string, std::string> file_values_;
        };

        std::optional<long long> parseInteger(const std::string &text) {
            bool ok = false;
            const long long value = QString::fromStdString(text).trimmed().toLongLong(&ok);
            if (!ok) return std::nullopt;
            return value;
        }
    }  // namespace

    std::map<std::string, std::string> DbConfig::parseEnvFile(const std::string &path) {
        std::map<std::string, std::string> values;
        QFile file(QString::fromStdString(path));
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            qWarning() << "pgorm: cannot read env file" << QString::fromStdString(path);
            return values;
        }
        QTextStream in(&file);
        while (!in.atEnd()) {
            const QString line = in.readLine().trimmed();
            if (line.isEmpty() || line.startsWith('#')) continue;
            const qsizetype eq = line.indexOf('=');
            if (eq <= 0) continue;
            QString key = line.left(eq).trimmed();
            if (key.startsWith("export ")) key = key.mid(7).trimmed();
            values[key.toStdString()] = stripQuotes(line.mid(eq + 1).trimmed().toStdString());
        }
        return values;
    }

    std::expected<DbConfig, Error> DbConfig::fromEnvironment(const std::map<std::string, std::string> &overrides, const std::string &env_file) {
        DbConfig config;
        SettingLookup lookup(overrides, env_file.empty() ? std::map<std::string, std::string>{} : parseEnvFile(env_file));

        if (auto v = lookup.get("HOST")) config.host_name = *v;
        if (auto v = lookup.get("USER")) config.user_name = *v;
        if (auto v = lookup.get("PASSWORD")) config.password = *v;
        if (auto v = lookup.get("NAME")) config.database_name = *v;
        if (auto v = lookup.get("SSLMODE")) config.ssl_mode = *v;

        if (auto v = lookup.get("PORT")) {
            auto port = parseInteger(*v);
            if (!port || *port <= 0 || *port > 65535) {
                return std::unexpected(Error(ErrorCode::InvalidConfiguration, "Invalid database port '" + *v + "'."));
            }
            config.port = static_cast<int>(*port);
        }
        if (auto v = lookup.get("POOL_SIZE")) {
            auto size = parseInteger(*v);
            if (!size || *size <= 0) {
                return std::unexpected(Error(ErrorCode::InvalidConfiguration, "Invalid pool size '" + *v + "'."));
            }
            config.pool_size = static_cast<size_t>(*size);
        }
        if (auto v = lookup.get("STATEMENT_TIMEOUT_MS")) {
            auto timeout = parseInteger(*v);
            if (!timeout || *timeout < 0) {
                return std::unexpected(Error(ErrorCode::InvalidConfiguration, "Invalid statement timeout '" + *v + "'."));
            }
            config.statement_timeout_ms = *timeout;
        }
        return config;
    }

    pgorm_sqldriver::ConnectionParameters DbConfig::toConnectionParameters() const {
        pgorm_sqldriver::ConnectionParameters params;
        params.setDriverType(driver_type);
        params.setHostName(host_name);
        if (port > 0) params.setPort(port);
        params.setDbName(database_name);
        params.setUserName(user_name);
        params.setPassword(password);
        if (!connect_options.empty()) params.setConnectOptions(connect_options);
        if (!application_name.empty()) params.setApplicationName(application_name);
        if (!ssl_mode.empty()) params.setSslMode(ssl_mode);
        if (connection_timeout_seconds > 0) params.setConnectionTimeoutSeconds(connection_timeout_seconds);
        if (statement_timeout_ms > 0) params.setStatementTimeoutMs(statement_timeout_ms);
        return params;
    }

    pgorm_sqldriver::PoolConfig DbConfig::toPoolConfig() const {
        pgorm_sqldriver::PoolConfig pool_config;
        pool_config.driver_type = driver_type;
        pool_config.parameters = toConnectionParameters();
        pool_config.max_pool_size = pool_size;
        pool_config.acquire_timeout = acquire_timeout;
        return pool_config;
    }

    std::expected<std::shared_ptr<pgorm_sqldriver::SqlConnectionPool>, Error> DbManager::openPool(const DbConfig &config) {
        if (config.driver_type == pgorm_sqldriver::POSTGRES_DRIVER_NAME && !pgorm_sqldriver::SqlDriverManager::isDriverAvailable(config.driver_type)) {
            pgorm_sqldriver::PgDriver_Initialize();
        }
        if (!pgorm_sqldriver::SqlDriverManager::isDriverAvailable(config.driver_type)) {
            return std::unexpected(Error(ErrorCode::InvalidConfiguration, "Driver '" + config.driver_type + "' is not registered."));
        }
        if (config.pool_size == 0) {
            return std::unexpected(Error(ErrorCode::InvalidConfiguration, "Pool size must be positive."));
        }

        auto pool = pgorm_sqldriver::SqlConnectionPool::create(config.toPoolConfig());
        // 先拿一条连接, 配置错误在这里暴露而不是在第一次查询时
        auto [err, conn] = pool->acquire();
        if (!conn) {
            qCritical().noquote() << "pgorm: cannot open" << QString::fromStdString(config.host_name + ":" + std::to_string(config.port) + "/" + config.database_name) << "-" << QString::fromStdString(err.text());
            pool->close();
            Error result = connectionError(err, "Failed to open database pool");
            result.code = ErrorCode::ConnectionFailed;
            return std::unexpected(result);
        }
        conn.release();
        qInfo().noquote() << "pgorm: connection pool ready for" << QString::fromStdString(config.host_name + ":" + std::to_string(config.port) + "/" + config.database_name);
        return pool;
    }

}  // namespace pgorm
