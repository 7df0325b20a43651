#ifndef pgorm_DB_MANAGER_H
#define pgorm_DB_MANAGER_H

#include <chrono>
#include <expected>
#include <map>
#include <memory>
#include <string>

#include "pgorm/error.h"
#include "sqldriver/sql_connection_parameters.h"
#include "sqldriver/sql_connection_pool.h"

namespace pgorm {

    struct DbConfig {
        std::string driver_type = "POSTGRES";
        std::string host_name = "localhost";
        int port = 5432;
        std::string database_name = "pgorm";
        std::string user_name = "postgres";
        std::string password = "postgres";
        std::string connect_options;
        std::string application_name = "pgorm";
        std::string ssl_mode;
        int connection_timeout_seconds = 10;
        long long statement_timeout_ms = 0;  // 0: 不设置
        size_t pool_size = 10;
        std::chrono::milliseconds acquire_timeout{5000};

        // PGORM_DB_HOST / PORT / USER / PASSWORD / NAME / POOL_SIZE, 没有时回退到 DB_*.
        // 优先级: overrides > 进程环境变量 > env_file > 默认值
        static std::expected<DbConfig, Error> fromEnvironment(const std::map<std::string, std::string> &overrides = {}, const std::string &env_file = "");

        // 解析 .env 文件: KEY=VALUE, 忽略空行和 # 注释, 去掉值两端的引号
        static std::map<std::string, std::string> parseEnvFile(const std::string &path);

        pgorm_sqldriver::ConnectionParameters toConnectionParameters() const;
        pgorm_sqldriver::PoolConfig toPoolConfig() const;
    };

    class DbManager {
      public:
        DbManager() = delete;

        // 创建连接池并打开一条连接验证配置, 失败时返回 ConnectionFailed
        static std::expected<std::shared_ptr<pgorm_sqldriver::SqlConnectionPool>, Error> openPool(const DbConfig &config);
    };

}  // namespace pgorm

#endif  // pgorm_DB_MANAGER_H
