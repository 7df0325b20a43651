// SqlDriver/Include/sqldriver/sql_connection_pool.h
#pragma once
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "sqldriver/sql_connection_parameters.h"
#include "sqldriver/sql_database.h"
#include "sqldriver/sql_error.h"

namespace pgorm_sqldriver {

    struct PoolConfig {
        std::string driver_type;
        ConnectionParameters parameters;
        size_t max_pool_size = 10;
        std::chrono::milliseconds acquire_timeout{5000};
        std::string connection_name_prefix = "pgorm_pool";
        spdlog::level::level_enum log_level = spdlog::level::info;
        std::shared_ptr<spdlog::logger> logger;

        std::shared_ptr<spdlog::logger> get_or_create_logger(const std::string& logger_name = "SqlConnectionPool");
    };

    class SqlConnectionPool : public std::enable_shared_from_this<SqlConnectionPool> {
      public:
        // 租约: 独占一条连接, 析构时归还给连接池
        class PooledConnection {
          public:
            PooledConnection() = default;
            ~PooledConnection();
            PooledConnection(PooledConnection&& other) noexcept;
            PooledConnection& operator=(PooledConnection&& other) noexcept;

            SqlDatabase& operator*() const;
            SqlDatabase* operator->() const;
            SqlDatabase* get() const;
            explicit operator bool() const;

            // 标记连接不可复用 (例如 ROLLBACK 失败), 归还时直接关闭
            void markBroken();
            void release();

          private:
            friend class SqlConnectionPool;
            PooledConnection(std::shared_ptr<SqlConnectionPool> pool, std::unique_ptr<SqlDatabase> db);
            PooledConnection(const PooledConnection&) = delete;
            PooledConnection& operator=(const PooledConnection&) = delete;

            std::shared_ptr<SqlConnectionPool> pool_;
            std::unique_ptr<SqlDatabase> db_;
            bool healthy_ = true;
        };

        static std::shared_ptr<SqlConnectionPool> create(PoolConfig config);
        ~SqlConnectionPool();

        // 在 acquire_timeout 内拿不到连接时返回 Resource 类错误 "pool exhausted"
        std::pair<SqlError, PooledConnection> acquire();
        void close();

        size_t idleCount() const;
        size_t totalCount() const;
        size_t maxPoolSize() const;
        bool isClosing() const;

      private:
        explicit SqlConnectionPool(PoolConfig config);

        std::pair<SqlError, std::unique_ptr<SqlDatabase>> openNewConnection();
        void releaseConnection(std::unique_ptr<SqlDatabase> db, bool mark_as_healthy);

        PoolConfig config_;
        std::deque<std::unique_ptr<SqlDatabase>> idle_connections_;
        size_t total_connections_created_ = 0;
        uint64_t next_connection_id_ = 0;
        mutable std::mutex pool_mutex_;
        std::condition_variable pool_condition_;
        std::atomic<bool> closing_{false};
    };

}  // namespace pgorm_sqldriver
