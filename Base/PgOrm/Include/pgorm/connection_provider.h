#ifndef pgorm_CONNECTION_PROVIDER_H
#define pgorm_CONNECTION_PROVIDER_H

#include <atomic>
#include <expected>
#include <memory>
#include <optional>

#include "pgorm/error.h"
#include "sqldriver/sql_connection_pool.h"
#include "sqldriver/sql_database.h"

namespace pgorm {

    // 一次连接租用. 持有连接池租约时析构即归还; 借用事务连接时什么也不做
    class ConnectionLease {
      public:
        ConnectionLease() = default;
        explicit ConnectionLease(pgorm_sqldriver::SqlConnectionPool::PooledConnection pooled);
        explicit ConnectionLease(pgorm_sqldriver::SqlDatabase *borrowed);

        ConnectionLease(ConnectionLease &&) noexcept = default;
        ConnectionLease &operator=(ConnectionLease &&) noexcept = default;

        pgorm_sqldriver::SqlDatabase &database() const;
        explicit operator bool() const;
        bool ownsConnection() const;

        // 连接状态不可信 (例如 ROLLBACK 失败) 时调用, 归还时连接池会关闭它
        void markBroken();
        void release();

      private:
        std::optional<pgorm_sqldriver::SqlConnectionPool::PooledConnection> pooled_;
        pgorm_sqldriver::SqlDatabase *borrowed_ = nullptr;
    };

    class IConnectionProvider {
      public:
        virtual ~IConnectionProvider() = default;

        virtual std::expected<ConnectionLease, Error> acquire() = 0;
        // 能否同时发放多条互相独立的连接 (连接池可以, 事务不行)
        virtual bool supportsConcurrentLeases() const = 0;
        virtual bool isTransactionBound() const = 0;
    };

    class PoolConnectionProvider : public IConnectionProvider {
      public:
        explicit PoolConnectionProvider(std::shared_ptr<pgorm_sqldriver::SqlConnectionPool> pool);

        std::expected<ConnectionLease, Error> acquire() override;
        bool supportsConcurrentLeases() const override {
            return true;
        }
        bool isTransactionBound() const override {
            return false;
        }

        const std::shared_ptr<pgorm_sqldriver::SqlConnectionPool> &pool() const {
            return pool_;
        }

      private:
        std::shared_ptr<pgorm_sqldriver::SqlConnectionPool> pool_;
    };

    // 事务期间独占一条连接, 所有语句都在这条连接上顺序执行
    class TransactionConnectionProvider : public IConnectionProvider {
      public:
        explicit TransactionConnectionProvider(ConnectionLease lease);
        ~TransactionConnectionProvider() override;

        std::expected<ConnectionLease, Error> acquire() override;
        bool supportsConcurrentLeases() const override {
            return false;
        }
        bool isTransactionBound() const override {
            return true;
        }

        pgorm_sqldriver::SqlDatabase &database() const;
        bool isFinished() const;
        // 事务结束后归还连接; healthy 为 false 时连接被关闭而不是放回池中
        void finish(bool healthy);

      private:
        ConnectionLease lease_;
        std::atomic<bool> finished_{false};
    };

    Error connectionError(const pgorm_sqldriver::SqlError &err, const std::string &context);

}  // namespace pgorm

#endif  // pgorm_CONNECTION_PROVIDER_H
