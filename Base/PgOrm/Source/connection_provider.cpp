#include "pgorm/connection_provider.h"

#include <QDebug>
#include <utility>

namespace pgorm {

    ConnectionLease::ConnectionLease(pgorm_sqldriver::SqlConnectionPool::PooledConnection pooled) : pooled_(std::move(pooled)) {
    }

    ConnectionLease::ConnectionLease(pgorm_sqldriver::SqlDatabase *borrowed) : borrowed_(borrowed) {
    }

    pgorm_sqldriver::SqlDatabase &ConnectionLease::database() const {
        if (pooled_ && *pooled_) return **pooled_;
        return *borrowed_;
    }

    ConnectionLease::operator bool() const {
        return (pooled_ && static_cast<bool>(*pooled_)) || borrowed_ != nullptr;
    }

    bool ConnectionLease::ownsConnection() const {
        return pooled_.has_value() && static_cast<bool>(*pooled_);
    }

    void ConnectionLease::markBroken() {
        if (pooled_) pooled_->markBroken();
    }

    void ConnectionLease::release() {
        if (pooled_) {
            pooled_->release();
            pooled_.reset();
        }
        borrowed_ = nullptr;
    }

    Error connectionError(const pgorm_sqldriver::SqlError &err, const std::string &context) {
        ErrorCode code = ErrorCode::DatabaseError;
        if (err.category() == pgorm_sqldriver::ErrorCategory::Connectivity || err.category() == pgorm_sqldriver::ErrorCategory::DriverInternal) {
            code = ErrorCode::ConnectionFailed;
        }
        return Error(code, context + ": " + err.text(), "", err.nativeErrorCode());
    }

    // --- PoolConnectionProvider ---

    PoolConnectionProvider::PoolConnectionProvider(std::shared_ptr<pgorm_sqldriver::SqlConnectionPool> pool) : pool_(std::move(pool)) {
    }

    std::expected<ConnectionLease, Error> PoolConnectionProvider::acquire() {
        if (!pool_) {
            return std::unexpected(Error(ErrorCode::InvalidConfiguration, "Repository has no connection pool."));
        }
        auto [err, conn] = pool_->acquire();
        if (!conn) {
            // 超时属于资源耗尽, 按数据库错误上报
            if (err.category() == pgorm_sqldriver::ErrorCategory::Resource) {
                return std::unexpected(Error(ErrorCode::DatabaseError, err.text()));
            }
            return std::unexpected(connectionError(err, "Failed to acquire connection"));
        }
        return ConnectionLease(std::move(conn));
    }

    // --- TransactionConnectionProvider ---

    TransactionConnectionProvider::TransactionConnectionProvider(ConnectionLease lease) : lease_(std::move(lease)) {
    }

    TransactionConnectionProvider::~TransactionConnectionProvider() {
        if (!finished_.load()) {
            qWarning() << "pgorm: transaction connection released without COMMIT or ROLLBACK, discarding it.";
            finish(false);
        }
    }

    std::expected<ConnectionLease, Error> TransactionConnectionProvider::acquire() {
        if (finished_.load()) {
            return std::unexpected(Error(ErrorCode::DatabaseError, "Transaction has already finished; its repository handle is no longer usable."));
        }
        return ConnectionLease(&lease_.database());
    }

    pgorm_sqldriver::SqlDatabase &TransactionConnectionProvider::database() const {
        return lease_.database();
    }

    bool TransactionConnectionProvider::isFinished() const {
        return finished_.load();
    }

    void TransactionConnectionProvider::finish(bool healthy) {
        if (finished_.exchange(true)) return;
        if (!healthy) lease_.markBroken();
        lease_.release();
    }

}  // namespace pgorm
