#include <QDebug>
#include <QUuid>

#include "pgorm/repo.h"

namespace pgorm {

    bool Repo::inTransaction() const {
        return tx_ && !tx_->isFinished();
    }

    std::expected<std::shared_ptr<TransactionConnectionProvider>, Error> Repo::beginTransaction(pgorm_sqldriver::TransactionIsolationLevel level) const {
        auto lease = provider_->acquire();
        if (!lease) return std::unexpected(lease.error());

        std::string begin_sql = "BEGIN";
        if (auto isolation = pgorm_sqldriver::isolationLevelSql(level)) begin_sql += " ISOLATION LEVEL " + *isolation;

        Executor executor(lease->database());
        auto begun = executor.execute(begin_sql);
        if (!begun) {
            // BEGIN 失败时连接状态未知
            lease->markBroken();
            return std::unexpected(begun.error());
        }
        return std::make_shared<TransactionConnectionProvider>(std::move(*lease));
    }

    Error Repo::commitTransaction(TransactionConnectionProvider &tx) const {
        Executor executor(tx.database());
        auto committed = executor.execute("COMMIT");
        if (committed) {
            tx.finish(true);
            return make_ok();
        }

        Error err = committed.error();
        auto rolled_back = executor.execute("ROLLBACK");
        if (!rolled_back) {
            qWarning().noquote() << "pgorm: ROLLBACK after failed COMMIT also failed:" << QString::fromStdString(rolled_back.error().toString());
        }
        tx.finish(false);
        err.code = ErrorCode::DatabaseError;
        err.message = "COMMIT failed: " + err.message;
        return err;
    }

    void Repo::rollbackTransaction(TransactionConnectionProvider &tx) const {
        if (tx.isFinished()) return;
        Executor executor(tx.database());
        auto rolled_back = executor.execute("ROLLBACK");
        if (!rolled_back) {
            // 不覆盖原始错误, 只记录; 连接不再放回池中
            qWarning().noquote() << "pgorm: ROLLBACK failed:" << QString::fromStdString(rolled_back.error().toString());
            tx.finish(false);
            return;
        }
        tx.finish(true);
    }

    std::expected<std::string, Error> Repo::makeSavepointName(const std::string &name) const {
        if (!SqlCompiler::isPlainIdentifier(name, false)) {
            return std::unexpected(Error(ErrorCode::InvalidQuery, "Invalid savepoint name '" + name + "'."));
        }
        const std::string suffix = QUuid::createUuid().toString(QUuid::Id128).left(8).toStdString();
        return "sp_" + name + "_" + suffix;
    }

    Error Repo::runControl(const std::string &sql) const {
        auto lease = provider_->acquire();
        if (!lease) return lease.error();
        Executor executor(lease->database());
        auto done = executor.execute(sql);
        if (!done) return done.error();
        return make_ok();
    }

    void Repo::rollbackToSavepoint(const std::string &savepoint_name) const {
        Error rollback_error = runControl("ROLLBACK TO SAVEPOINT " + savepoint_name);
        if (rollback_error) {
            qWarning().noquote() << "pgorm: ROLLBACK TO SAVEPOINT" << QString::fromStdString(savepoint_name) << "failed:" << QString::fromStdString(rollback_error.toString());
        }
        Error release_error = runControl("RELEASE SAVEPOINT " + savepoint_name);
        if (release_error) {
            qWarning().noquote() << "pgorm: RELEASE SAVEPOINT" << QString::fromStdString(savepoint_name) << "failed:" << QString::fromStdString(release_error.toString());
        }
    }

}  // namespace pgorm
