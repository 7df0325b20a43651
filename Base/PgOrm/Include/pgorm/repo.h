#ifndef pgorm_REPO_H
#define pgorm_REPO_H

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "pgorm/changeset.h"
#include "pgorm/connection_provider.h"
#include "pgorm/error.h"
#include "pgorm/executor.h"
#include "pgorm/model_definition.h"
#include "pgorm/query.h"
#include "pgorm/row.h"
#include "pgorm/schema_registry.h"
#include "pgorm/sql_compiler.h"
#include "sqldriver/sql_connection_pool.h"
#include "sqldriver/sql_enums.h"

namespace pgorm {

    struct RepoOptions {
        size_t preload_batch_size = DEFAULT_BATCH_SIZE;
        size_t insert_batch_size = DEFAULT_BATCH_SIZE;
        size_t preload_concurrency = 4;
    };

    template <typename R>
    struct is_expected : std::false_type {};
    template <typename T, typename E>
    struct is_expected<std::expected<T, E>> : std::true_type {};

    // 用户侧的数据访问句柄. 从连接池构造时每个操作各自租用连接;
    // transaction() 传给回调的 Repo 绑定在事务连接上.
    // 句柄本身不持有可变状态, 复制后可在多个线程中使用
    class Repo {
      public:
        Repo(std::shared_ptr<pgorm_sqldriver::SqlConnectionPool> pool, std::shared_ptr<const SchemaRegistry> registry, RepoOptions options = {});
        Repo(std::shared_ptr<IConnectionProvider> provider, std::shared_ptr<const SchemaRegistry> registry, RepoOptions options = {});

        // --- 读 ---
        std::expected<std::vector<Row>, Error> all(const Query &query) const;
        std::expected<std::optional<Row>, Error> first(const Query &query) const;
        // 至多一行, 多于一行时 UnexpectedResultCount
        std::expected<std::optional<Row>, Error> get(const Query &query) const;
        std::expected<std::optional<Row>, Error> get(const std::string &table, const SqlValue &id) const;
        std::expected<Row, Error> getOrFail(const Query &query) const;
        std::expected<Row, Error> getOrFail(const std::string &table, const SqlValue &id) const;
        std::expected<long long, Error> count(const Query &query) const;

        // --- 写 ---
        std::expected<Row, Error> insert(const Changeset &changeset) const;
        // 多于一个批次时在事务中执行
        std::expected<std::vector<Row>, Error> insertAll(const std::vector<Changeset> &changesets) const;
        std::expected<Row, Error> update(const std::string &table, const SqlValue &id, const Changeset &changeset) const;
        std::expected<void, Error> remove(const std::string &table, const SqlValue &id) const;
        std::expected<Row, Error> upsert(const Changeset &changeset, const UpsertOptions &options) const;

        std::expected<long long, Error> executeRaw(const std::string &sql, const std::vector<SqlValue> &parameters = {}) const;
        std::expected<std::vector<Row>, Error> queryRaw(const std::string &sql, const std::vector<SqlValue> &parameters = {}) const;

        std::expected<std::vector<Row>, Error> preload(const std::string &table, std::vector<Row> rows, const std::vector<std::string> &names) const;

        // --- 类型映射 ---
        template <typename T>
        std::expected<std::vector<T>, Error> all(const ModelDefinition<T> &definition, const Query &query) const {
            auto rows = all(query);
            if (!rows) return std::unexpected(rows.error());
            std::vector<T> entities;
            entities.reserve(rows->size());
            for (const auto &row : *rows) {
                auto entity = definition.fromRow(row);
                if (!entity) return std::unexpected(entity.error());
                entities.push_back(std::move(*entity));
            }
            return entities;
        }

        template <typename T>
        std::expected<T, Error> getOrFail(const ModelDefinition<T> &definition, const SqlValue &id) const {
            auto row = getOrFail(definition.tableName(), id);
            if (!row) return std::unexpected(row.error());
            return definition.fromRow(*row);
        }

        template <typename T>
        std::expected<T, Error> insert(const ModelDefinition<T> &definition, const T &entity) const {
            auto row = insert(definition.toChangeset(entity));
            if (!row) return std::unexpected(row.error());
            return definition.fromRow(*row);
        }

        // --- 事务 ---
        bool inTransaction() const;

        // work(Repo&) 必须返回 std::expected<U, Error>. 成功 COMMIT, 返回错误或抛出异常时 ROLLBACK.
        // 已在事务中时直接在当前事务里执行 work
        template <typename Work>
        auto transaction(Work &&work, pgorm_sqldriver::TransactionIsolationLevel level = pgorm_sqldriver::TransactionIsolationLevel::Default) -> std::invoke_result_t<Work &, Repo &> {
            using Result = std::invoke_result_t<Work &, Repo &>;
            static_assert(is_expected<Result>::value, "transaction work must return std::expected<T, pgorm::Error>");

            if (inTransaction()) return work(*this);

            auto tx = beginTransaction(level);
            if (!tx) return Result(std::unexpect, tx.error());
            Repo tx_repo(*tx, registry_, options_);

            try {
                Result result = work(tx_repo);
                if (!result) {
                    rollbackTransaction(**tx);
                    return result;
                }
                Error commit_error = commitTransaction(**tx);
                if (commit_error) return Result(std::unexpect, commit_error);
                return result;
            } catch (...) {
                rollbackTransaction(**tx);
                throw;
            }
        }

        // 在 SAVEPOINT 中执行 work, 失败时只回滚到保存点. 不在事务中时先开启一个事务
        template <typename Work>
        auto savepoint(const std::string &name, Work &&work) -> std::invoke_result_t<Work &, Repo &> {
            using Result = std::invoke_result_t<Work &, Repo &>;
            static_assert(is_expected<Result>::value, "savepoint work must return std::expected<T, pgorm::Error>");

            if (!inTransaction()) {
                return transaction([&name, &work](Repo &tx_repo) -> Result { return tx_repo.savepoint(name, work); });
            }

            auto savepoint_name = makeSavepointName(name);
            if (!savepoint_name) return Result(std::unexpect, savepoint_name.error());
            Error begin_error = runControl("SAVEPOINT " + *savepoint_name);
            if (begin_error) return Result(std::unexpect, begin_error);

            try {
                Result result = work(*this);
                if (!result) {
                    rollbackToSavepoint(*savepoint_name);
                    return result;
                }
                Error release_error = runControl("RELEASE SAVEPOINT " + *savepoint_name);
                if (release_error) return Result(std::unexpect, release_error);
                return result;
            } catch (...) {
                rollbackToSavepoint(*savepoint_name);
                throw;
            }
        }

        const SchemaRegistry &registry() const {
            return *registry_;
        }
        const RepoOptions &options() const {
            return options_;
        }

      private:
        std::expected<std::shared_ptr<TransactionConnectionProvider>, Error> beginTransaction(pgorm_sqldriver::TransactionIsolationLevel level) const;
        Error commitTransaction(TransactionConnectionProvider &tx) const;
        void rollbackTransaction(TransactionConnectionProvider &tx) const;

        std::expected<std::string, Error> makeSavepointName(const std::string &name) const;
        void rollbackToSavepoint(const std::string &savepoint_name) const;
        Error runControl(const std::string &sql) const;

        std::expected<std::vector<Row>, Error> runQuery(const CompiledStatement &statement, const ModelMeta *decode_meta) const;
        std::expected<long long, Error> runExecute(const CompiledStatement &statement) const;
        std::expected<std::vector<Row>, Error> insertBatches(const std::vector<CompiledStatement> &statements, const ModelMeta *decode_meta) const;
        std::string primaryKeyColumn(const std::string &table) const;

        std::shared_ptr<IConnectionProvider> provider_;
        std::shared_ptr<TransactionConnectionProvider> tx_;
        std::shared_ptr<const SchemaRegistry> registry_;
        RepoOptions options_;
        SqlCompiler compiler_;
    };

}  // namespace pgorm

#endif  // pgorm_REPO_H
