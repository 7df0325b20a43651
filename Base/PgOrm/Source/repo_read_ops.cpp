#include "pgorm/preloader.h"
#include "pgorm/repo.h"

namespace pgorm {

    namespace {
        std::shared_ptr<const SchemaRegistry> registryOrEmpty(std::shared_ptr<const SchemaRegistry> registry) {
            if (registry) return registry;
            return std::make_shared<const SchemaRegistry>();
        }
    }  // namespace

    Repo::Repo(std::shared_ptr<pgorm_sqldriver::SqlConnectionPool> pool, std::shared_ptr<const SchemaRegistry> registry, RepoOptions options)
        : Repo(std::make_shared<PoolConnectionProvider>(std::move(pool)), std::move(registry), options) {
    }

    Repo::Repo(std::shared_ptr<IConnectionProvider> provider, std::shared_ptr<const SchemaRegistry> registry, RepoOptions options)
        : provider_(std::move(provider)), tx_(std::dynamic_pointer_cast<TransactionConnectionProvider>(provider_)), registry_(registryOrEmpty(std::move(registry))), options_(options), compiler_(registry_.get()) {
    }

    std::expected<std::vector<Row>, Error> Repo::runQuery(const CompiledStatement &statement, const ModelMeta *decode_meta) const {
        auto lease = provider_->acquire();
        if (!lease) return std::unexpected(lease.error());
        Executor executor(lease->database());
        return executor.query(statement, decode_meta);
    }

    std::expected<long long, Error> Repo::runExecute(const CompiledStatement &statement) const {
        auto lease = provider_->acquire();
        if (!lease) return std::unexpected(lease.error());
        Executor executor(lease->database());
        return executor.execute(statement);
    }

    std::string Repo::primaryKeyColumn(const std::string &table) const {
        const ModelMeta *meta = registry_->find(table);
        if (meta && !meta->primary_key_db_name.empty()) return meta->primary_key_db_name;
        return "id";
    }

    std::expected<std::vector<Row>, Error> Repo::all(const Query &query) const {
        auto statement = compiler_.compileSelect(query);
        if (!statement) return std::unexpected(statement.error());

        // runQuery 返回时连接已归还, 预加载再按需租用
        auto rows = runQuery(*statement, registry_->find(query.table()));
        if (!rows) return std::unexpected(rows.error());
        if (query.preloads().empty() || rows->empty()) return rows;
        return preload(query.table(), std::move(*rows), query.preloads());
    }

    std::expected<std::optional<Row>, Error> Repo::first(const Query &query) const {
        Query limited = query.limit(1);
        if (query.orderClauses().empty()) {
            const ModelMeta *meta = registry_->find(query.table());
            if (meta && !meta->primary_key_db_name.empty()) limited = limited.orderBy(meta->primary_key_db_name);
        }
        auto rows = all(limited);
        if (!rows) return std::unexpected(rows.error());
        if (rows->empty()) return std::optional<Row>();
        return std::optional<Row>(std::move(rows->front()));
    }

    std::expected<std::optional<Row>, Error> Repo::get(const Query &query) const {
        // 取两行即可判断是否唯一
        auto rows = all(query.limitValue() ? query : query.limit(2));
        if (!rows) return std::unexpected(rows.error());
        if (rows->empty()) return std::optional<Row>();
        if (rows->size() > 1) {
            return std::unexpected(Error(ErrorCode::UnexpectedResultCount, "Expected at most one row from '" + query.table() + "', got " + std::to_string(rows->size()) + "."));
        }
        return std::optional<Row>(std::move(rows->front()));
    }

    std::expected<std::optional<Row>, Error> Repo::get(const std::string &table, const SqlValue &id) const {
        return get(Query::from(table).where(Field(primaryKeyColumn(table)).eq(id)));
    }

    std::expected<Row, Error> Repo::getOrFail(const Query &query) const {
        auto row = get(query);
        if (!row) return std::unexpected(row.error());
        if (!*row) return std::unexpected(Error(ErrorCode::NotFound, "No row found in '" + query.table() + "'."));
        return std::move(**row);
    }

    std::expected<Row, Error> Repo::getOrFail(const std::string &table, const SqlValue &id) const {
        auto row = get(table, id);
        if (!row) return std::unexpected(row.error());
        if (!*row) return std::unexpected(Error(ErrorCode::NotFound, "No row in '" + table + "' with " + primaryKeyColumn(table) + " = " + id.toDebugString() + "."));
        return std::move(**row);
    }

    std::expected<long long, Error> Repo::count(const Query &query) const {
        auto statement = compiler_.compileCount(query);
        if (!statement) return std::unexpected(statement.error());
        auto rows = runQuery(*statement, nullptr);
        if (!rows) return std::unexpected(rows.error());
        if (rows->empty() || rows->front().empty()) {
            return std::unexpected(Error(ErrorCode::UnexpectedResultCount, "COUNT query returned no value.", statement->sql));
        }
        bool ok = false;
        long long n = rows->front().columns().front().second.toInt64(&ok);
        if (!ok) return std::unexpected(Error(ErrorCode::InternalError, "COUNT query returned a non-integer value.", statement->sql));
        return n;
    }

    std::expected<std::vector<Row>, Error> Repo::queryRaw(const std::string &sql, const std::vector<SqlValue> &parameters) const {
        return runQuery(CompiledStatement{sql, parameters}, nullptr);
    }

    std::expected<long long, Error> Repo::executeRaw(const std::string &sql, const std::vector<SqlValue> &parameters) const {
        return runExecute(CompiledStatement{sql, parameters});
    }

    std::expected<std::vector<Row>, Error> Repo::preload(const std::string &table, std::vector<Row> rows, const std::vector<std::string> &names) const {
        PreloadOptions preload_options;
        preload_options.batch_size = options_.preload_batch_size;
        preload_options.max_concurrency = options_.preload_concurrency;
        RelationshipPreloader preloader(*provider_, *registry_, preload_options);
        return preloader.preload(table, std::move(rows), names);
    }

}  // namespace pgorm
