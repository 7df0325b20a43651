#include "pgorm/repo.h"

namespace pgorm {

    namespace {
        Error unexpectedCount(const std::string &what, const std::string &table, size_t n, const std::string &sql) {
            return Error(ErrorCode::UnexpectedResultCount, what + " on '" + table + "' returned " + std::to_string(n) + " rows, expected 1.", sql);
        }
    }  // namespace

    std::expected<Row, Error> Repo::insert(const Changeset &changeset) const {
        if (!changeset.isValid()) return std::unexpected(changeset.toError());
        auto statement = compiler_.compileInsert(changeset.targetTable(), changeset.changeList());
        if (!statement) return std::unexpected(statement.error());

        auto rows = runQuery(*statement, registry_->find(changeset.targetTable()));
        if (!rows) return std::unexpected(rows.error());
        if (rows->size() != 1) return std::unexpected(unexpectedCount("INSERT", changeset.targetTable(), rows->size(), statement->sql));
        return std::move(rows->front());
    }

    std::expected<std::vector<Row>, Error> Repo::insertBatches(const std::vector<CompiledStatement> &statements, const ModelMeta *decode_meta) const {
        auto lease = provider_->acquire();
        if (!lease) return std::unexpected(lease.error());
        Executor executor(lease->database());

        std::vector<Row> inserted;
        for (const auto &statement : statements) {
            auto rows = executor.query(statement, decode_meta);
            if (!rows) return std::unexpected(rows.error());
            inserted.insert(inserted.end(), std::make_move_iterator(rows->begin()), std::make_move_iterator(rows->end()));
        }
        return inserted;
    }

    std::expected<std::vector<Row>, Error> Repo::insertAll(const std::vector<Changeset> &changesets) const {
        if (changesets.empty()) return std::vector<Row>{};

        const std::string &table = changesets.front().targetTable();
        std::vector<ChangeList> rows;
        rows.reserve(changesets.size());
        for (const auto &changeset : changesets) {
            if (!changeset.isValid()) return std::unexpected(changeset.toError());
            if (changeset.targetTable() != table) {
                return std::unexpected(Error(ErrorCode::InvalidSchema, "insertAll changesets target different tables ('" + table + "' and '" + changeset.targetTable() + "')."));
            }
            rows.push_back(changeset.changeList());
        }

        auto statements = compiler_.compileInsertAll(table, rows, options_.insert_batch_size);
        if (!statements) return std::unexpected(statements.error());

        // 多个批次要么全部写入, 要么全部不写
        if (statements->size() > 1 && !inTransaction()) {
            const ModelMeta *meta = registry_->find(table);
            const auto &compiled = *statements;
            Repo self = *this;
            return self.transaction([&compiled, meta](Repo &tx_repo) { return tx_repo.insertBatches(compiled, meta); });
        }
        return insertBatches(*statements, registry_->find(table));
    }

    std::expected<Row, Error> Repo::update(const std::string &table, const SqlValue &id, const Changeset &changeset) const {
        if (!changeset.isValid()) return std::unexpected(changeset.toError());
        if (!changeset.hasChanges()) return getOrFail(table, id);

        const std::string pk = primaryKeyColumn(table);
        auto statement = compiler_.compileUpdate(table, pk, id, changeset.changeList());
        if (!statement) return std::unexpected(statement.error());

        auto rows = runQuery(*statement, registry_->find(table));
        if (!rows) return std::unexpected(rows.error());
        if (rows->empty()) {
            return std::unexpected(Error(ErrorCode::NotFound, "No row in '" + table + "' with " + pk + " = " + id.toDebugString() + " to update.", statement->sql));
        }
        if (rows->size() > 1) return std::unexpected(unexpectedCount("UPDATE", table, rows->size(), statement->sql));
        return std::move(rows->front());
    }

    std::expected<void, Error> Repo::remove(const std::string &table, const SqlValue &id) const {
        const std::string pk = primaryKeyColumn(table);
        auto statement = compiler_.compileDelete(table, pk, id);
        if (!statement) return std::unexpected(statement.error());

        auto affected = runExecute(*statement);
        if (!affected) return std::unexpected(affected.error());
        if (*affected == 0) {
            return std::unexpected(Error(ErrorCode::NotFound, "No row in '" + table + "' with " + pk + " = " + id.toDebugString() + " to delete.", statement->sql));
        }
        return {};
    }

    std::expected<Row, Error> Repo::upsert(const Changeset &changeset, const UpsertOptions &options) const {
        if (!changeset.isValid()) return std::unexpected(changeset.toError());
        auto statement = compiler_.compileUpsert(changeset.targetTable(), changeset.changeList(), options);
        if (!statement) return std::unexpected(statement.error());

        auto rows = runQuery(*statement, registry_->find(changeset.targetTable()));
        if (!rows) return std::unexpected(rows.error());
        if (rows->size() != 1) return std::unexpected(unexpectedCount("UPSERT", changeset.targetTable(), rows->size(), statement->sql));
        return std::move(rows->front());
    }

}  // namespace pgorm
