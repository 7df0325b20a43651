// pgorm/builder_parts/sql_compiler_write.cpp
#include <algorithm>
#include <set>

#include "pgorm/sql_compiler.h"

namespace pgorm {

    namespace {
        Error invalid_identifier(const std::string &what, const std::string &name) {
            return Error(ErrorCode::InvalidQuery, "'" + name + "' is not a valid " + what + " identifier.");
        }

        std::string column_list(const ChangeList &changes) {
            std::string out;
            for (size_t i = 0; i < changes.size(); ++i) {
                if (i > 0) out += ", ";
                out += changes[i].first;
            }
            return out;
        }

        void append_values_tuple(SqlFragment &fragment, const ChangeList &changes) {
            fragment.appendText("(");
            for (size_t i = 0; i < changes.size(); ++i) {
                if (i > 0) fragment.appendText(", ");
                fragment.appendParameter(changes[i].second);
            }
            fragment.appendText(")");
        }
    }  // namespace

    std::expected<CompiledStatement, Error> SqlCompiler::compileInsert(const std::string &table, const ChangeList &changes) const {
        if (!isPlainIdentifier(table, true)) return std::unexpected(invalid_identifier("table", table));
        for (const auto &[column, value] : changes) {
            if (!isPlainIdentifier(column, false)) return std::unexpected(invalid_identifier("column", column));
        }

        SqlFragment statement("INSERT INTO " + table);
        if (changes.empty()) {
            statement.appendText(" DEFAULT VALUES RETURNING *");
            return statement.render();
        }
        statement.appendText(" (" + column_list(changes) + ") VALUES ");
        append_values_tuple(statement, changes);
        statement.appendText(" RETURNING *");
        return statement.render();
    }

    std::expected<std::vector<CompiledStatement>, Error> SqlCompiler::compileInsertAll(const std::string &table, const std::vector<ChangeList> &rows, size_t batch_size) const {
        std::vector<CompiledStatement> statements;
        if (rows.empty()) return statements;
        if (!isPlainIdentifier(table, true)) return std::unexpected(invalid_identifier("table", table));
        if (batch_size == 0) batch_size = DEFAULT_BATCH_SIZE;

        const ChangeList &first = rows.front();
        if (first.empty()) {
            return std::unexpected(Error(ErrorCode::InvalidSchema, "Batch insert into '" + table + "' has no columns."));
        }
        std::vector<std::string> columns;
        for (const auto &[column, value] : first) {
            if (!isPlainIdentifier(column, false)) return std::unexpected(invalid_identifier("column", column));
            columns.push_back(column);
        }
        const std::set<std::string> column_set(columns.begin(), columns.end());

        // 每行按第一行的列顺序重排
        std::vector<ChangeList> ordered_rows;
        ordered_rows.reserve(rows.size());
        for (size_t r = 0; r < rows.size(); ++r) {
            const ChangeList &row = rows[r];
            std::set<std::string> row_set;
            for (const auto &[column, value] : row) row_set.insert(column);
            if (row_set != column_set || row.size() != columns.size()) {
                return std::unexpected(Error(ErrorCode::InvalidSchema, "Batch insert into '" + table + "': row " + std::to_string(r) + " does not have the same columns as the first row."));
            }
            ChangeList ordered;
            ordered.reserve(columns.size());
            for (const auto &column : columns) {
                auto it = std::find_if(row.begin(), row.end(), [&column](const auto &change) {
                    return change.first == column;
                });
                ordered.push_back(*it);
            }
            ordered_rows.push_back(std::move(ordered));
        }

        for (size_t start = 0; start < ordered_rows.size(); start += batch_size) {
            const size_t end = std::min(ordered_rows.size(), start + batch_size);
            SqlFragment statement("INSERT INTO " + table + " (" + column_list(ordered_rows.front()) + ") VALUES ");
            for (size_t r = start; r < end; ++r) {
                if (r > start) statement.appendText(", ");
                append_values_tuple(statement, ordered_rows[r]);
            }
            statement.appendText(" RETURNING *");
            statements.push_back(statement.render());
        }
        return statements;
    }

    std::expected<CompiledStatement, Error> SqlCompiler::compileUpdate(const std::string &table, const std::string &pk_column, const SqlValue &pk_value, const ChangeList &changes) const {
        if (!isPlainIdentifier(table, true)) return std::unexpected(invalid_identifier("table", table));
        if (!isPlainIdentifier(pk_column, false)) return std::unexpected(invalid_identifier("column", pk_column));
        if (changes.empty()) {
            return std::unexpected(Error(ErrorCode::InvalidQuery, "UPDATE of '" + table + "' has no columns to set."));
        }

        SqlFragment statement("UPDATE " + table + " SET ");
        for (size_t i = 0; i < changes.size(); ++i) {
            if (!isPlainIdentifier(changes[i].first, false)) return std::unexpected(invalid_identifier("column", changes[i].first));
            if (i > 0) statement.appendText(", ");
            statement.appendText(changes[i].first + " = ");
            statement.appendParameter(changes[i].second);
        }
        statement.appendText(" WHERE " + pk_column + " = ");
        statement.appendParameter(pk_value);
        statement.appendText(" RETURNING *");
        return statement.render();
    }

    std::expected<CompiledStatement, Error> SqlCompiler::compileDelete(const std::string &table, const std::string &pk_column, const SqlValue &pk_value) const {
        if (!isPlainIdentifier(table, true)) return std::unexpected(invalid_identifier("table", table));
        if (!isPlainIdentifier(pk_column, false)) return std::unexpected(invalid_identifier("column", pk_column));

        SqlFragment statement("DELETE FROM " + table + " WHERE " + pk_column + " = ");
        statement.appendParameter(pk_value);
        return statement.render();
    }

    std::expected<CompiledStatement, Error> SqlCompiler::compileUpsert(const std::string &table, const ChangeList &changes, const UpsertOptions &options) const {
        if (!isPlainIdentifier(table, true)) return std::unexpected(invalid_identifier("table", table));
        if (changes.empty()) {
            return std::unexpected(Error(ErrorCode::InvalidSchema, "Upsert into '" + table + "' has no columns."));
        }
        std::set<std::string> inserted;
        for (const auto &[column, value] : changes) {
            if (!isPlainIdentifier(column, false)) return std::unexpected(invalid_identifier("column", column));
            inserted.insert(column);
        }

        std::string conflict_clause;
        if (options.conflict.kind == ConflictTarget::Kind::Constraint) {
            if (!isPlainIdentifier(options.conflict.constraint, false)) return std::unexpected(invalid_identifier("constraint", options.conflict.constraint));
            conflict_clause = " ON CONFLICT ON CONSTRAINT " + options.conflict.constraint;
        } else {
            if (options.conflict.columns.empty()) {
                return std::unexpected(Error(ErrorCode::InvalidSchema, "Upsert into '" + table + "' needs at least one conflict column."));
            }
            conflict_clause = " ON CONFLICT (";
            for (size_t i = 0; i < options.conflict.columns.size(); ++i) {
                const std::string &column = options.conflict.columns[i];
                if (!isPlainIdentifier(column, false)) return std::unexpected(invalid_identifier("column", column));
                if (i > 0) conflict_clause += ", ";
                conflict_clause += column;
            }
            conflict_clause += ")";
        }

        const ModelMeta *meta = registry_ ? registry_->find(table) : nullptr;
        const std::string pk = meta ? meta->primary_key_db_name : std::string();

        std::vector<std::string> update_columns;
        if (options.update_columns) {
            if (options.update_columns->empty()) {
                return std::unexpected(Error(ErrorCode::InvalidSchema, "Upsert into '" + table + "' has an empty update list."));
            }
            for (const auto &column : *options.update_columns) {
                const std::string resolved = meta ? meta->resolveColumn(column) : column;
                if (!isPlainIdentifier(resolved, false)) return std::unexpected(invalid_identifier("column", column));
                if (!inserted.count(resolved)) {
                    return std::unexpected(Error(ErrorCode::InvalidSchema, "Upsert into '" + table + "' updates '" + resolved + "', which is not an inserted column."));
                }
                update_columns.push_back(resolved);
            }
        } else {
            const auto &conflict_cols = options.conflict.columns;
            for (const auto &[column, value] : changes) {
                if (column == pk) continue;
                if (std::find(conflict_cols.begin(), conflict_cols.end(), column) != conflict_cols.end()) continue;
                update_columns.push_back(column);
            }
            if (update_columns.empty()) {
                // 仍需 DO UPDATE 才能让 RETURNING 在冲突时返回已有行
                if (options.conflict.kind == ConflictTarget::Kind::Constraint) {
                    return std::unexpected(Error(ErrorCode::InvalidSchema, "Upsert into '" + table + "' has no column left to update."));
                }
                update_columns.push_back(options.conflict.columns.front());
            }
        }

        SqlFragment statement("INSERT INTO " + table + " (" + column_list(changes) + ") VALUES ");
        append_values_tuple(statement, changes);
        statement.appendText(conflict_clause + " DO UPDATE SET ");
        for (size_t i = 0; i < update_columns.size(); ++i) {
            if (i > 0) statement.appendText(", ");
            statement.appendText(update_columns[i] + " = EXCLUDED." + update_columns[i]);
        }
        statement.appendText(" RETURNING *");
        return statement.render();
    }

}  // namespace pgorm
