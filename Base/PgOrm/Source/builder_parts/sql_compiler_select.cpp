// pgorm/builder_parts/sql_compiler_select.cpp
#include <algorithm>
#include <set>
#include <sstream>

#include "pgorm/sql_compiler.h"
#include "pgorm/value_codec.h"

namespace pgorm {

    namespace {
        std::string unqualified(const std::string &column) {
            const auto dot = column.find('.');
            return dot == std::string::npos ? column : column.substr(dot + 1);
        }
    }  // namespace

    std::expected<std::vector<SqlCompiler::ResolvedJoin>, Error> SqlCompiler::resolveJoins(const Query &query, const ModelMeta *meta) const {
        std::vector<ResolvedJoin> resolved;
        const std::string &table = query.table();

        auto resolve_association = [&](const std::string &association, JoinType type) -> std::expected<ResolvedJoin, Error> {
            if (!meta) {
                return std::unexpected(Error(ErrorCode::InvalidRelationship, "Cannot join '" + association + "': table '" + table + "' is not registered."));
            }
            const RelationshipInfo *rel = meta->findRelationship(association);
            if (!rel) {
                return std::unexpected(Error(ErrorCode::InvalidRelationship, "Table '" + table + "' has no relationship named '" + association + "'."));
            }
            if (rel->type == AssociationType::ManyToMany) {
                return std::unexpected(Error(ErrorCode::NotImplemented, "Joining manyToMany relationship '" + association + "' is not implemented."));
            }
            if (!isPlainIdentifier(rel->related_table, false) || !isPlainIdentifier(rel->local_key, false) || !isPlainIdentifier(rel->foreign_key, false)) {
                return std::unexpected(Error(ErrorCode::InvalidQuery, "Relationship '" + association + "' uses an invalid identifier."));
            }
            ResolvedJoin join;
            join.table = rel->related_table;
            join.left = table + "." + rel->local_key;
            join.right = rel->related_table + "." + rel->foreign_key;
            join.type = type;
            return join;
        };

        for (const auto &clause : query.joins()) {
            if (!clause.association.empty()) {
                auto join = resolve_association(clause.association, clause.type);
                if (!join) return std::unexpected(join.error());
                resolved.push_back(std::move(*join));
                continue;
            }
            if (!isPlainIdentifier(clause.table, true)) {
                return std::unexpected(Error(ErrorCode::InvalidQuery, "'" + clause.table + "' is not a valid table identifier."));
            }
            auto left = resolveColumnName(clause.on.left_column, table, meta);
            if (!left) return std::unexpected(left.error());
            const ModelMeta *joined_meta = registry_ ? registry_->find(clause.table) : nullptr;
            auto right = resolveColumnName(clause.on.right_column, clause.table, joined_meta);
            if (!right) return std::unexpected(right.error());
            resolved.push_back(ResolvedJoin{clause.table, *left, *right, clause.type});
        }

        // 关联条件引用的关联若未连接, 自动 INNER JOIN
        for (const auto &rc : query.relationshipConditions()) {
            if (query.joinsAssociation(rc.association)) continue;
            auto join = resolve_association(rc.association, JoinType::Inner);
            if (!join) return std::unexpected(join.error());
            bool duplicate = false;
            for (const auto &existing : resolved) {
                if (existing.table == join->table && existing.left == join->left && existing.right == join->right) {
                    duplicate = true;
                    break;
                }
            }
            if (!duplicate) resolved.push_back(std::move(*join));
        }
        return resolved;
    }

    std::expected<std::string, Error> SqlCompiler::compileSelections(const Query &query, const ModelMeta *meta, bool qualify) const {
        const auto &selections = query.selections();
        const std::string &table = query.table();

        if (selections.size() == 1 && selections.front() == "*") {
            if (!qualify) return std::string("*");
            if (!meta || meta->fields.empty()) return table + ".*";
            std::ostringstream cols;
            bool first = true;
            for (const auto &f : meta->fields) {
                if (!first) cols << ", ";
                cols << table << "." << f.db_name;
                first = false;
            }
            return cols.str();
        }

        const std::string qualifier = qualify ? table : std::string();
        std::vector<std::string> columns;
        for (const auto &sel : selections) {
            if (sel == "*") {
                return std::unexpected(Error(ErrorCode::InvalidQuery, "'*' cannot be combined with explicit selections."));
            }
            auto column = resolveColumnName(sel, qualifier, meta);
            if (!column) return std::unexpected(column.error());
            columns.push_back(std::move(*column));
        }

        // 显式选择总是带上主键列
        const std::string pk = meta ? meta->primary_key_db_name : std::string("id");
        if (!pk.empty()) {
            bool has_pk = false;
            for (const auto &c : columns) {
                const bool same_table = c.find('.') == std::string::npos || c.rfind(table + ".", 0) == 0;
                if (same_table && unqualified(c) == pk) {
                    has_pk = true;
                    break;
                }
            }
            if (!has_pk) columns.insert(columns.begin(), qualify ? table + "." + pk : pk);
        }

        std::ostringstream out;
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << ", ";
            out << columns[i];
        }
        return out.str();
    }

    std::expected<CompiledStatement, Error> SqlCompiler::compileSelectImpl(const Query &query, bool count_only) const {
        const std::string &table = query.table();
        if (!isPlainIdentifier(table, true)) {
            return std::unexpected(Error(ErrorCode::InvalidQuery, "'" + table + "' is not a valid table identifier."));
        }
        if (query.limitValue() && *query.limitValue() < 0) {
            return std::unexpected(Error(ErrorCode::InvalidQuery, "LIMIT must not be negative."));
        }
        if (query.offsetValue() && *query.offsetValue() < 0) {
            return std::unexpected(Error(ErrorCode::InvalidQuery, "OFFSET must not be negative."));
        }

        const ModelMeta *meta = registry_ ? registry_->find(table) : nullptr;

        auto joins = resolveJoins(query, meta);
        if (!joins) return std::unexpected(joins.error());
        const bool qualify = !joins->empty();

        SqlFragment statement;
        if (count_only) {
            statement.appendText("SELECT COUNT(*) FROM " + table);
        } else {
            auto columns = compileSelections(query, meta, qualify);
            if (!columns) return std::unexpected(columns.error());
            statement.appendText("SELECT " + *columns + " FROM " + table);
        }

        for (const auto &join : *joins) {
            statement.appendText(std::string(" ") + joinTypeSql(join.type) + " " + join.table + " ON " + join.left + " = " + join.right);
        }

        auto where = compileWhere(query, meta, qualify);
        if (!where) return std::unexpected(where.error());
        statement.append(*where);

        if (!count_only) {
            if (!query.orderClauses().empty()) {
                statement.appendText(" ORDER BY ");
                bool first = true;
                for (const auto &order : query.orderClauses()) {
                    auto column = resolveColumnName(order.field, qualify ? table : std::string(), meta);
                    if (!column) return std::unexpected(column.error());
                    if (!first) statement.appendText(", ");
                    statement.appendText(*column + (order.direction == OrderDirection::Desc ? " DESC" : " ASC"));
                    first = false;
                }
            }
            if (query.limitValue()) statement.appendText(" LIMIT " + std::to_string(*query.limitValue()));
            if (query.offsetValue()) statement.appendText(" OFFSET " + std::to_string(*query.offsetValue()));
        }

        return statement.render();
    }

    std::expected<CompiledStatement, Error> SqlCompiler::compileSelect(const Query &query) const {
        return compileSelectImpl(query, false);
    }

    std::expected<CompiledStatement, Error> SqlCompiler::compileCount(const Query &query) const {
        return compileSelectImpl(query, true);
    }

    std::expected<std::vector<CompiledStatement>, Error> SqlCompiler::compileInLookup(const std::string &table, const std::string &column, const std::vector<SqlValue> &keys, size_t batch_size) const {
        if (batch_size == 0) batch_size = DEFAULT_BATCH_SIZE;

        std::vector<SqlValue> distinct;
        std::set<std::string> seen;
        for (const auto &key : keys) {
            auto map_key = sql_value_to_map_key(key);
            if (!map_key) continue;  // NULL 永远匹配不到
            if (seen.insert(*map_key).second) distinct.push_back(key);
        }

        std::vector<CompiledStatement> statements;
        for (size_t start = 0; start < distinct.size(); start += batch_size) {
            const size_t end = std::min(distinct.size(), start + batch_size);
            std::vector<SqlValue> chunk(distinct.begin() + static_cast<std::ptrdiff_t>(start), distinct.begin() + static_cast<std::ptrdiff_t>(end));
            auto stmt = compileSelect(Query::from(table).where(Field(column).in(std::move(chunk))));
            if (!stmt) return std::unexpected(stmt.error());
            statements.push_back(std::move(*stmt));
        }
        return statements;
    }

}  // namespace pgorm
