// pgorm/builder_parts/sql_compiler_conditions.cpp
#include <algorithm>
#include <cctype>
#include <set>

#include "pgorm/sql_compiler.h"

namespace pgorm {

    namespace {
        bool is_identifier_part(const std::string &part) {
            if (part.empty()) return false;
            const unsigned char first = static_cast<unsigned char>(part[0]);
            if (!(std::isalpha(first) || first == '_')) return false;
            return std::all_of(part.begin(), part.end(), [](char c) {
                const unsigned char uc = static_cast<unsigned char>(c);
                return std::isalnum(uc) || uc == '_';
            });
        }

        bool is_qualified(const std::string &name) {
            return name.find('.') != std::string::npos;
        }

        const std::set<std::string> &supported_operators() {
            static const std::set<std::string> ops = {"=", "!=", "<>", ">", ">=", "<", "<=", "LIKE", "ILIKE", "IN", "NOT IN", "BETWEEN", "IS NULL", "IS NOT NULL"};
            return ops;
        }
    }  // namespace

    SqlCompiler::SqlCompiler(const SchemaRegistry *registry) : registry_(registry) {
    }

    bool SqlCompiler::isPlainIdentifier(const std::string &name, bool allow_qualified) {
        const auto dot = name.find('.');
        if (dot == std::string::npos) return is_identifier_part(name);
        if (!allow_qualified) return false;
        return is_identifier_part(name.substr(0, dot)) && is_identifier_part(name.substr(dot + 1));
    }

    std::expected<std::string, Error> SqlCompiler::normalizeOperator(const std::string &op) {
        std::string normalized;
        bool pending_space = false;
        for (char c : op) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                pending_space = !normalized.empty();
                continue;
            }
            if (pending_space) {
                normalized += ' ';
                pending_space = false;
            }
            normalized += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (!supported_operators().count(normalized)) {
            return std::unexpected(Error(ErrorCode::InvalidQuery, "Unsupported operator '" + op + "'."));
        }
        return normalized;
    }

    std::expected<std::string, Error> SqlCompiler::resolveColumnName(const std::string &name, const std::string &qualifier, const ModelMeta *meta) const {
        std::string column = (meta && !is_qualified(name)) ? meta->resolveColumn(name) : name;
        if (!isPlainIdentifier(column, true)) {
            return std::unexpected(Error(ErrorCode::InvalidQuery, "'" + name + "' is not a valid column identifier."));
        }
        if (!qualifier.empty() && !is_qualified(column)) {
            column = qualifier + "." + column;
        }
        return column;
    }

    std::expected<SqlFragment, Error> SqlCompiler::compileCondition(const Condition &condition, const std::string &qualifier, const ModelMeta *meta) const {
        auto op = normalizeOperator(condition.op);
        if (!op) return std::unexpected(op.error());
        auto column = resolveColumnName(condition.field, qualifier, meta);
        if (!column) return std::unexpected(column.error());

        SqlFragment fragment;
        const std::string &o = *op;

        if (o == "IS NULL" || o == "IS NOT NULL") {
            fragment.appendText(*column + " " + o);
            return fragment;
        }

        if (o == "IN" || o == "NOT IN") {
            if (!condition.isList()) {
                return std::unexpected(Error(ErrorCode::InvalidQuery, o + " on '" + condition.field + "' requires a list of values."));
            }
            const auto &values = std::get<std::vector<SqlValue>>(condition.value);
            if (values.empty()) {
                // 空列表: IN 恒假, NOT IN 恒真
                fragment.appendText(o == "IN" ? "FALSE" : "TRUE");
                return fragment;
            }
            fragment.appendText(*column + " " + o + " (");
            for (size_t i = 0; i < values.size(); ++i) {
                if (i > 0) fragment.appendText(", ");
                fragment.appendParameter(values[i]);
            }
            fragment.appendText(")");
            return fragment;
        }

        if (o == "BETWEEN") {
            if (!condition.isList() || std::get<std::vector<SqlValue>>(condition.value).size() != 2) {
                return std::unexpected(Error(ErrorCode::InvalidQuery, "BETWEEN on '" + condition.field + "' requires exactly two values."));
            }
            const auto &values = std::get<std::vector<SqlValue>>(condition.value);
            fragment.appendText(*column + " BETWEEN ");
            fragment.appendParameter(values[0]);
            fragment.appendText(" AND ");
            fragment.appendParameter(values[1]);
            return fragment;
        }

        if (condition.isList()) {
            return std::unexpected(Error(ErrorCode::InvalidQuery, "Operator " + o + " on '" + condition.field + "' takes a single value."));
        }
        const SqlValue &value = std::get<SqlValue>(condition.value);
        if (value.isNull() && (o == "=" || o == "!=" || o == "<>")) {
            fragment.appendText(*column + (o == "=" ? " IS NULL" : " IS NOT NULL"));
            return fragment;
        }
        fragment.appendText(*column + " " + o + " ");
        fragment.appendParameter(value);
        return fragment;
    }

    std::expected<SqlFragment, Error> SqlCompiler::compileConditionList(const std::vector<Condition> &conditions, const std::string &separator, const std::string &qualifier, const ModelMeta *meta) const {
        std::vector<SqlFragment> parts;
        parts.reserve(conditions.size());
        for (const auto &c : conditions) {
            auto part = compileCondition(c, qualifier, meta);
            if (!part) return std::unexpected(part.error());
            parts.push_back(std::move(*part));
        }
        return SqlFragment::join(parts, separator);
    }

    std::expected<SqlFragment, Error> SqlCompiler::compileWhere(const Query &query, const ModelMeta *meta, bool qualify) const {
        const std::string main_qualifier = qualify ? query.table() : std::string();
        std::vector<SqlFragment> fragments;

        // 1. 主条件, 按声明顺序 AND
        auto primary = compileConditionList(query.conditions(), " AND ", main_qualifier, meta);
        if (!primary) return std::unexpected(primary.error());
        fragments.push_back(std::move(*primary));

        // 2. 条件组, 每组一个片段
        for (const auto &group : query.groups()) {
            const std::string separator = group.combinator == GroupCombinator::Any ? " OR " : " AND ";
            auto compiled = compileConditionList(group.conditions, separator, main_qualifier, meta);
            if (!compiled) return std::unexpected(compiled.error());
            if (compiled->empty()) continue;
            if (group.conditions.size() > 1) {
                SqlFragment wrapped("(");
                wrapped.append(*compiled).appendText(")");
                fragments.push_back(std::move(wrapped));
            } else {
                fragments.push_back(std::move(*compiled));
            }
        }

        // 3. 关联条件, 字段用关联表名限定
        for (const auto &rc : query.relationshipConditions()) {
            if (!meta) {
                return std::unexpected(Error(ErrorCode::InvalidRelationship, "Cannot resolve relationship '" + rc.association + "': table '" + query.table() + "' is not registered."));
            }
            const RelationshipInfo *rel = meta->findRelationship(rc.association);
            if (!rel) {
                return std::unexpected(Error(ErrorCode::InvalidRelationship, "Table '" + query.table() + "' has no relationship named '" + rc.association + "'."));
            }
            const ModelMeta *related_meta = registry_ ? registry_->find(rel->related_table) : nullptr;
            auto compiled = compileConditionList(rc.conditions, " AND ", rel->related_table, related_meta);
            if (!compiled) return std::unexpected(compiled.error());
            fragments.push_back(std::move(*compiled));
        }

        SqlFragment joined = SqlFragment::join(fragments, " AND ");
        if (joined.empty()) return joined;
        SqlFragment where(" WHERE ");
        where.append(joined);
        return where;
    }

}  // namespace pgorm
