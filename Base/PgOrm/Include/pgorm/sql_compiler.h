#ifndef pgorm_SQL_COMPILER_H
#define pgorm_SQL_COMPILER_H

#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pgorm/builder_parts/sql_fragment.h"
#include "pgorm/error.h"
#include "pgorm/query.h"
#include "pgorm/schema_registry.h"

namespace pgorm {

    // 有序的 列 -> 值 列表
    using ChangeList = std::vector<std::pair<std::string, SqlValue>>;

    struct ConflictTarget {
        enum class Kind { Columns, Constraint };
        Kind kind = Kind::Columns;
        std::vector<std::string> columns;
        std::string constraint;

        static ConflictTarget onColumns(std::vector<std::string> cols) {
            ConflictTarget t;
            t.kind = Kind::Columns;
            t.columns = std::move(cols);
            return t;
        }
        static ConflictTarget onConstraint(std::string name) {
            ConflictTarget t;
            t.kind = Kind::Constraint;
            t.constraint = std::move(name);
            return t;
        }
    };

    struct UpsertOptions {
        ConflictTarget conflict;
        // nullopt: 更新所有既不是冲突列也不是主键的插入列. 显式空列表是 InvalidSchema
        std::optional<std::vector<std::string>> update_columns;
    };

    inline constexpr size_t DEFAULT_BATCH_SIZE = 1000;

    // 把 Query 或写请求编译成带 $n 占位符的 SQL. 只读访问 registry, 无副作用
    class SqlCompiler {
      public:
        explicit SqlCompiler(const SchemaRegistry *registry = nullptr);

        std::expected<CompiledStatement, Error> compileSelect(const Query &query) const;
        std::expected<CompiledStatement, Error> compileCount(const Query &query) const;

        std::expected<CompiledStatement, Error> compileInsert(const std::string &table, const ChangeList &changes) const;
        std::expected<std::vector<CompiledStatement>, Error> compileInsertAll(const std::string &table, const std::vector<ChangeList> &rows, size_t batch_size = DEFAULT_BATCH_SIZE) const;
        std::expected<CompiledStatement, Error> compileUpdate(const std::string &table, const std::string &pk_column, const SqlValue &pk_value, const ChangeList &changes) const;
        std::expected<CompiledStatement, Error> compileDelete(const std::string &table, const std::string &pk_column, const SqlValue &pk_value) const;
        std::expected<CompiledStatement, Error> compileUpsert(const std::string &table, const ChangeList &changes, const UpsertOptions &options) const;

        // table WHERE column IN (...), 键去重后按 batch_size 分批, 每批一条语句
        std::expected<std::vector<CompiledStatement>, Error> compileInLookup(const std::string &table, const std::string &column, const std::vector<SqlValue> &keys, size_t batch_size = DEFAULT_BATCH_SIZE) const;

        // 普通 SQL 标识符, allow_qualified 时允许 "table.column"
        static bool isPlainIdentifier(const std::string &name, bool allow_qualified);
        // 规范化运算符 (大写, 合并空白); 不支持的运算符返回 InvalidQuery
        static std::expected<std::string, Error> normalizeOperator(const std::string &op);

        const SchemaRegistry *registry() const {
            return registry_;
        }

      private:
        struct ResolvedJoin {
            std::string table;
            std::string left;   // 已限定的列
            std::string right;  // 已限定的列
            JoinType type = JoinType::Inner;
        };

        std::expected<CompiledStatement, Error> compileSelectImpl(const Query &query, bool count_only) const;
        std::expected<std::vector<ResolvedJoin>, Error> resolveJoins(const Query &query, const ModelMeta *meta) const;
        std::expected<SqlFragment, Error> compileCondition(const Condition &condition, const std::string &qualifier, const ModelMeta *meta) const;
        std::expected<SqlFragment, Error> compileConditionList(const std::vector<Condition> &conditions, const std::string &separator, const std::string &qualifier, const ModelMeta *meta) const;
        std::expected<SqlFragment, Error> compileWhere(const Query &query, const ModelMeta *meta, bool qualify) const;
        std::expected<std::string, Error> compileSelections(const Query &query, const ModelMeta *meta, bool qualify) const;
        std::expected<std::string, Error> resolveColumnName(const std::string &name, const std::string &qualifier, const ModelMeta *meta) const;

        const SchemaRegistry *registry_ = nullptr;
    };

}  // namespace pgorm

#endif  // pgorm_SQL_COMPILER_H
