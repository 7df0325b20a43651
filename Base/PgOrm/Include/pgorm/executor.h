#ifndef pgorm_EXECUTOR_H
#define pgorm_EXECUTOR_H

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "pgorm/builder_parts/sql_fragment.h"
#include "pgorm/error.h"
#include "pgorm/model_meta.h"
#include "pgorm/row.h"
#include "sqldriver/sql_database.h"
#include "sqldriver/sql_record.h"

namespace pgorm {

    // 在一条连接上执行编译好的语句, 并把驱动返回的原始值解码成 Row.
    // 解码只在这里发生: 有表结构时按字段类型, 否则按后端类型名
    class Executor {
      public:
        explicit Executor(pgorm_sqldriver::SqlDatabase &db);

        std::expected<std::vector<Row>, Error> query(const CompiledStatement &statement, const ModelMeta *decode_meta = nullptr);
        std::expected<long long, Error> execute(const CompiledStatement &statement);
        std::expected<long long, Error> execute(const std::string &sql);

        static SqlValue decodeValue(const SqlValue &raw, std::optional<FieldType> declared_type);
        static Row decodeRecord(const pgorm_sqldriver::SqlRecord &record, const ModelMeta *meta);

        pgorm_sqldriver::SqlDatabase &database() {
            return db_;
        }

      private:
        Error databaseError(const std::string &sql) const;

        pgorm_sqldriver::SqlDatabase &db_;
    };

}  // namespace pgorm

#endif  // pgorm_EXECUTOR_H
