#ifndef pgorm_ROW_H
#define pgorm_ROW_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sqldriver/sql_value.h"

namespace pgorm {

    using SqlValue = pgorm_sqldriver::SqlValue;

    struct RowAssociation;

    // 一行数据: 有序的 列名 -> 值 映射, 以及预加载挂上去的关联.
    // 构造后不可变, withMany/withOne 返回新的 Row
    class Row {
      public:
        using Column = std::pair<std::string, SqlValue>;

        Row() = default;
        explicit Row(std::vector<Column> columns);

        const std::vector<Column> &columns() const;
        std::vector<std::string> columnNames() const;
        size_t size() const;
        bool empty() const;

        bool contains(const std::string &column) const;
        const SqlValue *find(const std::string &column) const;
        // 不存在的列返回 NULL 值
        SqlValue value(const std::string &column) const;

        Row withMany(const std::string &name, std::vector<Row> rows) const;
        Row withOne(const std::string &name, std::optional<Row> row) const;

        bool hasAssociation(const std::string &name) const;
        const RowAssociation *association(const std::string &name) const;
        // hasMany 的结果; 未预加载时为 nullptr
        const std::vector<Row> *many(const std::string &name) const;
        // hasOne/belongsTo 的结果; 未预加载或无匹配时为 nullptr
        const Row *one(const std::string &name) const;
        std::vector<std::string> associationNames() const;

        bool operator==(const Row &other) const;
        bool operator!=(const Row &other) const {
            return !(*this == other);
        }

      private:
        std::vector<Column> columns_;
        std::map<std::string, std::shared_ptr<const RowAssociation>> associations_;
    };

    struct RowAssociation {
        bool is_collection = false;
        std::vector<Row> rows;  // 单值关联时最多一个元素
    };

}  // namespace pgorm

#endif  // pgorm_ROW_H
