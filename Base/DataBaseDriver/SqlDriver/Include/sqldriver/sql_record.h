// SqlDriver/Include/sqldriver/sql_record.h
#pragma once
#include <string>
#include <vector>

#include "sqldriver/sql_value.h"

namespace pgorm_sqldriver {

    // 驱动返回的一行原始数据, 列按结果集顺序排列
    class SqlRecord {
      public:
        SqlRecord() = default;

        void append(const std::string& name, SqlValue value);
        void clear();

        int count() const;
        bool isEmpty() const;
        bool contains(const std::string& name) const;
        int indexOf(const std::string& name) const;  // -1 表示不存在
        std::string fieldName(int index) const;
        SqlValue value(int index) const;
        SqlValue value(const std::string& name) const;

      private:
        std::vector<std::string> names_;
        std::vector<SqlValue> values_;
    };

}  // namespace pgorm_sqldriver
