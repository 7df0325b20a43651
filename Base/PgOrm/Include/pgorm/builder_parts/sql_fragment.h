#ifndef pgorm_SQL_FRAGMENT_H
#define pgorm_SQL_FRAGMENT_H

#include <string>
#include <vector>

#include "sqldriver/sql_value.h"

namespace pgorm {

    using SqlValue = pgorm_sqldriver::SqlValue;

    // 编译结果: SQL 文本 + 按 $1..$k 顺序排列的参数
    struct CompiledStatement {
        std::string sql;
        std::vector<SqlValue> parameters;
    };

    // SQL 片段: 文本与参数槽交替排列. 片段可以任意拼接,
    // 只有 render() 时才按出现顺序给参数槽编号, 所以编号总是连续递增的
    class SqlFragment {
      public:
        SqlFragment() = default;
        explicit SqlFragment(std::string text);

        SqlFragment &appendText(const std::string &text);
        SqlFragment &appendParameter(SqlValue value);
        SqlFragment &append(const SqlFragment &other);

        bool empty() const;
        size_t parameterCount() const;

        CompiledStatement render() const;

        static SqlFragment join(const std::vector<SqlFragment> &parts, const std::string &separator);

      private:
        struct Piece {
            std::string text;
            bool is_parameter = false;
            size_t parameter_index = 0;  // parameters_ 中的下标
        };
        std::vector<Piece> pieces_;
        std::vector<SqlValue> parameters_;
    };

}  // namespace pgorm

#endif  // pgorm_SQL_FRAGMENT_H
