#ifndef pgorm_CHANGESET_H
#define pgorm_CHANGESET_H

#include <QRegularExpression>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pgorm/error.h"
#include "pgorm/model_meta.h"
#include "pgorm/row.h"
#include "pgorm/sql_compiler.h"

namespace pgorm {

    // 一次待写入的修改: 列 -> 值, 以及校验产生的 字段 -> 错误信息.
    // 有表结构时字段名可以用逻辑名或列名, 写入的值按字段类型转换
    class Changeset {
      public:
        explicit Changeset(std::string table);
        explicit Changeset(const ModelMeta &meta);

        // 按字段类型转换原始参数. permitted 为空时允许除主键外的所有字段
        static Changeset cast(const ModelMeta &meta, const std::map<std::string, SqlValue> &params, const std::vector<std::string> &permitted = {});

        Changeset &put(const std::string &field, const SqlValue &value);
        Changeset &addError(const std::string &field, const std::string &message);

        Changeset &validateRequired(const std::vector<std::string> &fields);
        Changeset &validateLength(const std::string &field, std::optional<int> min, std::optional<int> max);
        Changeset &validateFormat(const std::string &field, const QRegularExpression &pattern, const std::string &message = "has invalid format");
        Changeset &validateInclusion(const std::string &field, const std::vector<SqlValue> &allowed, const std::string &message = "is invalid");

        const std::string &targetTable() const {
            return table_;
        }
        const ModelMeta *meta() const {
            return meta_;
        }
        const std::map<std::string, SqlValue> &changes() const {
            return changes_;
        }
        const std::map<std::string, std::vector<std::string>> &errors() const {
            return errors_;
        }
        bool isValid() const {
            return errors_.empty();
        }
        bool hasChanges() const {
            return !changes_.empty();
        }
        std::optional<SqlValue> change(const std::string &field) const;

        // 有表结构时按字段声明顺序, 否则按列名排序
        ChangeList changeList() const;
        // InvalidChangeset, field_errors 为 errors()
        Error toError() const;

      private:
        std::string columnFor(const std::string &field) const;
        std::string fieldLabel(const std::string &field) const;

        std::string table_;
        const ModelMeta *meta_ = nullptr;
        std::map<std::string, SqlValue> changes_;
        std::map<std::string, std::vector<std::string>> errors_;
    };

}  // namespace pgorm

#endif  // pgorm_CHANGESET_H
