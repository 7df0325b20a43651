#ifndef pgorm_MODEL_DEFINITION_H
#define pgorm_MODEL_DEFINITION_H

#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <QUuid>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "pgorm/changeset.h"
#include "pgorm/error.h"
#include "pgorm/model_meta.h"
#include "pgorm/row.h"

namespace pgorm {

    // --- 成员类型 <-> SqlValue ---
    template <typename V, typename Enable = void>
    struct field_traits;

    template <>
    struct field_traits<std::string> {
        static constexpr FieldType type = FieldType::String;
        static bool fromValue(const SqlValue &v, std::string &out) {
            bool ok = false;
            out = v.toString(&ok);
            return ok;
        }
        static SqlValue toValue(const std::string &v) {
            return SqlValue(v);
        }
    };

    template <>
    struct field_traits<QString> {
        static constexpr FieldType type = FieldType::String;
        static bool fromValue(const SqlValue &v, QString &out) {
            bool ok = false;
            out = QString::fromStdString(v.toString(&ok));
            return ok;
        }
        static SqlValue toValue(const QString &v) {
            return SqlValue(v);
        }
    };

    template <>
    struct field_traits<bool> {
        static constexpr FieldType type = FieldType::Boolean;
        static bool fromValue(const SqlValue &v, bool &out) {
            bool ok = false;
            out = v.toBool(&ok);
            return ok;
        }
        static SqlValue toValue(bool v) {
            return SqlValue(v);
        }
    };

    template <typename V>
    struct field_traits<V, std::enable_if_t<std::is_integral_v<V> && !std::is_same_v<V, bool>>> {
        static constexpr FieldType type = FieldType::Integer;
        static bool fromValue(const SqlValue &v, V &out) {
            bool ok = false;
            out = static_cast<V>(v.toInt64(&ok));
            return ok;
        }
        static SqlValue toValue(V v) {
            return SqlValue(v);
        }
    };

    template <typename V>
    struct field_traits<V, std::enable_if_t<std::is_floating_point_v<V>>> {
        static constexpr FieldType type = FieldType::Float;
        static bool fromValue(const SqlValue &v, V &out) {
            bool ok = false;
            out = static_cast<V>(v.toDouble(&ok));
            return ok;
        }
        static SqlValue toValue(V v) {
            return SqlValue(static_cast<double>(v));
        }
    };

    template <>
    struct field_traits<QUuid> {
        static constexpr FieldType type = FieldType::Uuid;
        static bool fromValue(const SqlValue &v, QUuid &out) {
            bool ok = false;
            out = v.toUuid(&ok);
            return ok;
        }
        static SqlValue toValue(const QUuid &v) {
            return SqlValue(v);
        }
    };

    template <>
    struct field_traits<QDateTime> {
        static constexpr FieldType type = FieldType::Timestamp;
        static bool fromValue(const SqlValue &v, QDateTime &out) {
            bool ok = false;
            out = v.toDateTime(&ok);
            return ok;
        }
        static SqlValue toValue(const QDateTime &v) {
            return SqlValue(v);
        }
    };

    template <>
    struct field_traits<QByteArray> {
        static constexpr FieldType type = FieldType::Bytes;
        static bool fromValue(const SqlValue &v, QByteArray &out) {
            bool ok = false;
            out = v.toByteArray(&ok);
            return ok;
        }
        static SqlValue toValue(const QByteArray &v) {
            return SqlValue(v);
        }
    };

    template <typename V>
    struct is_optional : std::false_type {};
    template <typename V>
    struct is_optional<std::optional<V>> : std::true_type {};

    // 实体类型 T 的字段绑定表: 在 ModelMeta 之外记录每个字段对应的成员指针,
    // 通过循环完成 Row -> T 和 T -> Changeset 的转换
    template <typename T>
    class ModelDefinition {
      public:
        explicit ModelDefinition(std::string table) : meta_(std::move(table)) {
        }

        template <typename V>
        ModelDefinition &primaryKey(const std::string &name, V T::*member, const std::string &column = "") {
            return bind(name, member, FieldFlag::PrimaryKey | FieldFlag::HasDefault, column);
        }

        // std::optional<V> 成员可为 NULL, 其他成员遇到 NULL 时 fromRow 失败
        template <typename V>
        ModelDefinition &field(const std::string &name, V T::*member, FieldFlag flags = FieldFlag::None, const std::string &column = "") {
            return bind(name, member, flags, column);
        }

        ModelDefinition &hasMany(const std::string &name, const std::string &related_table, const std::string &foreign_key, const std::string &local_key = "") {
            meta_.hasMany(name, related_table, foreign_key, local_key);
            return *this;
        }
        ModelDefinition &hasOne(const std::string &name, const std::string &related_table, const std::string &foreign_key, const std::string &local_key = "") {
            meta_.hasOne(name, related_table, foreign_key, local_key);
            return *this;
        }
        ModelDefinition &belongsTo(const std::string &name, const std::string &related_table, const std::string &local_key, const std::string &foreign_key = "id") {
            meta_.belongsTo(name, related_table, local_key, foreign_key);
            return *this;
        }

        const ModelMeta &meta() const {
            return meta_;
        }
        const std::string &tableName() const {
            return meta_.table_name;
        }

        // 行里没有的列保持成员默认值 (例如只选择了部分列)
        std::expected<T, Error> fromRow(const Row &row) const {
            T entity{};
            for (const auto &binding : bindings_) {
                const SqlValue *value = row.find(binding.column);
                if (!value) continue;
                if (!binding.assign(entity, *value)) {
                    return std::unexpected(Error(ErrorCode::InvalidSchema, "Cannot map column '" + meta_.table_name + "." + binding.column + "' (" + value->typeName() + ") to a " + fieldTypeName(binding.type) + " member."));
                }
            }
            return entity;
        }

        // 主键只在 include_primary_key 为 true 时写入
        std::vector<std::pair<std::string, SqlValue>> toChanges(const T &entity, bool include_primary_key = false) const {
            std::vector<std::pair<std::string, SqlValue>> changes;
            for (const auto &binding : bindings_) {
                if (binding.primary_key && !include_primary_key) continue;
                changes.emplace_back(binding.column, binding.read(entity));
            }
            return changes;
        }

        // 需要 meta() 已注册到 registry 且 definition 在 Changeset 使用期间存活
        Changeset toChangeset(const T &entity, bool include_primary_key = false) const {
            Changeset cs(meta_);
            for (const auto &[column, value] : toChanges(entity, include_primary_key)) {
                cs.put(column, value);
            }
            return cs;
        }

        SqlValue primaryKeyValue(const T &entity) const {
            for (const auto &binding : bindings_) {
                if (binding.primary_key) return binding.read(entity);
            }
            return SqlValue();
        }

      private:
        struct Binding {
            std::string column;
            FieldType type;
            bool primary_key = false;
            std::function<bool(T &, const SqlValue &)> assign;
            std::function<SqlValue(const T &)> read;
        };

        template <typename V>
        ModelDefinition &bind(const std::string &name, V T::*member, FieldFlag flags, const std::string &column) {
            Binding binding;
            binding.column = column.empty() ? name : column;
            binding.primary_key = has_flag(flags, FieldFlag::PrimaryKey);
            if constexpr (is_optional<V>::value) {
                using Inner = typename V::value_type;
                binding.type = field_traits<Inner>::type;
                binding.assign = [member](T &entity, const SqlValue &value) {
                    if (value.isNull()) {
                        (entity.*member).reset();
                        return true;
                    }
                    Inner inner{};
                    if (!field_traits<Inner>::fromValue(value, inner)) return false;
                    entity.*member = std::move(inner);
                    return true;
                };
                binding.read = [member](const T &entity) {
                    const auto &opt = entity.*member;
                    return opt ? field_traits<Inner>::toValue(*opt) : SqlValue();
                };
            } else {
                binding.type = field_traits<V>::type;
                binding.assign = [member](T &entity, const SqlValue &value) {
                    if (value.isNull()) return false;
                    return field_traits<V>::fromValue(value, entity.*member);
                };
                binding.read = [member](const T &entity) {
                    return field_traits<V>::toValue(entity.*member);
                };
                if (!binding.primary_key) flags |= FieldFlag::Required;
            }
            meta_.field(name, binding.type, flags, column);
            bindings_.push_back(std::move(binding));
            return *this;
        }

        ModelMeta meta_;
        std::vector<Binding> bindings_;
    };

}  // namespace pgorm

#endif  // pgorm_MODEL_DEFINITION_H
