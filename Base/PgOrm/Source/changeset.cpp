#include "pgorm/changeset.h"

#include <algorithm>

#include "pgorm/value_codec.h"

namespace pgorm {

    Changeset::Changeset(std::string table) : table_(std::move(table)) {
    }

    Changeset::Changeset(const ModelMeta &meta) : table_(meta.table_name), meta_(&meta) {
    }

    std::string Changeset::columnFor(const std::string &field) const {
        return meta_ ? meta_->resolveColumn(field) : field;
    }

    // 错误按逻辑字段名记录
    std::string Changeset::fieldLabel(const std::string &field) const {
        if (meta_) {
            if (const FieldMeta *fm = meta_->findFieldByDbName(field)) return fm->name;
        }
        return field;
    }

    Changeset Changeset::cast(const ModelMeta &meta, const std::map<std::string, SqlValue> &params, const std::vector<std::string> &permitted) {
        Changeset cs(meta);
        std::vector<const FieldMeta *> fields;
        if (permitted.empty()) {
            for (const auto &f : meta.fields) {
                if (!f.isPrimaryKey()) fields.push_back(&f);
            }
        } else {
            for (const auto &name : permitted) {
                const FieldMeta *f = meta.findFieldByName(name);
                if (!f) f = meta.findFieldByDbName(name);
                if (!f) {
                    cs.addError(name, "is not a field of " + meta.table_name);
                    continue;
                }
                fields.push_back(f);
            }
        }

        for (const FieldMeta *f : fields) {
            auto it = params.find(f->name);
            if (it == params.end()) it = params.find(f->db_name);
            if (it == params.end()) continue;
            auto coerced = coerce_to_field_type(it->second, f->type);
            if (!coerced) {
                cs.addError(f->name, std::string("is invalid (expected ") + fieldTypeName(f->type) + ")");
                continue;
            }
            cs.changes_[f->db_name] = *coerced;
        }
        return cs;
    }

    Changeset &Changeset::put(const std::string &field, const SqlValue &value) {
        const std::string column = columnFor(field);
        if (meta_) {
            if (const FieldMeta *fm = meta_->findFieldByDbName(column)) {
                auto coerced = coerce_to_field_type(value, fm->type);
                if (!coerced) {
                    return addError(fm->name, std::string("is invalid (expected ") + fieldTypeName(fm->type) + ")");
                }
                changes_[column] = *coerced;
                return *this;
            }
        }
        changes_[column] = value;
        return *this;
    }

    Changeset &Changeset::addError(const std::string &field, const std::string &message) {
        errors_[fieldLabel(field)].push_back(message);
        return *this;
    }

    Changeset &Changeset::validateRequired(const std::vector<std::string> &fields) {
        for (const auto &field : fields) {
            auto it = changes_.find(columnFor(field));
            if (it == changes_.end() || it->second.isNull()) {
                addError(field, "can't be blank");
                continue;
            }
            if (it->second.type() == pgorm_sqldriver::SqlValueType::String && QString::fromStdString(it->second.toString()).trimmed().isEmpty()) {
                addError(field, "can't be blank");
            }
        }
        return *this;
    }

    Changeset &Changeset::validateLength(const std::string &field, std::optional<int> min, std::optional<int> max) {
        auto it = changes_.find(columnFor(field));
        if (it == changes_.end() || it->second.isNull()) return *this;
        const qsizetype length = QString::fromStdString(it->second.toString()).size();
        if (min && length < *min) {
            addError(field, "should be at least " + std::to_string(*min) + " character(s)");
        }
        if (max && length > *max) {
            addError(field, "should be at most " + std::to_string(*max) + " character(s)");
        }
        return *this;
    }

    Changeset &Changeset::validateFormat(const std::string &field, const QRegularExpression &pattern, const std::string &message) {
        auto it = changes_.find(columnFor(field));
        if (it == changes_.end() || it->second.isNull()) return *this;
        if (!pattern.match(QString::fromStdString(it->second.toString())).hasMatch()) {
            addError(field, message);
        }
        return *this;
    }

    Changeset &Changeset::validateInclusion(const std::string &field, const std::vector<SqlValue> &allowed, const std::string &message) {
        auto it = changes_.find(columnFor(field));
        if (it == changes_.end() || it->second.isNull()) return *this;
        const auto key = sql_value_to_map_key(it->second);
        const bool found = std::any_of(allowed.begin(), allowed.end(), [&key](const SqlValue &candidate) {
            return sql_value_to_map_key(candidate) == key;
        });
        if (!found) addError(field, message);
        return *this;
    }

    std::optional<SqlValue> Changeset::change(const std::string &field) const {
        auto it = changes_.find(columnFor(field));
        if (it == changes_.end()) return std::nullopt;
        return it->second;
    }

    ChangeList Changeset::changeList() const {
        ChangeList list;
        list.reserve(changes_.size());
        if (meta_) {
            for (const auto &f : meta_->fields) {
                auto it = changes_.find(f.db_name);
                if (it != changes_.end()) list.emplace_back(it->first, it->second);
            }
            // 未声明的列放在最后
            for (const auto &[column, value] : changes_) {
                if (!meta_->findFieldByDbName(column)) list.emplace_back(column, value);
            }
            return list;
        }
        for (const auto &[column, value] : changes_) list.emplace_back(column, value);
        return list;
    }

    Error Changeset::toError() const {
        Error err(ErrorCode::InvalidChangeset, "Changeset for '" + table_ + "' is invalid.");
        err.field_errors = errors_;
        return err;
    }

}  // namespace pgorm
