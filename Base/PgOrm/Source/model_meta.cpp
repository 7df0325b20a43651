#include "pgorm/model_meta.h"

namespace pgorm {

    const char *associationTypeName(AssociationType type) {
        switch (type) {
            case AssociationType::HasOne:
                return "hasOne";
            case AssociationType::BelongsTo:
                return "belongsTo";
            case AssociationType::HasMany:
                return "hasMany";
            case AssociationType::ManyToMany:
                return "manyToMany";
        }
        return "unknown";
    }

    const char *fieldTypeName(FieldType type) {
        switch (type) {
            case FieldType::String:
                return "string";
            case FieldType::Integer:
                return "integer";
            case FieldType::Float:
                return "float";
            case FieldType::Boolean:
                return "boolean";
            case FieldType::Uuid:
                return "uuid";
            case FieldType::Timestamp:
                return "timestamp";
            case FieldType::Bytes:
                return "bytes";
        }
        return "unknown";
    }

    ModelMeta &ModelMeta::primaryKey(const std::string &name, FieldType type, const std::string &db_name) {
        fields.emplace_back(name, db_name, type, FieldFlag::PrimaryKey | FieldFlag::HasDefault);
        primary_key_db_name = fields.back().db_name;
        return *this;
    }

    ModelMeta &ModelMeta::field(const std::string &name, FieldType type, FieldFlag flags, const std::string &db_name) {
        fields.emplace_back(name, db_name, type, flags);
        if (has_flag(flags, FieldFlag::PrimaryKey)) primary_key_db_name = fields.back().db_name;
        return *this;
    }

    ModelMeta &ModelMeta::hasMany(const std::string &name, const std::string &related_table, const std::string &foreign_key, const std::string &local_key) {
        relationships.emplace_back(name, AssociationType::HasMany, local_key.empty() ? primary_key_db_name : local_key, foreign_key, related_table);
        return *this;
    }

    ModelMeta &ModelMeta::hasOne(const std::string &name, const std::string &related_table, const std::string &foreign_key, const std::string &local_key) {
        relationships.emplace_back(name, AssociationType::HasOne, local_key.empty() ? primary_key_db_name : local_key, foreign_key, related_table);
        return *this;
    }

    ModelMeta &ModelMeta::belongsTo(const std::string &name, const std::string &related_table, const std::string &local_key, const std::string &foreign_key) {
        relationships.emplace_back(name, AssociationType::BelongsTo, local_key, foreign_key, related_table);
        return *this;
    }

    ModelMeta &ModelMeta::manyToMany(const std::string &name, const std::string &related_table, const std::string &foreign_key, const std::string &local_key) {
        relationships.emplace_back(name, AssociationType::ManyToMany, local_key.empty() ? primary_key_db_name : local_key, foreign_key, related_table);
        return *this;
    }

    std::string ModelMeta::resolveColumn(const std::string &name) const {
        if (findFieldByDbName(name)) return name;
        if (const FieldMeta *f = findFieldByName(name)) return f->db_name;
        return name;
    }

    std::vector<std::string> ModelMeta::columnNames() const {
        std::vector<std::string> names;
        names.reserve(fields.size());
        for (const auto &f : fields) names.push_back(f.db_name);
        return names;
    }

}  // namespace pgorm
