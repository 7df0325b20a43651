#ifndef pgorm_MODEL_META_H
#define pgorm_MODEL_META_H

#include <string>
#include <vector>

#include "pgorm/model_meta_definitions.h"

namespace pgorm {

    // --- ModelMeta Definition ---
    // 表的字段描述表和关联. 通过链式方法在启动时构造, 注册后只读
    struct ModelMeta {
        std::string table_name;
        std::vector<FieldMeta> fields;
        std::vector<RelationshipInfo> relationships;
        std::string primary_key_db_name;

        ModelMeta() = default;
        explicit ModelMeta(std::string table) : table_name(std::move(table)) {
        }

        ModelMeta &primaryKey(const std::string &name, FieldType type = FieldType::Integer, const std::string &db_name = "");
        ModelMeta &field(const std::string &name, FieldType type, FieldFlag flags = FieldFlag::None, const std::string &db_name = "");
        // hasMany/hasOne: local_key 默认为主键列
        ModelMeta &hasMany(const std::string &name, const std::string &related_table, const std::string &foreign_key, const std::string &local_key = "");
        ModelMeta &hasOne(const std::string &name, const std::string &related_table, const std::string &foreign_key, const std::string &local_key = "");
        // belongsTo: local_key 是本表的引用列, foreign_key 默认为 "id"
        ModelMeta &belongsTo(const std::string &name, const std::string &related_table, const std::string &local_key, const std::string &foreign_key = "id");
        ModelMeta &manyToMany(const std::string &name, const std::string &related_table, const std::string &foreign_key, const std::string &local_key = "");

        const FieldMeta *findFieldByDbName(const std::string &name) const {
            for (const auto &f : fields)
                if (f.db_name == name && !f.db_name.empty()) return &f;
            return nullptr;
        }
        const FieldMeta *findFieldByName(const std::string &name) const {
            for (const auto &f : fields)
                if (f.name == name) return &f;
            return nullptr;
        }
        const RelationshipInfo *findRelationship(const std::string &name) const {
            for (const auto &rel : relationships)
                if (rel.name == name) return &rel;
            return nullptr;
        }
        const FieldMeta *getPrimaryField() const {
            if (primary_key_db_name.empty()) return nullptr;
            return findFieldByDbName(primary_key_db_name);
        }
        // 逻辑名或列名 -> 列名; 未声明的名字原样返回
        std::string resolveColumn(const std::string &name) const;
        std::vector<std::string> columnNames() const;
    };

}  // namespace pgorm

#endif  // pgorm_MODEL_META_H
