#ifndef pgorm_MODEL_META_DEFINITIONS_H
#define pgorm_MODEL_META_DEFINITIONS_H

#include <string>
#include <utility>

#include "pgorm/model_types.h"

namespace pgorm {

    // --- Field Metadata ---
    struct FieldMeta {
        std::string name;     // 逻辑字段名
        std::string db_name;  // 列名
        FieldType type = FieldType::String;
        FieldFlag flags = FieldFlag::None;

        FieldMeta(std::string fieldName, std::string dbName, FieldType fieldType, FieldFlag fieldFlags = FieldFlag::None)
            : name(std::move(fieldName)), db_name(std::move(dbName)), type(fieldType), flags(fieldFlags) {
            if (db_name.empty()) db_name = name;
        }

        bool isPrimaryKey() const {
            return has_flag(flags, FieldFlag::PrimaryKey);
        }
        bool isRequired() const {
            return has_flag(flags, FieldFlag::Required);
        }
    };

    // 关联关系. 连接谓词固定为 owner.local_key = related.foreign_key
    struct RelationshipInfo {
        std::string name;
        AssociationType type = AssociationType::HasMany;
        std::string local_key;    // owner 表上的列
        std::string foreign_key;  // related_table 上的列
        std::string related_table;

        RelationshipInfo(std::string assocName, AssociationType assocType, std::string localKey, std::string foreignKey, std::string relatedTable)
            : name(std::move(assocName)), type(assocType), local_key(std::move(localKey)), foreign_key(std::move(foreignKey)), related_table(std::move(relatedTable)) {
        }

        bool isCollection() const {
            return type == AssociationType::HasMany || type == AssociationType::ManyToMany;
        }
    };

}  // namespace pgorm

#endif  // pgorm_MODEL_META_DEFINITIONS_H
