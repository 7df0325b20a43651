#ifndef pgorm_SCHEMA_REGISTRY_H
#define pgorm_SCHEMA_REGISTRY_H

#include <expected>
#include <map>
#include <string>
#include <vector>

#include "pgorm/error.h"
#include "pgorm/model_meta.h"

namespace pgorm {

    // 显式传递的表结构注册表. 启动时注册, 之后只读, 可跨线程共享
    class SchemaRegistry {
      public:
        SchemaRegistry() = default;

        // 无主键、重复表名、重复字段或关联名时返回 InvalidSchema
        Error registerModel(ModelMeta meta);

        const ModelMeta *find(const std::string &table_name) const;
        std::expected<const ModelMeta *, Error> require(const std::string &table_name) const;
        // owner 表上名为 name 的关联, 不存在时返回 InvalidRelationship
        std::expected<const RelationshipInfo *, Error> resolveRelationship(const std::string &table_name, const std::string &name) const;

        bool contains(const std::string &table_name) const;
        size_t size() const;
        std::vector<std::string> tableNames() const;

      private:
        std::map<std::string, ModelMeta> models_;
    };

}  // namespace pgorm

#endif  // pgorm_SCHEMA_REGISTRY_H
