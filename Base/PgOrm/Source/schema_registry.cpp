#include "pgorm/schema_registry.h"

#include <set>
#include <utility>

namespace pgorm {

    Error SchemaRegistry::registerModel(ModelMeta meta) {
        if (meta.table_name.empty()) {
            return Error(ErrorCode::InvalidSchema, "Model has no table name.");
        }
        if (models_.count(meta.table_name)) {
            return Error(ErrorCode::InvalidSchema, "Table '" + meta.table_name + "' is already registered.");
        }
        if (meta.primary_key_db_name.empty() || !meta.getPrimaryField()) {
            return Error(ErrorCode::InvalidSchema, "Table '" + meta.table_name + "' declares no primary key.");
        }
        std::set<std::string> seen_columns;
        for (const auto &f : meta.fields) {
            if (!seen_columns.insert(f.db_name).second) {
                return Error(ErrorCode::InvalidSchema, "Table '" + meta.table_name + "' declares column '" + f.db_name + "' twice.");
            }
        }
        std::set<std::string> seen_relationships;
        for (const auto &rel : meta.relationships) {
            if (!seen_relationships.insert(rel.name).second) {
                return Error(ErrorCode::InvalidSchema, "Table '" + meta.table_name + "' declares relationship '" + rel.name + "' twice.");
            }
            if (rel.local_key.empty() || rel.foreign_key.empty() || rel.related_table.empty()) {
                return Error(ErrorCode::InvalidSchema, "Relationship '" + meta.table_name + "." + rel.name + "' is missing a key or related table.");
            }
        }
        std::string table = meta.table_name;
        models_.emplace(std::move(table), std::move(meta));
        return make_ok();
    }

    const ModelMeta *SchemaRegistry::find(const std::string &table_name) const {
        auto it = models_.find(table_name);
        return it == models_.end() ? nullptr : &it->second;
    }

    std::expected<const ModelMeta *, Error> SchemaRegistry::require(const std::string &table_name) const {
        const ModelMeta *meta = find(table_name);
        if (!meta) {
            return std::unexpected(Error(ErrorCode::InvalidSchema, "Table '" + table_name + "' is not registered."));
        }
        return meta;
    }

    std::expected<const RelationshipInfo *, Error> SchemaRegistry::resolveRelationship(const std::string &table_name, const std::string &name) const {
        const ModelMeta *meta = find(table_name);
        if (!meta) {
            return std::unexpected(Error(ErrorCode::InvalidRelationship, "Cannot resolve '" + name + "': table '" + table_name + "' is not registered."));
        }
        const RelationshipInfo *rel = meta->findRelationship(name);
        if (!rel) {
            return std::unexpected(Error(ErrorCode::InvalidRelationship, "Table '" + table_name + "' has no relationship named '" + name + "'."));
        }
        return rel;
    }

    bool SchemaRegistry::contains(const std::string &table_name) const {
        return models_.count(table_name) > 0;
    }

    size_t SchemaRegistry::size() const {
        return models_.size();
    }

    std::vector<std::string> SchemaRegistry::tableNames() const {
        std::vector<std::string> names;
        for (const auto &pair : models_) names.push_back(pair.first);
        return names;
    }

}  // namespace pgorm
