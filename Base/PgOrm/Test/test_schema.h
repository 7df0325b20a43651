// PgOrm/Test/test_schema.h
#pragma once

#include <memory>

#include "pgorm/schema_registry.h"

namespace pgorm_test {

    // users 1-n posts 1-n comments, users 1-1 profiles, posts n-1 users
    inline std::shared_ptr<pgorm::SchemaRegistry> makeBlogRegistry() {
        using pgorm::FieldFlag;
        using pgorm::FieldType;
        auto registry = std::make_shared<pgorm::SchemaRegistry>();

        pgorm::ModelMeta users("users");
        users.primaryKey("id")
            .field("name", FieldType::String, FieldFlag::Required)
            .field("email", FieldType::String, FieldFlag::Required | FieldFlag::Unique)
            .field("age", FieldType::Integer)
            .field("active", FieldType::Boolean)
            .field("createdAt", FieldType::Timestamp, FieldFlag::None, "created_at")
            .hasMany("posts", "posts", "user_id")
            .hasOne("profile", "profiles", "user_id")
            .manyToMany("groups", "groups", "user_id");
        registry->registerModel(users);

        pgorm::ModelMeta posts("posts");
        posts.primaryKey("id")
            .field("user_id", FieldType::Integer, FieldFlag::Required)
            .field("title", FieldType::String, FieldFlag::Required)
            .field("score", FieldType::Float)
            .belongsTo("author", "users", "user_id")
            .hasMany("comments", "comments", "post_id");
        registry->registerModel(posts);

        pgorm::ModelMeta comments("comments");
        comments.primaryKey("id").field("post_id", FieldType::Integer).field("body", FieldType::String).belongsTo("post", "posts", "post_id");
        registry->registerModel(comments);

        pgorm::ModelMeta profiles("profiles");
        profiles.primaryKey("id").field("user_id", FieldType::Integer).field("bio", FieldType::String);
        registry->registerModel(profiles);

        return registry;
    }

}  // namespace pgorm_test
