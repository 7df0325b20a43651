#pragma once

#include <QDateTime>
#include <QDebug>
#include <memory>
#include <optional>
#include <string>

#include "pgorm/model_definition.h"
#include "pgorm/schema_registry.h"

struct User {
    long long id = 0;
    std::string name;
    std::string email;
    int age = 0;
    std::optional<QDateTime> last_login;

    void print() const {
        qDebug().nospace() << "User - ID: " << id << ", Name: " << QString::fromStdString(name) << ", Email: " << QString::fromStdString(email) << ", Age: " << age
                           << ", Last login: " << (last_login ? last_login->toString(Qt::ISODateWithMs) : QString("never"));
    }
};

// 实体定义需要比由它创建的 Changeset 活得久, 所以用静态对象
inline const pgorm::ModelDefinition<User> &userDefinition() {
    static const pgorm::ModelDefinition<User> definition = [] {
        pgorm::ModelDefinition<User> def("users");
        def.primaryKey("id", &User::id)
            .field("name", &User::name)
            .field("email", &User::email, pgorm::FieldFlag::Unique)
            .field("age", &User::age)
            .field("last_login", &User::last_login)
            .hasMany("posts", "posts", "user_id");
        return def;
    }();
    return definition;
}

inline pgorm::ModelMeta postMeta() {
    pgorm::ModelMeta meta("posts");
    meta.primaryKey("id")
        .field("user_id", pgorm::FieldType::Integer, pgorm::FieldFlag::Required)
        .field("title", pgorm::FieldType::String, pgorm::FieldFlag::Required)
        .field("body", pgorm::FieldType::String)
        .field("published_at", pgorm::FieldType::Timestamp)
        .belongsTo("author", "users", "user_id")
        .hasMany("comments", "comments", "post_id");
    return meta;
}

inline pgorm::ModelMeta commentMeta() {
    pgorm::ModelMeta meta("comments");
    meta.primaryKey("id").field("post_id", pgorm::FieldType::Integer, pgorm::FieldFlag::Required).field("body", pgorm::FieldType::String, pgorm::FieldFlag::Required).belongsTo("post", "posts", "post_id");
    return meta;
}

inline std::shared_ptr<pgorm::SchemaRegistry> makeBlogRegistry() {
    auto registry = std::make_shared<pgorm::SchemaRegistry>();
    for (auto meta : {userDefinition().meta(), postMeta(), commentMeta()}) {
        pgorm::Error err = registry->registerModel(meta);
        if (err) {
            qCritical() << "Failed to register" << QString::fromStdString(meta.table_name) << ":" << QString::fromStdString(err.toString());
        }
    }
    return registry;
}
