#include <QCoreApplication>
#include <QDebug>
#include <QRegularExpression>
#include <memory>
#include <vector>

#include "blog_models.h"
#include "pgorm/pgorm.h"

namespace {

    const char *kSchemaSql[] = {
        "DROP TABLE IF EXISTS comments",
        "DROP TABLE IF EXISTS posts",
        "DROP TABLE IF EXISTS users",
        "CREATE TABLE users (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL, email TEXT NOT NULL UNIQUE, age INTEGER NOT NULL DEFAULT 0, last_login TIMESTAMPTZ)",
        "CREATE TABLE posts (id BIGSERIAL PRIMARY KEY, user_id BIGINT NOT NULL REFERENCES users(id), title TEXT NOT NULL, body TEXT, published_at TIMESTAMPTZ)",
        "CREATE TABLE comments (id BIGSERIAL PRIMARY KEY, post_id BIGINT NOT NULL REFERENCES posts(id), body TEXT NOT NULL)",
    };

    bool createSchema(const pgorm::Repo &repo) {
        for (const char *sql : kSchemaSql) {
            auto res = repo.executeRaw(sql);
            if (!res) {
                qCritical() << "Schema setup failed:" << QString::fromStdString(res.error().toString());
                return false;
            }
        }
        return true;
    }

    void runCrudOperations(pgorm::Repo &repo) {
        qDebug() << "\n--- Running CRUD Operations ---";

        qDebug() << "\n1. Creating users...";
        User alice;
        alice.name = "Alice Wonderland";
        alice.email = "alice@example.com";
        alice.age = 30;
        auto created = repo.insert(userDefinition(), alice);
        if (!created) {
            qCritical() << "Failed to create Alice:" << QString::fromStdString(created.error().toString());
            return;
        }
        alice = *created;
        alice.print();

        // 从原始参数转换并校验
        auto bob_changes = pgorm::Changeset::cast(userDefinition().meta(), {{"name", "Bob The Builder"}, {"email", "bob@example"}, {"age", "45"}})
                               .validateRequired({"name", "email"})
                               .validateFormat("email", QRegularExpression("^[^@\\s]+@[^@\\s]+\\.[^@\\s]+$"));
        auto bob_res = repo.insert(bob_changes);
        if (!bob_res) {
            qInfo() << "Rejected invalid changeset as expected:" << QString::fromStdString(bob_res.error().toString());
        }
        bob_changes = pgorm::Changeset::cast(userDefinition().meta(), {{"name", "Bob The Builder"}, {"email", "bob@example.com"}, {"age", "45"}});
        bob_res = repo.insert(bob_changes);
        if (!bob_res) {
            qCritical() << "Failed to create Bob:" << QString::fromStdString(bob_res.error().toString());
            return;
        }
        const pgorm::SqlValue bob_id = bob_res->value("id");

        qDebug() << "\n2. Creating posts and comments...";
        std::vector<pgorm::Changeset> posts;
        for (int i = 1; i <= 3; ++i) {
            pgorm::Changeset post("posts");
            post.put("user_id", alice.id).put("title", "Post #" + std::to_string(i)).put("body", "Hello from Alice");
            posts.push_back(std::move(post));
        }
        auto inserted_posts = repo.insertAll(posts);
        if (!inserted_posts) {
            qCritical() << "Failed to insert posts:" << QString::fromStdString(inserted_posts.error().toString());
            return;
        }
        for (const auto &post : *inserted_posts) {
            pgorm::Changeset comment("comments");
            comment.put("post_id", post.value("id")).put("body", "Nice post!");
            if (auto res = repo.insert(comment); !res) {
                qWarning() << "Failed to insert comment:" << QString::fromStdString(res.error().toString());
            }
        }

        qDebug() << "\n3. Querying with conditions...";
        auto adults = repo.all(userDefinition(), pgorm::Query::from("users").where(pgorm::Field("age").greaterThanOrEqual(18)).where(pgorm::Field("email").like("%@example.com")).orderBy("name").limit(10));
        if (adults) {
            qDebug() << "Found" << adults->size() << "adult user(s):";
            for (const auto &u : *adults) u.print();
        } else {
            qCritical() << "Query failed:" << QString::fromStdString(adults.error().toString());
        }

        qDebug() << "\n4. Preloading posts.comments...";
        auto with_posts = repo.all(pgorm::Query::from("users").preload("posts.comments"));
        if (with_posts) {
            for (const auto &row : *with_posts) {
                const auto *user_posts = row.many("posts");
                qDebug() << QString::fromStdString(row.value("name").toString()) << "has" << (user_posts ? user_posts->size() : 0) << "post(s)";
                if (!user_posts) continue;
                for (const auto &post : *user_posts) {
                    const auto *comments = post.many("comments");
                    qDebug() << "  " << QString::fromStdString(post.value("title").toString()) << "-" << (comments ? comments->size() : 0) << "comment(s)";
                }
            }
        } else {
            qCritical() << "Preload failed:" << QString::fromStdString(with_posts.error().toString());
        }

        qDebug() << "\n5. Upserting Bob by email...";
        pgorm::Changeset bob_again("users");
        bob_again.put("name", "Robert Builder").put("email", "bob@example.com").put("age", 46);
        pgorm::UpsertOptions upsert_options;
        upsert_options.conflict = pgorm::ConflictTarget::onColumns({"email"});
        upsert_options.update_columns = std::vector<std::string>{"name"};
        if (auto res = repo.upsert(bob_again, upsert_options)) {
            qDebug() << "Upserted:" << QString::fromStdString(res->value("name").toString()) << "age" << res->value("age").toInt64();
        } else {
            qCritical() << "Upsert failed:" << QString::fromStdString(res.error().toString());
        }

        qDebug() << "\n6. Transaction that rolls back...";
        auto tx_res = repo.transaction([&](pgorm::Repo &tx) -> std::expected<void, pgorm::Error> {
            pgorm::Changeset temp("users");
            temp.put("name", "Temporary").put("email", "temp@example.com");
            if (auto res = tx.insert(temp); !res) return std::unexpected(res.error());
            return std::unexpected(pgorm::Error(pgorm::ErrorCode::InvalidChangeset, "abort on purpose"));
        });
        auto user_count = repo.count(pgorm::Query::from("users"));
        qDebug() << "Transaction result:" << (tx_res ? "committed" : "rolled back") << "- users now:" << (user_count ? *user_count : -1);

        qDebug() << "\n7. Savepoint inside a transaction...";
        auto sp_res = repo.transaction([&](pgorm::Repo &tx) -> std::expected<long long, pgorm::Error> {
            auto inner = tx.savepoint("bad_update", [&](pgorm::Repo &sp) -> std::expected<pgorm::Row, pgorm::Error> {
                pgorm::Changeset bad("users");
                bad.put("email", "alice@example.com");  // 违反唯一约束
                return sp.update("users", bob_id, bad);
            });
            if (!inner) qInfo() << "Savepoint rolled back:" << QString::fromStdString(inner.error().toString());
            return tx.count(pgorm::Query::from("users"));
        });
        if (sp_res) qDebug() << "Outer transaction committed, users:" << *sp_res;

        qDebug() << "\n8. Deleting a user...";
        if (auto res = repo.remove("users", pgorm::SqlValue(999999)); !res) {
            qInfo() << "Delete of unknown id:" << QString::fromStdString(res.error().toString());
        }
    }

}  // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);

    auto config = pgorm::DbConfig::fromEnvironment({}, ".env");
    if (!config) {
        qCritical() << "Bad configuration:" << QString::fromStdString(config.error().toString());
        return 1;
    }

    auto pool = pgorm::DbManager::openPool(*config);
    if (!pool) {
        qCritical() << "Failed to connect to database:" << QString::fromStdString(pool.error().toString());
        qInfo() << "Please ensure PostgreSQL is running and PGORM_DB_* (or DB_*) variables are set.";
        return 1;
    }
    qInfo() << "Connected to" << QString::fromStdString(config->database_name);

    pgorm::Repo repo(*pool, makeBlogRegistry());
    if (!createSchema(repo)) return 1;
    runCrudOperations(repo);

    (*pool)->close();
    qDebug() << "\nExample finished.";
    return 0;
}
