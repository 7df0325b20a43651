// PgOrm/Test/sql_compiler_test.cpp
#include <gtest/gtest.h>

#include <regex>

#include "pgorm/sql_compiler.h"
#include "test_schema.h"

namespace pgorm {
    namespace {

        class SqlCompilerTest : public ::testing::Test {
          protected:
            std::shared_ptr<SchemaRegistry> registry_ = pgorm_test::makeBlogRegistry();
            SqlCompiler compiler_{registry_.get()};
            SqlCompiler bare_;

            CompiledStatement select(const Query &q) {
                auto stmt = compiler_.compileSelect(q);
                EXPECT_TRUE(stmt.has_value()) << (stmt ? "" : stmt.error().toString());
                return stmt.value_or(CompiledStatement{});
            }
        };

        // 占位符从 $1 开始严格递增且数量与参数一致
        void expectDenseNumbering(const CompiledStatement &stmt) {
            std::regex placeholder("\\$(\\d+)");
            int expected = 1;
            for (auto it = std::sregex_iterator(stmt.sql.begin(), stmt.sql.end(), placeholder); it != std::sregex_iterator(); ++it) {
                EXPECT_EQ(std::stoi((*it)[1].str()), expected) << stmt.sql;
                ++expected;
            }
            EXPECT_EQ(static_cast<size_t>(expected - 1), stmt.parameters.size()) << stmt.sql;
        }

        TEST_F(SqlCompilerTest, CompilesUsersQuery) {
            const Query q = Query::from("users").where(Field("age").greaterThanOrEqual(18)).where(Field("email").like("%@example.com")).limit(10);
            auto stmt = bare_.compileSelect(q);
            ASSERT_TRUE(stmt.has_value());
            EXPECT_EQ(stmt->sql, "SELECT * FROM users WHERE age >= $1 AND email LIKE $2 LIMIT 10");
            ASSERT_EQ(stmt->parameters.size(), 2u);
            EXPECT_EQ(stmt->parameters[0], SqlValue(18));
            EXPECT_EQ(stmt->parameters[1], SqlValue("%@example.com"));
        }

        TEST_F(SqlCompilerTest, EmptyConditionsProduceNoWhere) {
            EXPECT_EQ(select(Query::from("users")).sql, "SELECT * FROM users");
            EXPECT_EQ(select(Query::from("users").whereGroup({})).sql, "SELECT * FROM users");
        }

        TEST_F(SqlCompilerTest, GroupsAreParenthesizedAndNumberedInOrder) {
            const Query q = Query::from("users").where(Field("active").eq(true)).whereAny({Field("age").lessThan(18), Field("age").greaterThan(65)}).whereGroup({Field("name").notEq("root"), Field("email").isNotNull()});
            const auto stmt = select(q);
            EXPECT_EQ(stmt.sql, "SELECT * FROM users WHERE active = $1 AND (age < $2 OR age > $3) AND (name != $4 AND email IS NOT NULL)");
            expectDenseNumbering(stmt);
        }

        TEST_F(SqlCompilerTest, SingleConditionGroupIsNotParenthesized) {
            EXPECT_EQ(select(Query::from("users").whereAny({Field("age").eq(1)})).sql, "SELECT * FROM users WHERE age = $1");
        }

        TEST_F(SqlCompilerTest, OrderLimitOffset) {
            const auto stmt = select(Query::from("users").orderBy("name").orderBy("createdAt", OrderDirection::Desc).limit(20).offset(40));
            EXPECT_EQ(stmt.sql, "SELECT * FROM users ORDER BY name ASC, created_at DESC LIMIT 20 OFFSET 40");
        }

        TEST_F(SqlCompilerTest, InAndBetween) {
            const auto stmt = select(Query::from("users").where(Field("id").in({1, 2, 3})).where(Field("age").between(20, 30)));
            EXPECT_EQ(stmt.sql, "SELECT * FROM users WHERE id IN ($1, $2, $3) AND age BETWEEN $4 AND $5");
            expectDenseNumbering(stmt);
        }

        TEST_F(SqlCompilerTest, EmptyInListIsConstant) {
            EXPECT_EQ(select(Query::from("users").where(Field("id").in({}))).sql, "SELECT * FROM users WHERE FALSE");
            EXPECT_EQ(select(Query::from("users").where(Field("id").notIn({}))).sql, "SELECT * FROM users WHERE TRUE");
        }

        TEST_F(SqlCompilerTest, NullEqualityBecomesIsNull) {
            const auto stmt = select(Query::from("users").where(Field("email").eq(SqlValue())).where(Field("name").notEq(SqlValue())));
            EXPECT_EQ(stmt.sql, "SELECT * FROM users WHERE email IS NULL AND name IS NOT NULL");
            EXPECT_TRUE(stmt.parameters.empty());
        }

        TEST_F(SqlCompilerTest, RejectsUnknownOperatorAndBadIdentifiers) {
            auto bad_op = compiler_.compileSelect(Query::from("users").where(Condition("age", "~~*", SqlValue(1))));
            ASSERT_FALSE(bad_op.has_value());
            EXPECT_EQ(bad_op.error().code, ErrorCode::InvalidQuery);

            auto injection = compiler_.compileSelect(Query::from("users").where(Field("age; DROP TABLE users").eq(1)));
            ASSERT_FALSE(injection.has_value());
            EXPECT_EQ(injection.error().code, ErrorCode::InvalidQuery);

            EXPECT_EQ(compiler_.compileSelect(Query::from("users u")).error().code, ErrorCode::InvalidQuery);
            EXPECT_EQ(compiler_.compileSelect(Query::from("users").where(Condition("age", "BETWEEN", std::vector<SqlValue>{1}))).error().code, ErrorCode::InvalidQuery);
            EXPECT_EQ(compiler_.compileSelect(Query::from("users").where(Condition("age", "IN", SqlValue(1)))).error().code, ErrorCode::InvalidQuery);
            EXPECT_EQ(compiler_.compileSelect(Query::from("users").limit(-1)).error().code, ErrorCode::InvalidQuery);
        }

        TEST_F(SqlCompilerTest, OperatorsAreCaseInsensitive) {
            EXPECT_EQ(select(Query::from("users").where(Condition("name", "ilike", SqlValue("a%")))).sql, "SELECT * FROM users WHERE name ILIKE $1");
            EXPECT_EQ(select(Query::from("users").where(Condition("id", "not  in", std::vector<SqlValue>{1}))).sql, "SELECT * FROM users WHERE id NOT IN ($1)");
            EXPECT_EQ(select(Query::from("users").where(Condition("age", "<>", SqlValue(3)))).sql, "SELECT * FROM users WHERE age <> $1");
        }

        TEST_F(SqlCompilerTest, AssociationJoinQualifiesColumns) {
            const auto stmt = select(Query::from("posts").join("author", JoinType::Left).where(Field("title").like("x%")).orderBy("id"));
            EXPECT_EQ(stmt.sql,
                      "SELECT posts.id, posts.user_id, posts.title, posts.score FROM posts LEFT JOIN users ON posts.user_id = users.id "
                      "WHERE posts.title LIKE $1 ORDER BY posts.id ASC");
        }

        TEST_F(SqlCompilerTest, ExplicitJoinOnUnregisteredTable) {
            const auto stmt = select(Query::from("users").join("audit_log", JoinType::Inner, JoinOn{"id", "audit_log.user_id"}));
            EXPECT_EQ(stmt.sql, "SELECT users.id, users.name, users.email, users.age, users.active, users.created_at FROM users INNER JOIN audit_log ON users.id = audit_log.user_id");

            auto bare = bare_.compileSelect(Query::from("events").join("audit_log", JoinType::Full, JoinOn{"events.id", "event_id"}));
            ASSERT_TRUE(bare.has_value());
            EXPECT_EQ(bare->sql, "SELECT events.* FROM events FULL OUTER JOIN audit_log ON events.id = audit_log.event_id");
        }

        TEST_F(SqlCompilerTest, WhereRelatedJoinsAssociation) {
            const auto stmt = select(Query::from("users").where(Field("active").eq(true)).whereRelated("posts", Field("title").like("Hello%")));
            EXPECT_EQ(stmt.sql,
                      "SELECT users.id, users.name, users.email, users.age, users.active, users.created_at FROM users INNER JOIN posts ON users.id = posts.user_id "
                      "WHERE users.active = $1 AND posts.title LIKE $2");
            expectDenseNumbering(stmt);
        }

        TEST_F(SqlCompilerTest, MixedConditionKindsShareOneNumbering) {
            const std::vector<Condition> on_posts = {Field("title").like("x%"), Field("id").in({1, 2, 3})};
            const Query q = Query::from("users").where(Field("age").greaterThanOrEqual(18)).whereAny({Field("name").eq("a"), Field("name").eq("b")}).whereRelated("posts", on_posts);
            const auto stmt = select(q);
            EXPECT_EQ(stmt.sql,
                      "SELECT users.id, users.name, users.email, users.age, users.active, users.created_at FROM users INNER JOIN posts ON users.id = posts.user_id "
                      "WHERE users.age >= $1 AND (users.name = $2 OR users.name = $3) AND posts.title LIKE $4 AND posts.id IN ($5, $6, $7)");
            expectDenseNumbering(stmt);
            const std::vector<SqlValue> expected = {SqlValue(18), SqlValue("a"), SqlValue("b"), SqlValue("x%"), SqlValue(1), SqlValue(2), SqlValue(3)};
            EXPECT_EQ(stmt.parameters, expected);
        }

        TEST_F(SqlCompilerTest, ThroughRerootsQueryAtRelatedTable) {
            auto posts = Query::from("users").where(Field("active").eq(true)).limit(5).through(*registry_, "posts");
            ASSERT_TRUE(posts.has_value()) << posts.error().toString();
            EXPECT_EQ(posts->table(), "posts");
            ASSERT_EQ(posts->relationshipConditions().size(), 1u);
            EXPECT_EQ(posts->relationshipConditions()[0].association, "author");
            const auto stmt = select(*posts);
            EXPECT_EQ(stmt.sql, "SELECT posts.id, posts.user_id, posts.title, posts.score FROM posts INNER JOIN users ON posts.user_id = users.id WHERE users.active = $1 LIMIT 5");
            expectDenseNumbering(stmt);

            auto authors = Query::from("posts").where(Field("title").like("x%")).through(*registry_, "author");
            ASSERT_TRUE(authors.has_value()) << authors.error().toString();
            EXPECT_EQ(select(*authors).sql,
                      "SELECT users.id, users.name, users.email, users.age, users.active, users.created_at FROM users INNER JOIN posts ON users.id = posts.user_id WHERE posts.title LIKE $1");
        }

        TEST_F(SqlCompilerTest, ThroughRejectsWhatItCannotCarry) {
            EXPECT_EQ(Query::from("users").through(*registry_, "followers").error().code, ErrorCode::InvalidRelationship);
            EXPECT_EQ(Query::from("users").through(*registry_, "groups").error().code, ErrorCode::NotImplemented);
            // profiles 没有声明回到 users 的关联
            EXPECT_EQ(Query::from("users").through(*registry_, "profile").error().code, ErrorCode::InvalidRelationship);
            EXPECT_EQ(Query::from("users").whereAny({Field("age").eq(1), Field("age").eq(2)}).through(*registry_, "posts").error().code, ErrorCode::InvalidQuery);
            EXPECT_EQ(Query::from("tags").through(*registry_, "posts").error().code, ErrorCode::InvalidRelationship);
        }

        TEST_F(SqlCompilerTest, WhereRelatedReusesExistingJoin) {
            const auto stmt = select(Query::from("users").join("posts", JoinType::Left).whereRelated("posts", Field("score").greaterThan(2.5)));
            EXPECT_EQ(stmt.sql.find("INNER JOIN"), std::string::npos) << stmt.sql;
            EXPECT_NE(stmt.sql.find("LEFT JOIN posts ON users.id = posts.user_id WHERE posts.score > $1"), std::string::npos) << stmt.sql;
        }

        TEST_F(SqlCompilerTest, UnknownAssociationIsInvalidRelationship) {
            EXPECT_EQ(compiler_.compileSelect(Query::from("users").join("followers")).error().code, ErrorCode::InvalidRelationship);
            EXPECT_EQ(compiler_.compileSelect(Query::from("users").whereRelated("followers", Field("a").eq(1))).error().code, ErrorCode::InvalidRelationship);
            EXPECT_EQ(compiler_.compileSelect(Query::from("users").join("groups")).error().code, ErrorCode::NotImplemented);
        }

        TEST_F(SqlCompilerTest, ExplicitSelectionsPrependPrimaryKey) {
            EXPECT_EQ(select(Query::from("users").select({"name", "createdAt"})).sql, "SELECT id, name, created_at FROM users");
            EXPECT_EQ(select(Query::from("users").select({"id", "name"})).sql, "SELECT id, name FROM users");

            auto bare = bare_.compileSelect(Query::from("events").select({"kind"}));
            ASSERT_TRUE(bare.has_value());
            EXPECT_EQ(bare->sql, "SELECT id, kind FROM events");

            EXPECT_EQ(compiler_.compileSelect(Query::from("users").select({"*", "name"})).error().code, ErrorCode::InvalidQuery);
        }

        TEST_F(SqlCompilerTest, CountUsesSameWhere) {
            auto stmt = compiler_.compileCount(Query::from("users").where(Field("age").greaterThan(30)).orderBy("name").limit(3));
            ASSERT_TRUE(stmt.has_value());
            EXPECT_EQ(stmt->sql, "SELECT COUNT(*) FROM users WHERE age > $1");
        }

        TEST_F(SqlCompilerTest, InsertReturnsRow) {
            auto stmt = compiler_.compileInsert("users", {{"name", SqlValue("alice")}, {"age", SqlValue(30)}});
            ASSERT_TRUE(stmt.has_value());
            EXPECT_EQ(stmt->sql, "INSERT INTO users (name, age) VALUES ($1, $2) RETURNING *");
            EXPECT_EQ(compiler_.compileInsert("users", {})->sql, "INSERT INTO users DEFAULT VALUES RETURNING *");
        }

        TEST_F(SqlCompilerTest, InsertAllBatchesAndReordersColumns) {
            std::vector<ChangeList> rows;
            for (int i = 0; i < 5; ++i) {
                if (i % 2 == 0) {
                    rows.push_back({{"name", SqlValue("u" + std::to_string(i))}, {"age", SqlValue(i)}});
                } else {
                    rows.push_back({{"age", SqlValue(i)}, {"name", SqlValue("u" + std::to_string(i))}});
                }
            }
            auto stmts = compiler_.compileInsertAll("users", rows, 2);
            ASSERT_TRUE(stmts.has_value());
            ASSERT_EQ(stmts->size(), 3u);
            EXPECT_EQ((*stmts)[0].sql, "INSERT INTO users (name, age) VALUES ($1, $2), ($3, $4) RETURNING *");
            EXPECT_EQ((*stmts)[2].sql, "INSERT INTO users (name, age) VALUES ($1, $2) RETURNING *");
            EXPECT_EQ((*stmts)[0].parameters[2], SqlValue("u1"));

            size_t total_params = 0;
            for (const auto &s : *stmts) {
                expectDenseNumbering(s);
                total_params += s.parameters.size();
            }
            EXPECT_EQ(total_params, 10u);
        }

        TEST_F(SqlCompilerTest, InsertAllRequiresSameColumns) {
            std::vector<ChangeList> rows = {{{"name", SqlValue("a")}}, {{"name", SqlValue("b")}, {"age", SqlValue(1)}}};
            auto stmts = compiler_.compileInsertAll("users", rows);
            ASSERT_FALSE(stmts.has_value());
            EXPECT_EQ(stmts.error().code, ErrorCode::InvalidSchema);
        }

        TEST_F(SqlCompilerTest, UpdateAndDelete) {
            auto update = compiler_.compileUpdate("users", "id", SqlValue(7), {{"name", SqlValue("bob")}, {"age", SqlValue(41)}});
            ASSERT_TRUE(update.has_value());
            EXPECT_EQ(update->sql, "UPDATE users SET name = $1, age = $2 WHERE id = $3 RETURNING *");
            EXPECT_EQ(update->parameters.back(), SqlValue(7));
            EXPECT_EQ(compiler_.compileUpdate("users", "id", SqlValue(7), {}).error().code, ErrorCode::InvalidQuery);

            auto del = compiler_.compileDelete("users", "id", SqlValue(7));
            ASSERT_TRUE(del.has_value());
            EXPECT_EQ(del->sql, "DELETE FROM users WHERE id = $1");
        }

        TEST_F(SqlCompilerTest, UpsertWithExplicitUpdateList) {
            UpsertOptions options;
            options.conflict = ConflictTarget::onColumns({"email"});
            options.update_columns = std::vector<std::string>{"name"};
            auto stmt = compiler_.compileUpsert("users", {{"email", SqlValue("a@x.io")}, {"name", SqlValue("A")}, {"age", SqlValue(3)}}, options);
            ASSERT_TRUE(stmt.has_value());
            EXPECT_EQ(stmt->sql, "INSERT INTO users (email, name, age) VALUES ($1, $2, $3) ON CONFLICT (email) DO UPDATE SET name = EXCLUDED.name RETURNING *");
        }

        TEST_F(SqlCompilerTest, UpsertDefaultUpdateListSkipsConflictAndPrimaryKey) {
            UpsertOptions options;
            options.conflict = ConflictTarget::onColumns({"email"});
            auto stmt = compiler_.compileUpsert("users", {{"id", SqlValue(1)}, {"email", SqlValue("a@x.io")}, {"name", SqlValue("A")}}, options);
            ASSERT_TRUE(stmt.has_value());
            EXPECT_EQ(stmt->sql, "INSERT INTO users (id, email, name) VALUES ($1, $2, $3) ON CONFLICT (email) DO UPDATE SET name = EXCLUDED.name RETURNING *");
        }

        TEST_F(SqlCompilerTest, UpsertOnConstraint) {
            UpsertOptions options;
            options.conflict = ConflictTarget::onConstraint("users_email_key");
            auto stmt = compiler_.compileUpsert("users", {{"email", SqlValue("a@x.io")}, {"name", SqlValue("A")}}, options);
            ASSERT_TRUE(stmt.has_value());
            EXPECT_EQ(stmt->sql, "INSERT INTO users (email, name) VALUES ($1, $2) ON CONFLICT ON CONSTRAINT users_email_key DO UPDATE SET email = EXCLUDED.email, name = EXCLUDED.name RETURNING *");
        }

        TEST_F(SqlCompilerTest, UpsertRejectsEmptyOrForeignUpdateList) {
            UpsertOptions options;
            options.conflict = ConflictTarget::onColumns({"email"});
            options.update_columns = std::vector<std::string>{};
            EXPECT_EQ(compiler_.compileUpsert("users", {{"email", SqlValue("a")}}, options).error().code, ErrorCode::InvalidSchema);

            options.update_columns = std::vector<std::string>{"age"};
            EXPECT_EQ(compiler_.compileUpsert("users", {{"email", SqlValue("a")}}, options).error().code, ErrorCode::InvalidSchema);
        }

        TEST_F(SqlCompilerTest, InLookupDeduplicatesAndChunks) {
            std::vector<SqlValue> keys = {SqlValue(1), SqlValue("1"), SqlValue(2), SqlValue(), SqlValue(3), SqlValue(2)};
            auto stmts = compiler_.compileInLookup("posts", "user_id", keys, 2);
            ASSERT_TRUE(stmts.has_value());
            ASSERT_EQ(stmts->size(), 2u);
            EXPECT_EQ((*stmts)[0].sql, "SELECT * FROM posts WHERE user_id IN ($1, $2)");
            EXPECT_EQ((*stmts)[1].sql, "SELECT * FROM posts WHERE user_id IN ($1)");
            EXPECT_EQ((*stmts)[1].parameters.front(), SqlValue(3));

            auto none = compiler_.compileInLookup("posts", "user_id", {SqlValue()}, 2);
            ASSERT_TRUE(none.has_value());
            EXPECT_TRUE(none->empty());
        }

    }  // namespace
}  // namespace pgorm
