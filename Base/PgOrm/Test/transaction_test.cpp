// PgOrm/Test/transaction_test.cpp
#include <gtest/gtest.h>

#include <set>
#include <stdexcept>

#include "pgorm/repo.h"
#include "scripted_driver.h"
#include "test_schema.h"

namespace pgorm {
    namespace {

        using pgorm_sqldriver::TransactionIsolationLevel;
        using pgorm_test::ScriptedResponse;

        class TransactionTest : public ::testing::Test {
          protected:
            void SetUp() override {
                backend_ = pgorm_test::ScriptedBackend::create();
                registry_ = pgorm_test::makeBlogRegistry();
                repo_.emplace(backend_->makePool(4), registry_);
            }

            Changeset newUser(const std::string &name) const {
                Changeset cs(*registry_->find("users"));
                cs.put("name", SqlValue(name)).put("email", SqlValue(name + "@example.com"));
                return cs;
            }

            bool logContains(const std::string &prefix) const {
                for (const auto &sql : backend_->sqlLog()) {
                    if (sql.rfind(prefix, 0) == 0) return true;
                }
                return false;
            }

            std::shared_ptr<pgorm_test::ScriptedBackend> backend_;
            std::shared_ptr<SchemaRegistry> registry_;
            std::optional<Repo> repo_;
        };

        TEST_F(TransactionTest, CommitsOnSuccess) {
            auto result = repo_->transaction([&](Repo &tx) -> std::expected<long long, Error> {
                EXPECT_TRUE(tx.inTransaction());
                auto a = tx.insert(newUser("ann"));
                if (!a) return std::unexpected(a.error());
                auto b = tx.insert(newUser("bob"));
                if (!b) return std::unexpected(b.error());
                return tx.count(Query::from("users"));
            });
            ASSERT_TRUE(result.has_value()) << result.error().toString();
            EXPECT_EQ(*result, 2);
            EXPECT_FALSE(repo_->inTransaction());

            auto log = backend_->sqlLog();
            ASSERT_EQ(log.size(), 5u);
            EXPECT_EQ(log.front(), "BEGIN");
            EXPECT_EQ(log.back(), "COMMIT");

            std::set<int> connections;
            for (const auto &s : backend_->statements()) connections.insert(s.connection_id);
            EXPECT_EQ(connections.size(), 1u);
            EXPECT_EQ(backend_->committedRows("users"), 2);
        }

        TEST_F(TransactionTest, BeginCarriesIsolationLevel) {
            auto result = repo_->transaction([](Repo &) -> std::expected<void, Error> { return {}; }, TransactionIsolationLevel::Serializable);
            ASSERT_TRUE(result.has_value());
            EXPECT_EQ(backend_->sqlLog().front(), "BEGIN ISOLATION LEVEL SERIALIZABLE");
        }

        TEST_F(TransactionTest, ErrorResultRollsBack) {
            auto result = repo_->transaction([&](Repo &tx) -> std::expected<Row, Error> {
                auto a = tx.insert(newUser("ann"));
                if (!a) return a;
                return std::unexpected(Error(ErrorCode::NotFound, "stop"));
            });
            ASSERT_FALSE(result.has_value());
            EXPECT_EQ(result.error().code, ErrorCode::NotFound);
            EXPECT_EQ(backend_->sqlLog().back(), "ROLLBACK");
            EXPECT_EQ(backend_->committedRows("users"), 0);

            auto count = repo_->count(Query::from("users"));
            ASSERT_TRUE(count.has_value());
            EXPECT_EQ(*count, 0);
        }

        TEST_F(TransactionTest, ExceptionRollsBackAndPropagates) {
            EXPECT_THROW(repo_->transaction([&](Repo &tx) -> std::expected<void, Error> {
                auto a = tx.insert(newUser("ann"));
                if (!a) return std::unexpected(a.error());
                throw std::runtime_error("boom");
            }),
                         std::runtime_error);
            EXPECT_EQ(backend_->sqlLog().back(), "ROLLBACK");
            EXPECT_EQ(backend_->committedRows("users"), 0);
        }

        TEST_F(TransactionTest, NestedTransactionJoinsOuter) {
            auto result = repo_->transaction([&](Repo &tx) -> std::expected<void, Error> {
                return tx.transaction([&](Repo &inner) -> std::expected<void, Error> {
                    auto a = inner.insert(newUser("ann"));
                    if (!a) return std::unexpected(a.error());
                    return {};
                });
            });
            ASSERT_TRUE(result.has_value());
            EXPECT_EQ(backend_->countContaining("BEGIN"), 1u);
            EXPECT_EQ(backend_->countContaining("COMMIT"), 1u);
            EXPECT_EQ(backend_->committedRows("users"), 1);
        }

        TEST_F(TransactionTest, FailedSavepointKeepsOuterWork) {
            auto result = repo_->transaction([&](Repo &tx) -> std::expected<void, Error> {
                auto a = tx.insert(newUser("ann"));
                if (!a) return std::unexpected(a.error());
                auto inner = tx.savepoint("bulk", [&](Repo &sp) -> std::expected<void, Error> {
                    auto b = sp.insert(newUser("bob"));
                    if (!b) return std::unexpected(b.error());
                    return std::unexpected(Error(ErrorCode::InvalidChangeset, "bad batch"));
                });
                EXPECT_FALSE(inner.has_value());
                return {};
            });
            ASSERT_TRUE(result.has_value());
            EXPECT_TRUE(logContains("SAVEPOINT sp_bulk_"));
            EXPECT_TRUE(logContains("ROLLBACK TO SAVEPOINT sp_bulk_"));
            EXPECT_TRUE(logContains("RELEASE SAVEPOINT sp_bulk_"));
            EXPECT_EQ(backend_->sqlLog().back(), "COMMIT");
            EXPECT_EQ(backend_->committedRows("users"), 1);
        }

        TEST_F(TransactionTest, SavepointExceptionRollsBackToSavepoint) {
            auto result = repo_->transaction([&](Repo &tx) -> std::expected<void, Error> {
                try {
                    (void)tx.savepoint("risky", [&](Repo &sp) -> std::expected<void, Error> {
                        auto b = sp.insert(newUser("bob"));
                        if (!b) return std::unexpected(b.error());
                        throw std::logic_error("oops");
                    });
                } catch (const std::logic_error &) {
                }
                return {};
            });
            ASSERT_TRUE(result.has_value());
            EXPECT_TRUE(logContains("ROLLBACK TO SAVEPOINT sp_risky_"));
            EXPECT_EQ(backend_->committedRows("users"), 0);
        }

        TEST_F(TransactionTest, SavepointOutsideTransactionOpensOne) {
            auto result = repo_->savepoint("solo", [&](Repo &sp) -> std::expected<Row, Error> { return sp.insert(newUser("ann")); });
            ASSERT_TRUE(result.has_value());
            auto log = backend_->sqlLog();
            ASSERT_EQ(log.size(), 5u);
            EXPECT_EQ(log[0], "BEGIN");
            EXPECT_EQ(log[1].rfind("SAVEPOINT sp_solo_", 0), 0u);
            EXPECT_EQ(log[3].rfind("RELEASE SAVEPOINT sp_solo_", 0), 0u);
            EXPECT_EQ(log[4], "COMMIT");
        }

        TEST_F(TransactionTest, SavepointNameMustBeIdentifier) {
            auto result = repo_->savepoint("x; DROP TABLE users", [](Repo &) -> std::expected<void, Error> { return {}; });
            ASSERT_FALSE(result.has_value());
            EXPECT_EQ(result.error().code, ErrorCode::InvalidQuery);
            EXPECT_EQ(backend_->countContaining("DROP"), 0u);
            EXPECT_EQ(backend_->sqlLog().back(), "ROLLBACK");
        }

        TEST_F(TransactionTest, CommitFailureIsReported) {
            backend_->on("COMMIT", ScriptedResponse::failure(pgorm_sqldriver::ErrorCategory::Transaction, "could not serialize access", "40001"));
            auto result = repo_->transaction([&](Repo &tx) -> std::expected<Row, Error> { return tx.insert(newUser("ann")); });
            ASSERT_FALSE(result.has_value());
            EXPECT_EQ(result.error().code, ErrorCode::DatabaseError);
            EXPECT_EQ(result.error().message.rfind("COMMIT failed: ", 0), 0u);
            EXPECT_EQ(backend_->sqlLog().back(), "ROLLBACK");
            EXPECT_EQ(backend_->committedRows("users"), 0);
        }

        TEST_F(TransactionTest, BeginFailureSkipsWork) {
            backend_->on("BEGIN", ScriptedResponse::failure(pgorm_sqldriver::ErrorCategory::Connectivity, "server closed the connection", "08006"), 1);
            bool called = false;
            auto result = repo_->transaction([&](Repo &) -> std::expected<void, Error> {
                called = true;
                return {};
            });
            ASSERT_FALSE(result.has_value());
            EXPECT_FALSE(called);
        }

        TEST_F(TransactionTest, HandleIsUnusableAfterCommit) {
            std::optional<Repo> escaped;
            auto result = repo_->transaction([&](Repo &tx) -> std::expected<void, Error> {
                escaped.emplace(tx);
                return {};
            });
            ASSERT_TRUE(result.has_value());
            ASSERT_TRUE(escaped.has_value());
            EXPECT_FALSE(escaped->inTransaction());
            auto rows = escaped->all(Query::from("users"));
            ASSERT_FALSE(rows.has_value());
            EXPECT_EQ(rows.error().code, ErrorCode::DatabaseError);
        }

    }  // namespace
}  // namespace pgorm
