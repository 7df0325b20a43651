// PgOrm/Test/scripted_driver.h
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "sqldriver/i_sql_driver.h"
#include "sqldriver/sql_connection_pool.h"
#include "sqldriver/sql_driver_manager.h"

namespace pgorm_test {

    using pgorm_sqldriver::ErrorCategory;
    using pgorm_sqldriver::SqlError;
    using pgorm_sqldriver::SqlRecord;
    using pgorm_sqldriver::SqlValue;

    inline SqlRecord record(const std::vector<std::pair<std::string, SqlValue>> &columns) {
        SqlRecord rec;
        for (const auto &[name, value] : columns) rec.append(name, value);
        return rec;
    }

    // 模拟 libpq 返回的文本值
    inline SqlValue pgText(const std::string &text, const std::string &type_name) {
        SqlValue v(text);
        v.setDriverTypeName(type_name);
        return v;
    }

    struct ScriptedResponse {
        std::vector<SqlRecord> rows;
        long long affected = 0;
        std::optional<SqlError> error;
        std::chrono::milliseconds delay{0};

        static ScriptedResponse withRows(std::vector<SqlRecord> rows) {
            ScriptedResponse r;
            r.affected = static_cast<long long>(rows.size());
            r.rows = std::move(rows);
            return r;
        }
        static ScriptedResponse withAffected(long long n) {
            ScriptedResponse r;
            r.affected = n;
            return r;
        }
        static ScriptedResponse failure(ErrorCategory category, const std::string &message, const std::string &sql_state = "") {
            ScriptedResponse r;
            r.error = SqlError(category, message, "", sql_state);
            return r;
        }
    };

    struct LoggedStatement {
        int connection_id = 0;
        std::string sql;
        std::vector<SqlValue> params;
    };

    class ScriptedDriver;

    // 进程内的假数据库: 按 SQL 片段匹配脚本化的响应, 记录所有语句.
    // 没有匹配的脚本时, 对 BEGIN/COMMIT/ROLLBACK/SAVEPOINT/INSERT/COUNT 有一个最小的事务感知实现
    class ScriptedBackend : public std::enable_shared_from_this<ScriptedBackend> {
      public:
        static std::shared_ptr<ScriptedBackend> create() {
            static std::atomic<int> counter{0};
            auto backend = std::shared_ptr<ScriptedBackend>(new ScriptedBackend("SCRIPTED_" + std::to_string(counter.fetch_add(1))));
            std::weak_ptr<ScriptedBackend> weak = backend;
            pgorm_sqldriver::SqlDriverManager::registerDriver(backend->name_, [weak]() -> std::unique_ptr<pgorm_sqldriver::ISqlDriver> {
                auto self = weak.lock();
                if (!self) return nullptr;
                return self->newDriver();
            });
            return backend;
        }

        ~ScriptedBackend() {
            pgorm_sqldriver::SqlDriverManager::unregisterDriver(name_);
        }

        const std::string &driverName() const {
            return name_;
        }

        // times < 0: 不限次数
        void on(const std::string &fragment, ScriptedResponse response, int times = -1) {
            std::lock_guard<std::mutex> lock(mutex_);
            rules_.push_back({fragment, std::move(response), times});
        }

        void setOpenFails(bool fails) {
            open_fails_.store(fails);
        }

        std::shared_ptr<pgorm_sqldriver::SqlConnectionPool> makePool(size_t max_pool_size = 4, std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds(1000)) {
            pgorm_sqldriver::PoolConfig config;
            config.driver_type = name_;
            config.parameters.setDbName("scripted");
            config.max_pool_size = max_pool_size;
            config.acquire_timeout = acquire_timeout;
            config.log_level = spdlog::level::warn;
            return pgorm_sqldriver::SqlConnectionPool::create(std::move(config));
        }

        std::vector<LoggedStatement> statements() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return log_;
        }

        std::vector<std::string> sqlLog() const {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<std::string> out;
            for (const auto &s : log_) out.push_back(s.sql);
            return out;
        }

        size_t countContaining(const std::string &fragment) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<size_t>(std::count_if(log_.begin(), log_.end(), [&](const LoggedStatement &s) { return s.sql.find(fragment) != std::string::npos; }));
        }

        void clearLog() {
            std::lock_guard<std::mutex> lock(mutex_);
            log_.clear();
        }

        long long committedRows(const std::string &table) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = committed_.find(table);
            return it == committed_.end() ? 0 : it->second;
        }

        void setCommittedRows(const std::string &table, long long n) {
            std::lock_guard<std::mutex> lock(mutex_);
            committed_[table] = n;
        }

        int maxConcurrentStatements() const {
            return max_active_.load();
        }

        int openedConnections() const {
            return next_connection_id_.load();
        }

      private:
        friend class ScriptedDriver;

        struct Rule {
            std::string fragment;
            ScriptedResponse response;
            int remaining;
        };

        explicit ScriptedBackend(std::string name) : name_(std::move(name)) {
        }

        std::unique_ptr<pgorm_sqldriver::ISqlDriver> newDriver();

        std::optional<ScriptedResponse> match(int connection_id, const std::string &sql, const std::vector<SqlValue> &params) {
            std::lock_guard<std::mutex> lock(mutex_);
            log_.push_back({connection_id, sql, params});
            for (auto &rule : rules_) {
                if (rule.remaining == 0 || sql.find(rule.fragment) == std::string::npos) continue;
                if (rule.remaining > 0) --rule.remaining;
                return rule.response;
            }
            return std::nullopt;
        }

        void enter() {
            int now = active_.fetch_add(1) + 1;
            int seen = max_active_.load();
            while (now > seen && !max_active_.compare_exchange_weak(seen, now)) {
            }
        }
        void leave() {
            active_.fetch_sub(1);
        }

        void commit(const std::map<std::string, long long> &pending) {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &[table, n] : pending) committed_[table] += n;
        }

        long long nextId() {
            return next_row_id_.fetch_add(1) + 1;
        }

        std::string name_;
        mutable std::mutex mutex_;
        std::vector<Rule> rules_;
        std::vector<LoggedStatement> log_;
        std::map<std::string, long long> committed_;
        std::atomic<bool> open_fails_{false};
        std::atomic<int> active_{0};
        std::atomic<int> max_active_{0};
        std::atomic<int> next_connection_id_{0};
        std::atomic<long long> next_row_id_{0};
    };

    class ScriptedDriver : public pgorm_sqldriver::ISqlDriver {
      public:
        ScriptedDriver(std::shared_ptr<ScriptedBackend> backend, int id) : backend_(std::move(backend)), id_(id) {
        }

        bool open(const pgorm_sqldriver::ConnectionParameters &) override {
            if (backend_->open_fails_.load()) {
                last_error_ = SqlError(ErrorCategory::Connectivity, "connection refused", "", "08001");
                return false;
            }
            open_ = true;
            last_error_.clear();
            return true;
        }
        void close() override {
            open_ = false;
        }
        bool isOpen() const override {
            return open_;
        }
        bool ping() override {
            return open_;
        }

        bool execute(const std::string &sql, const std::vector<SqlValue> &params, long long *affected_rows) override {
            ScriptedResponse response;
            if (!run(sql, params, response)) return false;
            if (affected_rows) *affected_rows = response.affected;
            return true;
        }

        bool query(const std::string &sql, const std::vector<SqlValue> &params, std::vector<SqlRecord> *rows) override {
            ScriptedResponse response;
            if (!run(sql, params, response)) return false;
            if (rows) *rows = std::move(response.rows);
            return true;
        }

        bool cancel() override {
            return true;
        }
        SqlError lastError() const override {
            return last_error_;
        }
        std::string driverName() const override {
            return backend_->name_;
        }

      private:
        bool run(const std::string &sql, const std::vector<SqlValue> &params, ScriptedResponse &out) {
            if (!open_) {
                last_error_ = SqlError(ErrorCategory::Connectivity, "connection is closed");
                return false;
            }
            backend_->enter();
            auto scripted = backend_->match(id_, sql, params);
            if (scripted && scripted->delay.count() > 0) std::this_thread::sleep_for(scripted->delay);
            backend_->leave();

            if (scripted) {
                if (scripted->error) {
                    last_error_ = *scripted->error;
                    last_error_.setFailedQuery(sql);
                    return false;
                }
                out = *scripted;
            } else {
                builtin(sql, params, out);
            }
            last_error_.clear();
            return true;
        }

        static bool startsWith(const std::string &s, const std::string &prefix) {
            return s.rfind(prefix, 0) == 0;
        }

        static std::string wordAfter(const std::string &sql, const std::string &prefix) {
            std::string rest = sql.substr(prefix.size());
            return rest.substr(0, rest.find_first_of(" ("));
        }

        void builtin(const std::string &sql, const std::vector<SqlValue> &params, ScriptedResponse &out) {
            if (startsWith(sql, "BEGIN")) {
                in_tx_ = true;
                pending_.clear();
                savepoints_.clear();
            } else if (sql == "COMMIT") {
                backend_->commit(pending_);
                resetTx();
            } else if (startsWith(sql, "ROLLBACK TO SAVEPOINT ")) {
                const std::string name = sql.substr(std::string("ROLLBACK TO SAVEPOINT ").size());
                for (auto it = savepoints_.rbegin(); it != savepoints_.rend(); ++it) {
                    if (it->first == name) {
                        pending_ = it->second;
                        break;
                    }
                }
            } else if (sql == "ROLLBACK") {
                resetTx();
            } else if (startsWith(sql, "SAVEPOINT ")) {
                savepoints_.emplace_back(sql.substr(std::string("SAVEPOINT ").size()), pending_);
            } else if (startsWith(sql, "RELEASE SAVEPOINT ")) {
                const std::string name = sql.substr(std::string("RELEASE SAVEPOINT ").size());
                while (!savepoints_.empty()) {
                    bool found = savepoints_.back().first == name;
                    savepoints_.pop_back();
                    if (found) break;
                }
            } else if (startsWith(sql, "INSERT INTO ")) {
                insertRows(sql, params, out);
            } else if (startsWith(sql, "SELECT COUNT(*) FROM ")) {
                const std::string table = wordAfter(sql, "SELECT COUNT(*) FROM ");
                long long n = backend_->committedRows(table);
                if (in_tx_) n += pending_[table];
                out.rows.push_back(record({{"count", SqlValue(n)}}));
            }
        }

        void insertRows(const std::string &sql, const std::vector<SqlValue> &params, ScriptedResponse &out) {
            const std::string table = wordAfter(sql, "INSERT INTO ");
            std::vector<std::string> columns;
            size_t row_count = 1;
            if (sql.find("DEFAULT VALUES") == std::string::npos) {
                const size_t open = sql.find('(');
                const size_t close = sql.find(')', open);
                std::string list = sql.substr(open + 1, close - open - 1);
                size_t start = 0;
                while (start <= list.size()) {
                    size_t comma = list.find(", ", start);
                    columns.push_back(list.substr(start, comma - start));
                    if (comma == std::string::npos) break;
                    start = comma + 2;
                }
                row_count = columns.empty() ? 0 : params.size() / columns.size();
            }
            const bool has_id = std::find(columns.begin(), columns.end(), "id") != columns.end();
            for (size_t r = 0; r < row_count; ++r) {
                SqlRecord rec;
                if (!has_id) rec.append("id", SqlValue(backend_->nextId()));
                for (size_t c = 0; c < columns.size(); ++c) rec.append(columns[c], params[r * columns.size() + c]);
                out.rows.push_back(std::move(rec));
            }
            out.affected = static_cast<long long>(row_count);
            if (in_tx_) {
                pending_[table] += static_cast<long long>(row_count);
            } else {
                std::map<std::string, long long> applied{{table, static_cast<long long>(row_count)}};
                backend_->commit(applied);
            }
        }

        void resetTx() {
            in_tx_ = false;
            pending_.clear();
            savepoints_.clear();
        }

        std::shared_ptr<ScriptedBackend> backend_;
        int id_;
        bool open_ = false;
        SqlError last_error_;
        bool in_tx_ = false;
        std::map<std::string, long long> pending_;
        std::vector<std::pair<std::string, std::map<std::string, long long>>> savepoints_;
    };

    inline std::unique_ptr<pgorm_sqldriver::ISqlDriver> ScriptedBackend::newDriver() {
        return std::make_unique<ScriptedDriver>(shared_from_this(), next_connection_id_.fetch_add(1));
    }

}  // namespace pgorm_test
