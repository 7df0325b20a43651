// SqlDriver/Source/sql_connection_pool.cpp
#include "sqldriver/sql_connection_pool.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <utility>

#include "sqldriver/sql_driver_manager.h"

namespace pgorm_sqldriver {

    std::shared_ptr<spdlog::logger> PoolConfig::get_or_create_logger(const std::string& logger_name) {
        if (logger) {
            logger->set_level(log_level);
            return logger;
        }
        auto default_logger = spdlog::get(logger_name);
        if (!default_logger) {
            try {
                default_logger = spdlog::stdout_color_mt(logger_name);
                default_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [tid %t] %v");
                default_logger->set_level(log_level);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Logger (" << logger_name << ") initialization failed: " << ex.what() << std::endl;
                return nullptr;
            }
        }
        return default_logger;
    }

    // --- PooledConnection ---

    SqlConnectionPool::PooledConnection::PooledConnection(std::shared_ptr<SqlConnectionPool> pool, std::unique_ptr<SqlDatabase> db) : pool_(std::move(pool)), db_(std::move(db)) {
    }

    SqlConnectionPool::PooledConnection::~PooledConnection() {
        release();
    }

    SqlConnectionPool::PooledConnection::PooledConnection(PooledConnection&& other) noexcept : pool_(std::move(other.pool_)), db_(std::move(other.db_)), healthy_(other.healthy_) {
    }

    SqlConnectionPool::PooledConnection& SqlConnectionPool::PooledConnection::operator=(PooledConnection&& other) noexcept {
        if (this != &other) {
            release();
            pool_ = std::move(other.pool_);
            db_ = std::move(other.db_);
            healthy_ = other.healthy_;
        }
        return *this;
    }

    SqlDatabase& SqlConnectionPool::PooledConnection::operator*() const {
        return *db_;
    }

    SqlDatabase* SqlConnectionPool::PooledConnection::operator->() const {
        return db_.get();
    }

    SqlDatabase* SqlConnectionPool::PooledConnection::get() const {
        return db_.get();
    }

    SqlConnectionPool::PooledConnection::operator bool() const {
        return db_ != nullptr;
    }

    void SqlConnectionPool::PooledConnection::markBroken() {
        healthy_ = false;
    }

    void SqlConnectionPool::PooledConnection::release() {
        if (pool_ && db_) {
            pool_->releaseConnection(std::move(db_), healthy_);
        }
        db_.reset();
        pool_.reset();
        healthy_ = true;
    }

    // --- SqlConnectionPool ---

    std::shared_ptr<SqlConnectionPool> SqlConnectionPool::create(PoolConfig config) {
        return std::shared_ptr<SqlConnectionPool>(new SqlConnectionPool(std::move(config)));
    }

    SqlConnectionPool::SqlConnectionPool(PoolConfig config) : config_(std::move(config)) {
        config_.logger = config_.get_or_create_logger();
        if (config_.max_pool_size == 0) config_.max_pool_size = 1;
    }

    SqlConnectionPool::~SqlConnectionPool() {
        close();
    }

    std::pair<SqlError, std::unique_ptr<SqlDatabase>> SqlConnectionPool::openNewConnection() {
        std::string name;
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            name = config_.connection_name_prefix + "_" + std::to_string(next_connection_id_++);
        }
        auto db = std::make_unique<SqlDatabase>(SqlDriverManager::createDatabase(config_.driver_type, name));
        if (!db->isValid()) {
            return {db->lastError(), nullptr};
        }
        if (!db->open(config_.parameters)) {
            SqlError err = db->lastError();
            if (!err.isValid()) err = SqlError(ErrorCategory::Connectivity, "", "Failed to open connection '" + name + "'.");
            return {err, nullptr};
        }
        return {SqlError(), std::move(db)};
    }

    std::pair<SqlError, SqlConnectionPool::PooledConnection> SqlConnectionPool::acquire() {
        if (closing_.load(std::memory_order_acquire)) {
            if (config_.logger) config_.logger->warn("[Pool] Acquire attempt on closing pool.");
            return {SqlError(ErrorCategory::Resource, "", "Connection pool is closed."), PooledConnection()};
        }

        std::unique_lock<std::mutex> lock(pool_mutex_);
        auto start_time = std::chrono::steady_clock::now();

        while (true) {
            while (!idle_connections_.empty()) {
                std::unique_ptr<SqlDatabase> conn = std::move(idle_connections_.front());
                idle_connections_.pop_front();

                if (conn && conn->isOpen()) {
                    if (config_.logger) config_.logger->debug("[Pool] Reusing idle connection '{}'", conn->connectionName());
                    return {SqlError(), PooledConnection(shared_from_this(), std::move(conn))};
                }
                if (config_.logger) config_.logger->info("[Pool] Dropping closed idle connection '{}'.", conn ? conn->connectionName() : std::string("<null>"));
                total_connections_created_--;
            }

            if (total_connections_created_ < config_.max_pool_size) {
                // 先占位, 建立连接时不持锁
                total_connections_created_++;
                lock.unlock();
                auto [open_err, new_conn] = openNewConnection();
                lock.lock();

                if (!new_conn) {
                    total_connections_created_--;
                    pool_condition_.notify_one();
                    if (config_.logger) config_.logger->error("[Pool] Failed to establish new connection: {}", open_err.text());
                    return {open_err, PooledConnection()};
                }
                if (closing_.load(std::memory_order_acquire)) {
                    total_connections_created_--;
                    new_conn->close();
                    if (config_.logger) config_.logger->warn("[Pool] Pool closing during new connection establishment.");
                    return {SqlError(ErrorCategory::Resource, "", "Connection pool is closed."), PooledConnection()};
                }
                if (config_.logger) config_.logger->info("[Pool] New connection '{}' established ({}/{}).", new_conn->connectionName(), total_connections_created_, config_.max_pool_size);
                return {SqlError(), PooledConnection(shared_from_this(), std::move(new_conn))};
            }

            auto time_waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time);
            auto remaining_timeout_ms = config_.acquire_timeout - time_waited;

            if (remaining_timeout_ms <= std::chrono::milliseconds(0)) {
                if (config_.logger) config_.logger->error("[Pool] Timed out waiting for a connection (Max pool size: {}).", config_.max_pool_size);
                return {SqlError(ErrorCategory::Resource, "", "pool exhausted"), PooledConnection()};
            }

            if (config_.logger) config_.logger->trace("[Pool] Pool full ({}/{}), waiting for {}ms.", total_connections_created_, config_.max_pool_size, remaining_timeout_ms.count());

            pool_condition_.wait_for(lock, remaining_timeout_ms, [this] {
                return closing_.load(std::memory_order_relaxed) || !idle_connections_.empty() || total_connections_created_ < config_.max_pool_size;
            });
            if (closing_.load(std::memory_order_acquire)) {
                if (config_.logger) config_.logger->warn("[Pool] Woken up by closing pool during wait.");
                return {SqlError(ErrorCategory::Resource, "", "Connection pool is closed."), PooledConnection()};
            }
        }
    }

    void SqlConnectionPool::releaseConnection(std::unique_ptr<SqlDatabase> db, bool mark_as_healthy) {
        if (!db) return;

        if (closing_.load(std::memory_order_acquire)) {
            if (config_.logger) config_.logger->debug("[Pool] Releasing '{}' during pool close, closing it.", db->connectionName());
            db->close();
            std::lock_guard<std::mutex> lock(pool_mutex_);
            total_connections_created_--;
            return;
        }

        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!mark_as_healthy || !db->isOpen()) {
            if (config_.logger) config_.logger->info("[Pool] Releasing unhealthy connection '{}', closing it.", db->connectionName());
            db->close();
            total_connections_created_--;
            pool_condition_.notify_one();
            return;
        }
        idle_connections_.push_back(std::move(db));
        pool_condition_.notify_one();
    }

    void SqlConnectionPool::close() {
        if (closing_.exchange(true, std::memory_order_acq_rel)) return;
        std::deque<std::unique_ptr<SqlDatabase>> to_close;
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            to_close.swap(idle_connections_);
            total_connections_created_ -= to_close.size();
        }
        pool_condition_.notify_all();
        for (auto& db : to_close) {
            if (db) db->close();
        }
        if (config_.logger) config_.logger->debug("[Pool] Closed {} idle connection(s).", to_close.size());
    }

    size_t SqlConnectionPool::idleCount() const {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        return idle_connections_.size();
    }

    size_t SqlConnectionPool::totalCount() const {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        return total_connections_created_;
    }

    size_t SqlConnectionPool::maxPoolSize() const {
        return config_.max_pool_size;
    }

    bool SqlConnectionPool::isClosing() const {
        return closing_.load(std::memory_order_acquire);
    }

}  // namespace pgorm_sqldriver
