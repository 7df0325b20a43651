// SqlDriver/Include/sqldriver/postgres/pg_specific_driver.h
#pragma once
#include <libpq-fe.h>

#include <mutex>
#include <string>
#include <vector>

#include "sqldriver/i_sql_driver.h"
#include "sqldriver/sql_connection_parameters.h"
#include "sqldriver/sql_error.h"
#include "sqldriver/sql_record.h"
#include "sqldriver/sql_value.h"

namespace pgorm_sqldriver {

    // 注册到 SqlDriverManager 时使用的名称
    inline constexpr const char* POSTGRES_DRIVER_NAME = "POSTGRES";

    class PgSpecificDriver : public ISqlDriver {
      public:
        PgSpecificDriver();
        ~PgSpecificDriver() override;

        bool open(const ConnectionParameters& params) override;
        void close() override;
        bool isOpen() const override;
        bool ping() override;

        bool execute(const std::string& sql, const std::vector<SqlValue>& params, long long* affected_rows) override;
        bool query(const std::string& sql, const std::vector<SqlValue>& params, std::vector<SqlRecord>* rows) override;
        bool cancel() override;

        SqlError lastError() const override;
        std::string driverName() const override;

        PGconn* nativeHandle() const;

      private:
        // 执行语句并返回 PGresult, 失败时设置 last_error_ 并返回 nullptr
        PGresult* run(const std::string& sql, const std::vector<SqlValue>& params);
        void setErrorFromConnection(ErrorCategory fallback, const std::string& driver_text, const std::string& failed_query);
        void setErrorFromResult(const PGresult* result, const std::string& failed_query);

        PGconn* conn_ = nullptr;
        // 保护 conn_ 在 cancel() 与 close() 之间的访问
        mutable std::mutex cancel_mutex_;
        SqlError last_error_;
    };

    // 注册 "POSTGRES" 驱动工厂
    void PgDriver_Initialize();

}  // namespace pgorm_sqldriver
