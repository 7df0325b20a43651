// SqlDriver/Include/sqldriver/sql_database.h
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "sqldriver/i_sql_driver.h"
#include "sqldriver/sql_connection_parameters.h"
#include "sqldriver/sql_error.h"
#include "sqldriver/sql_record.h"
#include "sqldriver/sql_value.h"

namespace pgorm_sqldriver {

    class SqlDatabase {
      public:
        // SqlDatabase 的构造函数由 SqlDriverManager 调用
        // 用户通常不直接构造 SqlDatabase 对象
        ~SqlDatabase();

        SqlDatabase(SqlDatabase&& other) noexcept;
        SqlDatabase& operator=(SqlDatabase&& other) noexcept;

        // 连接管理
        bool open(const ConnectionParameters& params);
        bool open();  // 使用已存储的参数打开
        void close();
        bool isOpen() const;
        bool isValid() const;  // 检查驱动是否已成功加载
        bool ping();

        // 语句执行
        bool execute(const std::string& sql, const std::vector<SqlValue>& params = {}, long long* affected_rows = nullptr);
        bool query(const std::string& sql, const std::vector<SqlValue>& params, std::vector<SqlRecord>* rows);
        bool cancel();

        std::string driverName() const;
        const std::string& connectionName() const;
        const ConnectionParameters& connectionParameters() const;
        SqlError lastError() const;

        ISqlDriver* driver() const;

      private:
        friend class SqlDriverManager;
        SqlDatabase(const std::string& driver_type, const std::string& connection_name, std::unique_ptr<ISqlDriver> driver);

        SqlDatabase(const SqlDatabase&) = delete;
        SqlDatabase& operator=(const SqlDatabase&) = delete;

        void updateLastErrorFromDriver();

        std::string driver_type_;
        std::string connection_name_;
        std::unique_ptr<ISqlDriver> driver_;
        ConnectionParameters parameters_;
        SqlError last_error_;
    };

}  // namespace pgorm_sqldriver
