// SqlDriver/Include/sqldriver/i_sql_driver.h
#pragma once
#include <string>
#include <vector>

#include "sqldriver/sql_connection_parameters.h"
#include "sqldriver/sql_error.h"
#include "sqldriver/sql_record.h"
#include "sqldriver/sql_value.h"

namespace pgorm_sqldriver {

    // 数据库驱动接口. 一个实例对应一条物理连接, 同一时刻只能被一个线程使用
    // (cancel() 除外). 失败时返回 false, 详细信息通过 lastError() 获取.
    class ISqlDriver {
      public:
        virtual ~ISqlDriver() = default;

        virtual bool open(const ConnectionParameters& params) = 0;
        virtual void close() = 0;
        virtual bool isOpen() const = 0;
        virtual bool ping() = 0;

        // 参数以 $1..$n 占位符绑定. affected_rows 可以为 nullptr
        virtual bool execute(const std::string& sql, const std::vector<SqlValue>& params, long long* affected_rows) = 0;
        // 执行返回结果集的语句 (SELECT, ... RETURNING)
        virtual bool query(const std::string& sql, const std::vector<SqlValue>& params, std::vector<SqlRecord>* rows) = 0;

        // 可从其他线程调用, 请求中止当前正在执行的语句
        virtual bool cancel() = 0;

        virtual SqlError lastError() const = 0;
        virtual std::string driverName() const = 0;

      protected:
        ISqlDriver() = default;

      private:
        ISqlDriver(const ISqlDriver&) = delete;
        ISqlDriver& operator=(const ISqlDriver&) = delete;
    };

}  // namespace pgorm_sqldriver
