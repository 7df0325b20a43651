// SqlDriver/Include/sqldriver/sql_driver_manager.h
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqldriver/i_sql_driver.h"
#include "sqldriver/sql_database.h"

namespace pgorm_sqldriver {

    using DriverFactory = std::function<std::unique_ptr<ISqlDriver>()>;

    // 进程内唯一的驱动工厂注册表
    class SqlDriverManager {
      public:
        static void registerDriver(const std::string& name, DriverFactory factory);
        static void unregisterDriver(const std::string& name);
        static bool isDriverAvailable(const std::string& name);
        static std::vector<std::string> drivers();

        // 创建一个尚未打开的连接对象; 驱动不存在时 isValid() 为 false
        static SqlDatabase createDatabase(const std::string& driver_type, const std::string& connection_name);

      private:
        SqlDriverManager() = delete;

        struct ManagerData {
            std::mutex managerMutex;
            std::map<std::string, DriverFactory> driverFactories;
        };
        static ManagerData& data();
    };

}  // namespace pgorm_sqldriver
