// SqlDriver/Source/sql_driver_manager.cpp
#include "sqldriver/sql_driver_manager.h"

#include <exception>
#include <utility>

namespace pgorm_sqldriver {

    // --- Static Data Accessor ---
    SqlDriverManager::ManagerData& SqlDriverManager::data() {
        static ManagerData manager_data;  // C++11 guarantees thread-safe initialization
        return manager_data;
    }

    void SqlDriverManager::registerDriver(const std::string& name, DriverFactory factory) {
        std::lock_guard<std::mutex> lock(data().managerMutex);
        data().driverFactories[name] = std::move(factory);
    }

    void SqlDriverManager::unregisterDriver(const std::string& name) {
        std::lock_guard<std::mutex> lock(data().managerMutex);
        data().driverFactories.erase(name);
    }

    bool SqlDriverManager::isDriverAvailable(const std::string& name) {
        std::lock_guard<std::mutex> lock(data().managerMutex);
        return data().driverFactories.count(name) > 0;
    }

    std::vector<std::string> SqlDriverManager::drivers() {
        std::lock_guard<std::mutex> lock(data().managerMutex);
        std::vector<std::string> names;
        names.reserve(data().driverFactories.size());
        for (const auto& pair : data().driverFactories) {
            names.push_back(pair.first);
        }
        return names;
    }

    SqlDatabase SqlDriverManager::createDatabase(const std::string& driver_type, const std::string& connection_name) {
        DriverFactory factory_to_call;
        {  // Scope for lock
            std::lock_guard<std::mutex> lock(data().managerMutex);
            auto factory_it = data().driverFactories.find(driver_type);
            if (factory_it == data().driverFactories.end()) {
                // Driver type not registered, return SqlDatabase that will be invalid
                return SqlDatabase(driver_type, connection_name, nullptr);
            }
            factory_to_call = factory_it->second;
        }  // Mutex released here

        std::unique_ptr<ISqlDriver> driver_instance;
        std::string factory_failure;
        if (factory_to_call) {
            try {
                driver_instance = factory_to_call();  // Call factory outside the lock
            } catch (const std::exception& e) {
                factory_failure = e.what();
            }
        }

        SqlDatabase db(driver_type, connection_name, std::move(driver_instance));
        if (!factory_failure.empty()) {
            db.last_error_ = SqlError(ErrorCategory::DriverInternal, "", "Driver factory for '" + driver_type + "' threw: " + factory_failure);
        }
        return db;
    }

}  // namespace pgorm_sqldriver
