// SqlDriver/Source/postgres/pg_specific_driver_core.cpp
#include <cstdlib>
#include <memory>
#include <optional>

#include "sqldriver/postgres/pg_specific_driver.h"
#include "sqldriver/postgres/pg_value_converter.h"
#include "sqldriver/sql_driver_manager.h"

namespace pgorm_sqldriver {

    namespace {
        using PgResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;

        std::string trimmed_libpq_message(const char* msg) {
            std::string s = msg ? msg : "";
            while (!s.empty() && (s.back() == '\n' || s.back() == ' ')) s.pop_back();
            return s;
        }

        std::string result_field(const PGresult* result, int field_code) {
            const char* v = PQresultErrorField(result, field_code);
            return v ? std::string(v) : std::string();
        }
    }  // namespace

    PgSpecificDriver::PgSpecificDriver() = default;

    PgSpecificDriver::~PgSpecificDriver() {
        close();
    }

    bool PgSpecificDriver::open(const ConnectionParameters& params) {
        close();
        last_error_.clear();

        // libpq 需要以 nullptr 结尾的 keyword/value 数组
        std::vector<std::string> keys;
        std::vector<std::string> values;
        auto add = [&](const char* key, const std::optional<std::string>& value) {
            if (value && !value->empty()) {
                keys.emplace_back(key);
                values.push_back(*value);
            }
        };
        add("host", params.hostName());
        if (auto port = params.port()) add("port", std::to_string(*port));
        add("dbname", params.dbName());
        add("user", params.userName());
        add("password", params.password());
        add("application_name", params.applicationName());
        add("sslmode", params.sslMode());
        if (auto timeout = params.connectionTimeoutSeconds()) add("connect_timeout", std::to_string(*timeout));

        std::string options = params.connectOptions().value_or("");
        if (auto statement_timeout = params.statementTimeoutMs()) {
            if (!options.empty()) options += " ";
            options += "-c statement_timeout=" + std::to_string(*statement_timeout);
        }
        add("options", options);

        std::vector<const char*> key_ptrs;
        std::vector<const char*> value_ptrs;
        for (size_t i = 0; i < keys.size(); ++i) {
            key_ptrs.push_back(keys[i].c_str());
            value_ptrs.push_back(values[i].c_str());
        }
        key_ptrs.push_back(nullptr);
        value_ptrs.push_back(nullptr);

        PGconn* conn = PQconnectdbParams(key_ptrs.data(), value_ptrs.data(), 0);
        if (!conn) {
            last_error_ = SqlError(ErrorCategory::Resource, "", "PQconnectdbParams returned null (out of memory).");
            return false;
        }
        if (PQstatus(conn) != CONNECTION_OK) {
            last_error_ = SqlError(ErrorCategory::Connectivity, trimmed_libpq_message(PQerrorMessage(conn)), "Failed to connect to PostgreSQL server.");
            PQfinish(conn);
            return false;
        }

        std::lock_guard<std::mutex> lock(cancel_mutex_);
        conn_ = conn;
        return true;
    }

    void PgSpecificDriver::close() {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
    }

    bool PgSpecificDriver::isOpen() const {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
    }

    bool PgSpecificDriver::ping() {
        PgResultPtr result(run("SELECT 1", {}), &PQclear);
        return result != nullptr;
    }

    void PgSpecificDriver::setErrorFromConnection(ErrorCategory fallback, const std::string& driver_text, const std::string& failed_query) {
        ErrorCategory category = fallback;
        std::string db_text;
        if (conn_) {
            db_text = trimmed_libpq_message(PQerrorMessage(conn_));
            if (PQstatus(conn_) == CONNECTION_BAD) category = ErrorCategory::Connectivity;
        }
        last_error_ = SqlError(category, db_text, driver_text, "", failed_query);
    }

    void PgSpecificDriver::setErrorFromResult(const PGresult* result, const std::string& failed_query) {
        std::string sql_state = result_field(result, PG_DIAG_SQLSTATE);
        std::string primary = result_field(result, PG_DIAG_MESSAGE_PRIMARY);
        if (primary.empty()) primary = trimmed_libpq_message(PQresultErrorMessage(result));
        ErrorCategory category = pg_helper::categoryForSqlState(sql_state);
        if (category == ErrorCategory::Unknown && conn_ && PQstatus(conn_) == CONNECTION_BAD) category = ErrorCategory::Connectivity;
        last_error_ = SqlError(category, primary, "PostgreSQL statement failed.", sql_state, failed_query, result_field(result, PG_DIAG_CONSTRAINT_NAME));
    }

    PGresult* PgSpecificDriver::run(const std::string& sql, const std::vector<SqlValue>& params) {
        last_error_.clear();
        if (!conn_) {
            last_error_ = SqlError(ErrorCategory::Connectivity, "", "Connection is not open.", "", sql);
            return nullptr;
        }

        std::vector<std::optional<std::string>> texts;
        texts.reserve(params.size());
        for (const auto& p : params) {
            texts.push_back(pg_helper::toTextParameter(p));
        }
        std::vector<const char*> value_ptrs;
        value_ptrs.reserve(texts.size());
        for (const auto& t : texts) {
            value_ptrs.push_back(t ? t->c_str() : nullptr);
        }

        PGresult* result = PQexecParams(conn_, sql.c_str(), static_cast<int>(value_ptrs.size()), nullptr, value_ptrs.empty() ? nullptr : value_ptrs.data(), nullptr, nullptr, 0);
        if (!result) {
            setErrorFromConnection(ErrorCategory::DriverInternal, "PQexecParams returned no result.", sql);
            return nullptr;
        }
        ExecStatusType status = PQresultStatus(result);
        if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
            setErrorFromResult(result, sql);
            PQclear(result);
            return nullptr;
        }
        return result;
    }

    bool PgSpecificDriver::execute(const std::string& sql, const std::vector<SqlValue>& params, long long* affected_rows) {
        PgResultPtr result(run(sql, params), &PQclear);
        if (!result) return false;
        if (affected_rows) {
            const char* tuples = PQcmdTuples(result.get());
            *affected_rows = (tuples && *tuples) ? std::strtoll(tuples, nullptr, 10) : 0;
        }
        return true;
    }

    bool PgSpecificDriver::query(const std::string& sql, const std::vector<SqlValue>& params, std::vector<SqlRecord>* rows) {
        PgResultPtr result(run(sql, params), &PQclear);
        if (!result) return false;
        if (!rows) return true;

        const int row_count = PQntuples(result.get());
        const int col_count = PQnfields(result.get());
        std::vector<std::string> names;
        std::vector<std::string> type_names;
        for (int c = 0; c < col_count; ++c) {
            names.emplace_back(PQfname(result.get(), c));
            type_names.push_back(pg_helper::typeNameForOid(PQftype(result.get(), c)));
        }

        rows->reserve(rows->size() + static_cast<size_t>(row_count));
        for (int r = 0; r < row_count; ++r) {
            SqlRecord record;
            for (int c = 0; c < col_count; ++c) {
                SqlValue v;
                if (!PQgetisnull(result.get(), r, c)) {
                    v = SqlValue(std::string(PQgetvalue(result.get(), r, c), static_cast<size_t>(PQgetlength(result.get(), r, c))));
                }
                v.setDriverTypeName(type_names[static_cast<size_t>(c)]);
                record.append(names[static_cast<size_t>(c)], std::move(v));
            }
            rows->push_back(std::move(record));
        }
        return true;
    }

    bool PgSpecificDriver::cancel() {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        if (!conn_) return false;
        PGcancel* handle = PQgetCancel(conn_);
        if (!handle) return false;
        char errbuf[256] = {0};
        int ok = PQcancel(handle, errbuf, sizeof(errbuf));
        PQfreeCancel(handle);
        return ok == 1;
    }

    SqlError PgSpecificDriver::lastError() const {
        return last_error_;
    }

    std::string PgSpecificDriver::driverName() const {
        return POSTGRES_DRIVER_NAME;
    }

    PGconn* PgSpecificDriver::nativeHandle() const {
        return conn_;
    }

    // 驱动初始化函数定义
    void PgDriver_Initialize() {
        SqlDriverManager::registerDriver(POSTGRES_DRIVER_NAME, []() -> std::unique_ptr<ISqlDriver> {
            return std::make_unique<PgSpecificDriver>();
        });
    }

}  // namespace pgorm_sqldriver
