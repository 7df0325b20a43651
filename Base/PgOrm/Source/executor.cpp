#include "pgorm/executor.h"

#include <QDebug>

#include "pgorm/value_codec.h"

namespace pgorm {

    Executor::Executor(pgorm_sqldriver::SqlDatabase &db) : db_(db) {
    }

    Error Executor::databaseError(const std::string &sql) const {
        pgorm_sqldriver::SqlError err = db_.lastError();
        std::string message = err.text();
        if (message.empty()) message = "Statement failed.";
        Error error(ErrorCode::DatabaseError, message, sql.empty() ? err.failedQuery() : sql, err.nativeErrorCode());
        error.constraint = err.constraintName();
        return error;
    }

    SqlValue Executor::decodeValue(const SqlValue &raw, std::optional<FieldType> declared_type) {
        if (raw.isNull() || raw.type() != pgorm_sqldriver::SqlValueType::String) return raw;
        std::optional<FieldType> target = declared_type;
        if (!target) target = field_type_for_driver_type(raw.driverTypeName());
        if (!target || *target == FieldType::String) return raw;

        auto decoded = coerce_to_field_type(raw, *target);
        if (!decoded) {
            qWarning() << "pgorm: could not decode" << QString::fromStdString(raw.toString()) << "as" << fieldTypeName(*target) << "(driver type" << QString::fromStdString(raw.driverTypeName()) << "), keeping text.";
            return raw;
        }
        return *decoded;
    }

    Row Executor::decodeRecord(const pgorm_sqldriver::SqlRecord &record, const ModelMeta *meta) {
        std::vector<Row::Column> columns;
        columns.reserve(static_cast<size_t>(record.count()));
        for (int i = 0; i < record.count(); ++i) {
            const std::string name = record.fieldName(i);
            std::optional<FieldType> declared;
            if (meta) {
                if (const FieldMeta *fm = meta->findFieldByDbName(name)) declared = fm->type;
            }
            columns.emplace_back(name, decodeValue(record.value(i), declared));
        }
        return Row(std::move(columns));
    }

    std::expected<std::vector<Row>, Error> Executor::query(const CompiledStatement &statement, const ModelMeta *decode_meta) {
        qDebug().noquote() << "pgorm SQL:" << QString::fromStdString(statement.sql) << "| params:" << statement.parameters.size();
        std::vector<pgorm_sqldriver::SqlRecord> records;
        if (!db_.query(statement.sql, statement.parameters, &records)) {
            return std::unexpected(databaseError(statement.sql));
        }
        std::vector<Row> rows;
        rows.reserve(records.size());
        for (const auto &record : records) {
            rows.push_back(decodeRecord(record, decode_meta));
        }
        return rows;
    }

    std::expected<long long, Error> Executor::execute(const CompiledStatement &statement) {
        qDebug().noquote() << "pgorm SQL:" << QString::fromStdString(statement.sql) << "| params:" << statement.parameters.size();
        long long affected = 0;
        if (!db_.execute(statement.sql, statement.parameters, &affected)) {
            return std::unexpected(databaseError(statement.sql));
        }
        return affected;
    }

    std::expected<long long, Error> Executor::execute(const std::string &sql) {
        return execute(CompiledStatement{sql, {}});
    }

}  // namespace pgorm
