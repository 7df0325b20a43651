// SqlDriver/Source/sql_value_conversions.cpp
#include <QRegularExpression>
#include <QTimeZone>
#include <cmath>
#include <limits>
#include <string>

#include "sqldriver/sql_value.h"

namespace pgorm_sqldriver {

    namespace {
        void set_ok(bool* ok, bool value) {
            if (ok) *ok = value;
        }

        // PostgreSQL 的文本格式: "2024-01-02 03:04:05.123+00"
        QDateTime parse_timestamp_text(const std::string& raw) {
            QString text = QString::fromStdString(raw).trimmed();
            if (text.size() > 10 && text.at(10) == QLatin1Char(' ')) {
                text[10] = QLatin1Char('T');
            }
            static const QRegularExpression short_offset(QStringLiteral("[+-]\\d{2}$"));
            if (text.size() > 10 && short_offset.match(text).hasMatch()) {
                text += QStringLiteral(":00");
            }
            QDateTime dt = QDateTime::fromString(text, Qt::ISODateWithMs);
            if (!dt.isValid()) {
                dt = QDateTime::fromString(text, Qt::ISODate);
            }
            return dt;
        }
    }  // namespace

    bool SqlValue::toBool(bool* ok) const {
        set_ok(ok, true);
        switch (type_) {
            case SqlValueType::Bool:
                return std::get<bool>(storage_);
            case SqlValueType::Int64:
                return std::get<int64_t>(storage_) != 0;
            case SqlValueType::Double:
                return std::get<double>(storage_) != 0.0;
            case SqlValueType::String: {
                const std::string& s = std::get<std::string>(storage_);
                if (s == "t" || s == "true" || s == "TRUE" || s == "1" || s == "yes" || s == "on") return true;
                if (s == "f" || s == "false" || s == "FALSE" || s == "0" || s == "no" || s == "off") return false;
                break;
            }
            default:
                break;
        }
        set_ok(ok, false);
        return false;
    }

    int64_t SqlValue::toInt64(bool* ok) const {
        set_ok(ok, true);
        switch (type_) {
            case SqlValueType::Int64:
                return std::get<int64_t>(storage_);
            case SqlValueType::Bool:
                return std::get<bool>(storage_) ? 1 : 0;
            case SqlValueType::Double: {
                double d = std::get<double>(storage_);
                if (std::isfinite(d) && std::trunc(d) == d && d >= static_cast<double>(std::numeric_limits<int64_t>::min()) && d <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
                    return static_cast<int64_t>(d);
                }
                break;
            }
            case SqlValueType::String: {
                bool conv_ok = false;
                qlonglong v = QString::fromStdString(std::get<std::string>(storage_)).trimmed().toLongLong(&conv_ok);
                if (conv_ok) return static_cast<int64_t>(v);
                break;
            }
            default:
                break;
        }
        set_ok(ok, false);
        return 0;
    }

    double SqlValue::toDouble(bool* ok) const {
        set_ok(ok, true);
        switch (type_) {
            case SqlValueType::Double:
                return std::get<double>(storage_);
            case SqlValueType::Int64:
                return static_cast<double>(std::get<int64_t>(storage_));
            case SqlValueType::Bool:
                return std::get<bool>(storage_) ? 1.0 : 0.0;
            case SqlValueType::String: {
                bool conv_ok = false;
                double v = QString::fromStdString(std::get<std::string>(storage_)).trimmed().toDouble(&conv_ok);
                if (conv_ok) return v;
                break;
            }
            default:
                break;
        }
        set_ok(ok, false);
        return 0.0;
    }

    std::string SqlValue::toString(bool* ok) const {
        set_ok(ok, true);
        switch (type_) {
            case SqlValueType::Null:
                set_ok(ok, false);
                return std::string();
            case SqlValueType::Bool:
                return std::get<bool>(storage_) ? "true" : "false";
            case SqlValueType::Int64:
                return std::to_string(std::get<int64_t>(storage_));
            case SqlValueType::Double:
                return QByteArray::number(std::get<double>(storage_), 'g', 17).toStdString();
            case SqlValueType::String:
                return std::get<std::string>(storage_);
            case SqlValueType::ByteArray: {
                const QByteArray& bytes = std::get<QByteArray>(storage_);
                return std::string(bytes.constData(), static_cast<size_t>(bytes.size()));
            }
            case SqlValueType::Uuid:
                return std::get<QUuid>(storage_).toString(QUuid::WithoutBraces).toStdString();
            case SqlValueType::DateTime:
                return std::get<QDateTime>(storage_).toString(Qt::ISODateWithMs).toStdString();
        }
        set_ok(ok, false);
        return std::string();
    }

    QByteArray SqlValue::toByteArray(bool* ok) const {
        set_ok(ok, true);
        switch (type_) {
            case SqlValueType::ByteArray:
                return std::get<QByteArray>(storage_);
            case SqlValueType::String: {
                const std::string& s = std::get<std::string>(storage_);
                // bytea 的十六进制输出格式
                if (s.size() >= 2 && s[0] == '\\' && s[1] == 'x') {
                    return QByteArray::fromHex(QByteArray::fromRawData(s.data() + 2, static_cast<qsizetype>(s.size() - 2)));
                }
                return QByteArray(s.data(), static_cast<qsizetype>(s.size()));
            }
            default:
                break;
        }
        set_ok(ok, false);
        return QByteArray();
    }

    QUuid SqlValue::toUuid(bool* ok) const {
        set_ok(ok, true);
        switch (type_) {
            case SqlValueType::Uuid:
                return std::get<QUuid>(storage_);
            case SqlValueType::String: {
                QUuid uuid = QUuid::fromString(QString::fromStdString(std::get<std::string>(storage_)).trimmed());
                if (!uuid.isNull()) return uuid;
                break;
            }
            case SqlValueType::ByteArray: {
                const QByteArray& bytes = std::get<QByteArray>(storage_);
                if (bytes.size() == 16) return QUuid::fromRfc4122(bytes);
                break;
            }
            default:
                break;
        }
        set_ok(ok, false);
        return QUuid();
    }

    QDateTime SqlValue::toDateTime(bool* ok) const {
        set_ok(ok, true);
        switch (type_) {
            case SqlValueType::DateTime:
                return std::get<QDateTime>(storage_);
            case SqlValueType::String: {
                QDateTime dt = parse_timestamp_text(std::get<std::string>(storage_));
                if (dt.isValid()) return dt;
                break;
            }
            case SqlValueType::Int64:
                return QDateTime::fromMSecsSinceEpoch(std::get<int64_t>(storage_), QTimeZone::utc());
            default:
                break;
        }
        set_ok(ok, false);
        return QDateTime();
    }

    std::string SqlValue::toDebugString() const {
        switch (type_) {
            case SqlValueType::Null:
                return "NULL";
            case SqlValueType::String:
                return "'" + std::get<std::string>(storage_) + "'";
            case SqlValueType::ByteArray:
                return "<bytes:" + std::to_string(std::get<QByteArray>(storage_).size()) + ">";
            default:
                return toString();
        }
    }

}  // namespace pgorm_sqldriver
