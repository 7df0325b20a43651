// SqlDriver/Test/sql_value_test.cpp
#include <gtest/gtest.h>

#include <QDateTime>
#include <QTimeZone>
#include <QUuid>

#include "sqldriver/sql_record.h"
#include "sqldriver/sql_value.h"

namespace pgorm_sqldriver {
    namespace {

        TEST(SqlValueTest, DefaultIsNull) {
            SqlValue v;
            EXPECT_TRUE(v.isNull());
            EXPECT_EQ(v.type(), SqlValueType::Null);
            EXPECT_EQ(v.toDebugString(), "NULL");
        }

        TEST(SqlValueTest, IntegralConstructorsStoreInt64) {
            EXPECT_EQ(SqlValue(42).type(), SqlValueType::Int64);
            EXPECT_EQ(SqlValue(static_cast<short>(7)).toInt64(), 7);
            EXPECT_EQ(SqlValue(9000000000LL).toInt64(), 9000000000LL);
            EXPECT_EQ(SqlValue(true).type(), SqlValueType::Bool);
        }

        TEST(SqlValueTest, PostgresBooleanText) {
            bool ok = false;
            EXPECT_TRUE(SqlValue("t").toBool(&ok));
            EXPECT_TRUE(ok);
            EXPECT_FALSE(SqlValue("f").toBool(&ok));
            EXPECT_TRUE(ok);
            SqlValue("maybe").toBool(&ok);
            EXPECT_FALSE(ok);
        }

        TEST(SqlValueTest, NumericTextConversions) {
            bool ok = false;
            EXPECT_EQ(SqlValue("  123 ").toInt64(&ok), 123);
            EXPECT_TRUE(ok);
            EXPECT_DOUBLE_EQ(SqlValue("2.5").toDouble(&ok), 2.5);
            EXPECT_TRUE(ok);
            SqlValue("abc").toInt64(&ok);
            EXPECT_FALSE(ok);
            EXPECT_EQ(SqlValue(3.0).toInt64(&ok), 3);
            EXPECT_TRUE(ok);
            SqlValue(3.5).toInt64(&ok);
            EXPECT_FALSE(ok);
        }

        TEST(SqlValueTest, ByteaHexText) {
            bool ok = false;
            QByteArray bytes = SqlValue("\\x0102ff").toByteArray(&ok);
            EXPECT_TRUE(ok);
            ASSERT_EQ(bytes.size(), 3);
            EXPECT_EQ(static_cast<unsigned char>(bytes[2]), 0xff);
        }

        TEST(SqlValueTest, UuidText) {
            const QUuid id = QUuid::createUuid();
            bool ok = false;
            EXPECT_EQ(SqlValue(id.toString(QUuid::WithoutBraces).toStdString()).toUuid(&ok), id);
            EXPECT_TRUE(ok);
            SqlValue("not-a-uuid").toUuid(&ok);
            EXPECT_FALSE(ok);
        }

        TEST(SqlValueTest, TimestampWithShortOffset) {
            bool ok = false;
            QDateTime dt = SqlValue("2024-01-02 03:04:05.123+00").toDateTime(&ok);
            ASSERT_TRUE(ok);
            EXPECT_EQ(dt.toUTC(), QDateTime(QDate(2024, 1, 2), QTime(3, 4, 5, 123), QTimeZone::utc()));
        }

        TEST(SqlValueTest, EqualityIgnoresDriverTypeName) {
            SqlValue a("1");
            SqlValue b("1");
            b.setDriverTypeName("int8");
            EXPECT_EQ(a, b);
            EXPECT_EQ(b.driverTypeName(), "int8");
            EXPECT_FALSE(SqlValue(1) == SqlValue("1"));
        }

        TEST(SqlValueTest, NullToStringReportsFailure) {
            bool ok = true;
            EXPECT_EQ(SqlValue().toString(&ok), "");
            EXPECT_FALSE(ok);
        }

        TEST(SqlRecordTest, LookupByNameAndIndex) {
            SqlRecord rec;
            rec.append("id", SqlValue(1));
            rec.append("name", SqlValue("alice"));
            EXPECT_EQ(rec.count(), 2);
            EXPECT_EQ(rec.indexOf("name"), 1);
            EXPECT_EQ(rec.indexOf("missing"), -1);
            EXPECT_EQ(rec.value("name").toString(), "alice");
            EXPECT_TRUE(rec.value("missing").isNull());
            EXPECT_EQ(rec.fieldName(0), "id");
        }

    }  // namespace
}  // namespace pgorm_sqldriver
