// SqlDriver/Test/pg_value_converter_test.cpp
#include <gtest/gtest.h>

#include "sqldriver/postgres/pg_value_converter.h"
#include "sqldriver/sql_connection_parameters.h"
#include "sqldriver/sql_enums.h"

namespace pgorm_sqldriver {
    namespace {

        TEST(PgValueConverterTest, TextParameters) {
            EXPECT_EQ(pg_helper::toTextParameter(SqlValue()), std::nullopt);
            EXPECT_EQ(pg_helper::toTextParameter(SqlValue(true)), "true");
            EXPECT_EQ(pg_helper::toTextParameter(SqlValue(false)), "false");
            EXPECT_EQ(pg_helper::toTextParameter(SqlValue(42)), "42");
            EXPECT_EQ(pg_helper::toTextParameter(SqlValue("abc")), "abc");
            EXPECT_EQ(pg_helper::toTextParameter(SqlValue(QByteArray("\x01\xab", 2))), "\\x01ab");
        }

        TEST(PgValueConverterTest, TypeNamesForBuiltinOids) {
            EXPECT_EQ(pg_helper::typeNameForOid(20), "int8");
            EXPECT_EQ(pg_helper::typeNameForOid(23), "int4");
            EXPECT_EQ(pg_helper::typeNameForOid(16), "bool");
            EXPECT_EQ(pg_helper::typeNameForOid(2950), "uuid");
            EXPECT_EQ(pg_helper::typeNameForOid(1184), "timestamptz");
            EXPECT_EQ(pg_helper::typeNameForOid(999999), "unknown");
        }

        TEST(PgValueConverterTest, SqlStateCategories) {
            EXPECT_EQ(pg_helper::categoryForSqlState("23505"), ErrorCategory::Constraint);
            EXPECT_EQ(pg_helper::categoryForSqlState("08006"), ErrorCategory::Connectivity);
            EXPECT_EQ(pg_helper::categoryForSqlState("42P01"), ErrorCategory::Syntax);
            EXPECT_EQ(pg_helper::categoryForSqlState("42501"), ErrorCategory::Permissions);
            EXPECT_EQ(pg_helper::categoryForSqlState("57014"), ErrorCategory::OperationCancelled);
            EXPECT_EQ(pg_helper::categoryForSqlState("40001"), ErrorCategory::Transaction);
            EXPECT_EQ(pg_helper::categoryForSqlState("53300"), ErrorCategory::Resource);
            EXPECT_EQ(pg_helper::categoryForSqlState("XX000"), ErrorCategory::DatabaseInternal);
            EXPECT_EQ(pg_helper::categoryForSqlState(""), ErrorCategory::Unknown);
        }

        TEST(SqlEnumsTest, IsolationLevelSql) {
            EXPECT_EQ(isolationLevelSql(TransactionIsolationLevel::Default), std::nullopt);
            EXPECT_EQ(isolationLevelSql(TransactionIsolationLevel::ReadCommitted), "READ COMMITTED");
            EXPECT_EQ(isolationLevelSql(TransactionIsolationLevel::Serializable), "SERIALIZABLE");
        }

        TEST(ConnectionParametersTest, TypedAccessors) {
            ConnectionParameters params;
            params.setHostName("db.local");
            params.setPort(6543);
            params.setStatementTimeoutMs(2500);
            EXPECT_EQ(params.hostName(), "db.local");
            EXPECT_EQ(params.port(), 6543);
            EXPECT_EQ(params.statementTimeoutMs(), 2500);
            EXPECT_EQ(params.password(), std::nullopt);
        }

    }  // namespace
}  // namespace pgorm_sqldriver
