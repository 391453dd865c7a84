#include <gtest/gtest.h>
#include "querylab/errors.h"
#include "querylab/utils.h"

using namespace querylab;

TEST(ErrorsTest, UnknownTableSuggestsCloseName) {
    QueryError e = unknown_table_error("employe", {"employees", "departments"});
    EXPECT_EQ(e.kind, ErrorKind::UnknownTable);
    EXPECT_EQ(e.message, "Unknown table: 'employe'");
    EXPECT_EQ(e.suggestion, "Did you mean: employees?");
    EXPECT_EQ(e.severity, Severity::Error);
}

TEST(ErrorsTest, UnknownTableListsTablesWhenNothingIsClose) {
    QueryError e = unknown_table_error("zzz", {"employees", "departments"});
    EXPECT_EQ(e.suggestion, "Available tables: employees, departments");
}

TEST(ErrorsTest, UnknownColumnCarriesContext) {
    QueryError e = unknown_column_error("nme", "employees", {"id", "name", "salary"});
    EXPECT_EQ(e.message, "Unknown column: 'nme' in table 'employees'");
    EXPECT_EQ(e.suggestion, "Did you mean: name?");
    EXPECT_EQ(e.context_value("table"), "employees");
    EXPECT_EQ(e.context_value("available"), "id, name, salary");

    QueryError far = unknown_column_error("qqqq", "employees", {"id", "name"});
    EXPECT_EQ(far.suggestion, "Available columns in employees: id, name");
}

TEST(ErrorsTest, AmbiguousColumnListsQualifiedForms) {
    QueryError e = ambiguous_column_error("id", {"e.id", "d.id"});
    EXPECT_EQ(e.kind, ErrorKind::UnknownColumn);
    EXPECT_EQ(e.message, "Column 'id' is ambiguous (exists in 2 tables)");
    EXPECT_EQ(e.suggestion, "Qualify the column: e.id or d.id");
    EXPECT_EQ(e.context_value("candidates"), "e.id, d.id");
}

TEST(ErrorsTest, TypeMismatchNamesBothKinds) {
    QueryError e = type_mismatch_error("salary", "INTEGER", "TEXT");
    EXPECT_EQ(e.message, "Type mismatch: column 'salary' is INTEGER, but compared with TEXT");
    EXPECT_EQ(e.context_value("got"), "TEXT");
}

TEST(ErrorsTest, SeveritiesFollowKind) {
    EXPECT_EQ(unsupported_feature_error("Window functions").severity, Severity::Warning);
    EXPECT_EQ(unsupported_feature_error("Window functions").message, "Unsupported feature: Window functions");
    EXPECT_EQ(empty_query_error().severity, Severity::Info);
    EXPECT_EQ(empty_query_error().message, "Empty query");
    EXPECT_EQ(no_tables_error().message, "No table specified in query");
}

TEST(ErrorsTest, SyntaxErrorOffersKeywordCorrection) {
    QueryError e = syntax_error("Unrecognized keyword 'whre'", "whre");
    EXPECT_EQ(e.kind, ErrorKind::Syntax);
    EXPECT_EQ(e.suggestion, "Did you mean: WHERE?");
    EXPECT_EQ(e.context_value("near"), "whre");

    EXPECT_EQ(typo_correction("SELEC"), "SELECT");
    EXPECT_EQ(typo_correction("employees"), "");
}

TEST(ErrorsTest, KindNamesAndSummary) {
    EXPECT_STREQ(error_kind_name(ErrorKind::NoTables), "NoTablesError");
    EXPECT_STREQ(error_kind_name(ErrorKind::TypeMismatch), "TypeMismatchError");
    EXPECT_EQ(empty_query_error().str(), "EmptyQueryError: Empty query (Enter a SQL query like: SELECT * FROM employees)");
}

TEST(ErrorsTest, QueryExceptionCarriesError) {
    try {
        throw QueryException(no_tables_error());
    } catch (const QueryException& ex) {
        EXPECT_EQ(ex.error().kind, ErrorKind::NoTables);
        EXPECT_STREQ(ex.what(), "No table specified in query");
    }
}

TEST(UtilsTest, ClosestMatchRespectsCutoff) {
    EXPECT_EQ(closest_match("Salry", {"salary", "name"}), "salary");
    EXPECT_EQ(closest_match("x", {"salary", "name"}), "");
    EXPECT_DOUBLE_EQ(similarity("abc", "ABC"), 1.0);
    EXPECT_EQ(levenshtein("kitten", "sitting"), 3);
}
