#include <gtest/gtest.h>
#include <string>
#include "querylab/btree.h"
#include "querylab/dataset.h"
#include "querylab/executor.h"
#include "querylab/explain.h"
#include "querylab/formatter.h"
#include "querylab/parser.h"

using namespace querylab;

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST(FormatterTest, TablePadsColumns) {
    std::string out = format_table({"id", "name"}, {{"1", "Alice"}, {"22", "Bo"}});
    EXPECT_EQ(out,
              "+----+-------+\n"
              "| id | name  |\n"
              "+----+-------+\n"
              "| 1  | Alice |\n"
              "| 22 | Bo    |\n"
              "+----+-------+\n");
}

TEST(FormatterTest, EmptyTableHasHeaderOnly) {
    std::string out = format_table({"a"}, {});
    EXPECT_EQ(out, "+---+\n| a |\n+---+\n");
}

TEST(FormatterTest, ResultShowsRowsAndNulls) {
    Dataset ds = make_sample_dataset();
    QueryResult r = QueryExecutor(ds).execute("SELECT name, phone FROM employees WHERE id = 3");
    std::string out = format_result(r);
    EXPECT_TRUE(contains(out, "| Carol Davis | NULL  |"));
    EXPECT_TRUE(contains(out, "1 row in "));
}

TEST(FormatterTest, FailedResultShowsError) {
    Dataset ds = make_sample_dataset();
    QueryResult r = QueryExecutor(ds).execute("SELECT * FROM employes");
    std::string out = format_result(r);
    EXPECT_EQ(out, "UnknownTableError (error): Unknown table: 'employes'\n  Suggestion: Did you mean: employees?\n");
}

TEST(FormatterTest, RecursiveCTEMetadata) {
    Dataset ds = make_sample_dataset();
    QueryResult r = QueryExecutor(ds).execute(
        "WITH RECURSIVE n(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM n WHERE x < 3) SELECT x FROM n");
    EXPECT_TRUE(contains(format_result(r), "CTE n: 3 rows, recursive, 3 iterations\n"));
}

TEST(FormatterTest, ExplainTable) {
    Dataset ds = make_sample_dataset();
    std::string out = format_explain(Explainer(ds).explain("SELECT * FROM employees WHERE id = 3"));
    EXPECT_TRUE(contains(out, "| select_type |"));
    EXPECT_TRUE(contains(out, "| const |"));
    EXPECT_TRUE(contains(out, "Estimated cost: 3.01\n"));
    EXPECT_TRUE(contains(out, "[info] employees.type = const: "));
}

TEST(FormatterTest, ComparisonPointsAtCheaperIndex) {
    Dataset ds = make_sample_dataset();
    Explainer explainer(ds);
    std::string out = format_comparison(explainer.compare(parse_query("SELECT * FROM employees WHERE email = 'x'"),
                                                          "employees"));
    EXPECT_TRUE(contains(out, "Index options for employees:\n"));
    EXPECT_TRUE(contains(out, "hypothetical"));
    EXPECT_TRUE(contains(out, "Cheaper with: CREATE INDEX idx_employees_email ON employees(email);\n"));
}

TEST(FormatterTest, TreeAndTrace) {
    BTree tree(3);
    for (int i = 1; i <= 3; ++i) tree.insert(Value::integer(i), i);
    std::string drawn = format_tree(tree.treeStructure());
    EXPECT_EQ(drawn.substr(0, drawn.find('\n')), "[2]");
    EXPECT_TRUE(contains(drawn, "  [1] (leaf)\n"));

    std::string trace = format_trace(tree.search(Value::integer(3)).trace);
    EXPECT_TRUE(contains(trace, "  1. node "));
    EXPECT_TRUE(contains(trace, "found"));
}
