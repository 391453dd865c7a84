#include <gtest/gtest.h>
#include <string>
#include "querylab/config.h"
#include "querylab/dataset.h"
#include "querylab/executor.h"

using namespace querylab;

class CTETest : public ::testing::Test {
protected:
    Dataset dataset = make_sample_dataset();
    Config config;

    QueryResult run(const std::string& sql) {
        QueryExecutor executor(dataset, config);
        return executor.execute(sql);
    }
};

TEST_F(CTETest, RecursiveCounter) {
    QueryResult r = run("WITH RECURSIVE nums(n) AS (SELECT 1 UNION ALL SELECT n + 1 FROM nums WHERE n < 10) "
                        "SELECT n FROM nums");
    ASSERT_TRUE(r.success) << r.error->str();
    ASSERT_EQ(r.row_count, 10u);
    for (size_t i = 0; i < r.rows.size(); ++i) EXPECT_EQ(r.rows[i].get("n").as_int(), static_cast<int64_t>(i + 1));

    ASSERT_EQ(r.cte_info.size(), 1u);
    const CTEInfo& info = r.cte_info[0];
    EXPECT_EQ(info.name, "nums");
    EXPECT_TRUE(info.is_recursive);
    EXPECT_EQ(info.row_count, 10u);
    EXPECT_EQ(info.iterations, 10);
    EXPECT_FALSE(info.truncated);
    EXPECT_TRUE(r.warnings.empty());
}

TEST_F(CTETest, RecursionStopsAtConfiguredDepth) {
    config.setInt("max_recursion_depth", 5);
    QueryResult r = run("WITH RECURSIVE c(n) AS (SELECT 1 UNION ALL SELECT n + 1 FROM c) SELECT n FROM c");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.row_count, 6u);
    ASSERT_EQ(r.cte_info.size(), 1u);
    EXPECT_TRUE(r.cte_info[0].truncated);
    EXPECT_EQ(r.cte_info[0].iterations, 5);
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_NE(r.warnings[0].find("stopped after 5 iterations"), std::string::npos);
}

TEST_F(CTETest, RecursionEndingExactlyAtDepthIsComplete) {
    config.setInt("max_recursion_depth", 9);
    QueryResult r = run("WITH RECURSIVE nums(n) AS (SELECT 1 UNION ALL SELECT n + 1 FROM nums WHERE n < 10) "
                        "SELECT n FROM nums");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.row_count, 10u);
    ASSERT_EQ(r.cte_info.size(), 1u);
    EXPECT_EQ(r.cte_info[0].iterations, 9);
    EXPECT_FALSE(r.cte_info[0].truncated);
    EXPECT_TRUE(r.warnings.empty());

    config.setInt("max_recursion_depth", 8);
    QueryResult cut = run("WITH RECURSIVE nums(n) AS (SELECT 1 UNION ALL SELECT n + 1 FROM nums WHERE n < 10) "
                          "SELECT n FROM nums");
    EXPECT_EQ(cut.row_count, 9u);
    EXPECT_TRUE(cut.cte_info[0].truncated);
}

TEST_F(CTETest, WalksManagementChain) {
    QueryResult r = run(
        "WITH RECURSIVE chain AS ("
        "  SELECT id, name, manager_id FROM employees WHERE id = 4"
        "  UNION ALL"
        "  SELECT e.id, e.name, e.manager_id FROM employees e JOIN chain c ON e.id = c.manager_id"
        ") SELECT name FROM chain");
    ASSERT_TRUE(r.success) << r.error->str();
    ASSERT_EQ(r.row_count, 3u);
    EXPECT_EQ(r.rows[0].get("name").as_text(), "David Lee");
    EXPECT_EQ(r.rows[1].get("name").as_text(), "Carol Davis");
    EXPECT_EQ(r.rows[2].get("name").as_text(), "Eva Martinez");
}

TEST_F(CTETest, ChainedNonRecursiveCTEs) {
    QueryResult r = run(
        "WITH high AS (SELECT id, name, department_id FROM employees WHERE salary > 80000), "
        "eng AS (SELECT * FROM high WHERE department_id = 1) "
        "SELECT name FROM eng ORDER BY name");
    ASSERT_TRUE(r.success) << r.error->str();
    ASSERT_EQ(r.row_count, 4u);
    EXPECT_EQ(r.rows[0].get("name").as_text(), "Alice Chen");
    EXPECT_EQ(r.rows[3].get("name").as_text(), "Eva Martinez");
    ASSERT_EQ(r.cte_info.size(), 2u);
    EXPECT_EQ(r.cte_info[0].row_count, 6u);
    EXPECT_FALSE(r.cte_info[0].is_recursive);
    EXPECT_EQ(r.cte_info[0].iterations, 0);
}

TEST_F(CTETest, ColumnListRenamesOutput) {
    QueryResult r = run("WITH d(dept, total) AS (SELECT department_id, SUM(salary) FROM employees GROUP BY department_id) "
                        "SELECT dept FROM d WHERE total > 300000");
    ASSERT_TRUE(r.success) << r.error->str();
    EXPECT_EQ(r.columns, (std::vector<std::string>{"dept"}));
    EXPECT_EQ(r.row_count, 2u);
}

TEST_F(CTETest, ColumnListMustMatchWidth) {
    QueryResult r = run("WITH t(a, b) AS (SELECT 1) SELECT * FROM t");
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->kind, ErrorKind::Syntax);
}

TEST_F(CTETest, ForwardReferenceIsRejected) {
    QueryResult r = run("WITH a AS (SELECT * FROM b), b AS (SELECT 1 AS x) SELECT * FROM a");
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->kind, ErrorKind::UnknownTable);
    EXPECT_EQ(r.error->message, "CTE 'b' is referenced by 'a' before it is defined");
}

TEST_F(CTETest, CTEShadowsDatasetTable) {
    QueryResult r = run("WITH employees AS (SELECT 1 AS id) SELECT * FROM employees");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.row_count, 1u);
    EXPECT_EQ(r.columns, (std::vector<std::string>{"id"}));
}

TEST_F(CTETest, UnionInsideBody) {
    QueryResult distinct = run("WITH u AS (SELECT department_id FROM employees UNION SELECT id FROM departments) "
                               "SELECT * FROM u");
    ASSERT_TRUE(distinct.success);
    EXPECT_EQ(distinct.row_count, 6u);

    QueryResult all = run("WITH u AS (SELECT department_id FROM employees UNION ALL SELECT id FROM departments) "
                          "SELECT * FROM u");
    ASSERT_TRUE(all.success);
    EXPECT_EQ(all.row_count, 26u);
}

TEST_F(CTETest, SelfReferenceWithoutRecursiveKeywordWarns) {
    QueryResult r = run("WITH n(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM n WHERE x < 3) SELECT x FROM n");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.row_count, 3u);
    ASSERT_FALSE(r.warnings.empty());
    EXPECT_NE(r.warnings[0].find("without WITH RECURSIVE"), std::string::npos);
}

TEST_F(CTETest, RecursiveCTENeedsAnchor) {
    QueryResult r = run("WITH RECURSIVE n(x) AS (SELECT x + 1 FROM n) SELECT x FROM n");
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error->kind, ErrorKind::Syntax);
}
