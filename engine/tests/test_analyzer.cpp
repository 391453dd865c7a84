#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include "querylab/dataset.h"
#include "querylab/query_analyzer.h"

using namespace querylab;

class AnalyzerTest : public ::testing::Test {
protected:
    Dataset dataset = make_sample_dataset();

    QueryAnalysis analyze(const std::string& sql) {
        return QueryAnalyzer(dataset).analyze(sql);
    }

    static bool hasTip(const QueryAnalysis& a, const std::string& prefix) {
        return std::any_of(a.tips.begin(), a.tips.end(),
                           [&](const std::string& t) { return t.compare(0, prefix.size(), prefix) == 0; });
    }
};

TEST_F(AnalyzerTest, SelectStarOnWholeTable) {
    QueryAnalysis a = analyze("SELECT * FROM employees");
    EXPECT_FALSE(a.error.has_value());
    EXPECT_TRUE(a.hasIssue("SELECT * Usage"));
    EXPECT_TRUE(a.hasIssue("No WHERE Clause"));
    EXPECT_EQ(a.overall_severity, "warning");
    EXPECT_EQ(a.access_rating, "bad");
    ASSERT_FALSE(a.rewrites.empty());
    EXPECT_EQ(a.rewrites[0].original_pattern, "SELECT *");
    EXPECT_FALSE(a.optimized_query.has_value());
    EXPECT_TRUE(hasTip(a, "Consider adding indexes"));
    EXPECT_TRUE(hasTip(a, "Selecting specific columns"));
    ASSERT_TRUE(a.result.has_value());
    EXPECT_EQ(a.result->row_count, 20u);
}

TEST_F(AnalyzerTest, YearFunctionIsRewrittenToRange) {
    QueryAnalysis a = analyze("SELECT name, hire_date FROM employees WHERE YEAR(hire_date) = 2021");
    EXPECT_TRUE(a.hasIssue("Function on Column: YEAR()"));
    EXPECT_EQ(a.overall_severity, "critical");
    ASSERT_TRUE(a.optimized_query.has_value());
    EXPECT_EQ(*a.optimized_query,
              "SELECT name, hire_date FROM employees WHERE hire_date >= '2021-01-01' AND hire_date < '2022-01-01'");

    bool year_rewrite = false;
    for (const auto& rw : a.rewrites) year_rewrite = year_rewrite || rw.original_pattern == "YEAR(hire_date) = 2021";
    EXPECT_TRUE(year_rewrite);
    EXPECT_EQ(a.result->row_count, 4u);
}

TEST_F(AnalyzerTest, YearRewriteHandlesQualifiedColumns) {
    QueryAnalysis a = analyze("SELECT e.name FROM employees e WHERE YEAR( e.hire_date ) = 2021");
    ASSERT_TRUE(a.optimized_query.has_value());
    EXPECT_EQ(*a.optimized_query,
              "SELECT e.name FROM employees e WHERE e.hire_date >= '2021-01-01' AND e.hire_date < '2022-01-01'");
    EXPECT_EQ(analyze(*a.optimized_query).result->row_count, a.result->row_count);

    QueryAnalysis longer = analyze("SELECT id FROM employees WHERE YEAR(hire_date) = 20210");
    EXPECT_FALSE(longer.optimized_query.has_value());
}

TEST_F(AnalyzerTest, OptimizedQueryReturnsSameRows) {
    QueryAnalysis a = analyze("SELECT id FROM employees WHERE YEAR(hire_date) = 2020");
    ASSERT_TRUE(a.optimized_query.has_value());
    QueryAnalysis b = analyze(*a.optimized_query);
    EXPECT_EQ(a.result->row_count, b.result->row_count);
    EXPECT_FALSE(b.hasIssue("Function on Column: YEAR()"));
}

TEST_F(AnalyzerTest, LeadingWildcard) {
    QueryAnalysis a = analyze("SELECT name FROM employees WHERE name LIKE '%son'");
    EXPECT_TRUE(a.hasIssue("Leading Wildcard LIKE"));
    ASSERT_FALSE(a.index_recommendations.empty());
    EXPECT_EQ(a.index_recommendations[0].kind, "WHERE filter");
    EXPECT_EQ(a.index_recommendations[0].sql, "CREATE INDEX idx_employees_name ON employees(name);");
    EXPECT_FALSE(analyze("SELECT name FROM employees WHERE name LIKE 'A%'").hasIssue("Leading Wildcard LIKE"));
}

TEST_F(AnalyzerTest, OrAcrossDifferentColumns) {
    EXPECT_TRUE(analyze("SELECT name FROM employees WHERE salary > 100000 OR department_id = 4")
                    .hasIssue("OR on Different Columns"));
    EXPECT_FALSE(analyze("SELECT name FROM employees WHERE department_id = 1 OR department_id = 2")
                     .hasIssue("OR on Different Columns"));
}

TEST_F(AnalyzerTest, NotInAndOrderWithoutLimit) {
    QueryAnalysis a = analyze("SELECT name FROM employees WHERE department_id NOT IN (1, 2) ORDER BY name");
    EXPECT_TRUE(a.hasIssue("NOT IN Usage"));
    EXPECT_TRUE(a.hasIssue("ORDER BY Without LIMIT"));
    EXPECT_TRUE(hasTip(a, "Add an index that matches your ORDER BY"));
}

TEST_F(AnalyzerTest, RecommendationsAreCappedAtThree) {
    QueryAnalysis a = analyze(
        "SELECT name, email FROM employees WHERE phone = '555-0101' AND email = 'alice@company.com' ORDER BY name");
    ASSERT_EQ(a.index_recommendations.size(), 3u);
    EXPECT_EQ(a.index_recommendations[0].kind, "WHERE filter");
    EXPECT_EQ(a.index_recommendations[0].columns, (std::vector<std::string>{"phone"}));
    EXPECT_EQ(a.index_recommendations[1].columns, (std::vector<std::string>{"email"}));
    EXPECT_EQ(a.index_recommendations[2].kind, "ORDER BY");
}

TEST_F(AnalyzerTest, IndexedFilterNeedsNoWhereRecommendation) {
    QueryAnalysis a = analyze("SELECT name FROM employees WHERE id = 3");
    EXPECT_TRUE(a.issues.empty());
    EXPECT_EQ(a.overall_severity, "good");
    EXPECT_EQ(a.access_rating, "good");
    for (const auto& rec : a.index_recommendations) EXPECT_NE(rec.kind, "WHERE filter");
    ASSERT_EQ(a.tips.size(), 1u);
    EXPECT_TRUE(hasTip(a, "Query looks reasonable!"));
}

TEST_F(AnalyzerTest, SubqueryOnlyInMainStatement) {
    QueryAnalysis sub = analyze("SELECT name FROM employees WHERE id IN (SELECT manager_id FROM employees)");
    EXPECT_TRUE(sub.hasIssue("Subquery Detected"));
    ASSERT_TRUE(sub.error.has_value());
    EXPECT_EQ(sub.error->kind, ErrorKind::UnsupportedFeature);

    QueryAnalysis cte = analyze("WITH x AS (SELECT id FROM employees) SELECT id FROM x");
    EXPECT_FALSE(cte.hasIssue("Subquery Detected"));
    EXPECT_FALSE(cte.error.has_value());
}

TEST_F(AnalyzerTest, LargeResultSuggestsLimit) {
    QueryAnalysis a = analyze("SELECT e.id, d.id FROM employees e CROSS JOIN departments d");
    ASSERT_TRUE(a.result.has_value());
    EXPECT_EQ(a.result->row_count, 120u);
    EXPECT_TRUE(hasTip(a, "Consider adding LIMIT"));
}

TEST_F(AnalyzerTest, FailuresAreCapturedNotThrown) {
    QueryAnalysis unknown = analyze("SELECT * FROM nope");
    ASSERT_TRUE(unknown.error.has_value());
    EXPECT_EQ(unknown.error->kind, ErrorKind::UnknownTable);
    EXPECT_TRUE(unknown.explain_rows.empty());

    QueryAnalysis empty = analyze("  ");
    ASSERT_TRUE(empty.error.has_value());
    EXPECT_EQ(empty.error->kind, ErrorKind::EmptyQuery);
    EXPECT_FALSE(empty.result.has_value());
}
