#include <gtest/gtest.h>
#include <string>
#include "querylab/cost_estimator.h"
#include "querylab/dataset.h"
#include "querylab/explain.h"
#include "querylab/parser.h"

using namespace querylab;

// 1000 rows, unique index on id only.
static Dataset wideTable(bool index_val = false) {
    Dataset ds;
    ds.add_table("t", {"id", "val", "label"});
    for (int i = 1; i <= 1000; ++i) {
        ds.add_row("t", Row{{"id", Value::integer(i)}, {"val", Value::integer(i % 10)},
                            {"label", Value::text("row" + std::to_string(i))}});
    }
    ds.add_index("t", "PRIMARY", "id", true);
    if (index_val) ds.add_index("t", "idx_val", "val");
    return ds;
}

TEST(CostEstimatorTest, RanksAccessPathsByCost) {
    CostEstimator est;
    const size_t n = 1000;
    double c = est.estimateAccess(AccessType::Const, n).cost.total();
    double ref = est.estimateAccess(AccessType::Ref, n).cost.total();
    double range = est.estimateAccess(AccessType::Range, n).cost.total();
    double index = est.estimateAccess(AccessType::Index, n).cost.total();
    double all = est.estimateAccess(AccessType::All, n).cost.total();
    EXPECT_LE(c, ref);
    EXPECT_LE(ref, range);
    EXPECT_LE(range, index);
    EXPECT_LE(index, all);
    EXPECT_EQ(est.estimateRows(AccessType::Ref, n), 100u);
    EXPECT_EQ(est.estimateRows(AccessType::Range, n), 300u);
    EXPECT_EQ(est.estimateRows(AccessType::Ref, 3), 1u);
    EXPECT_DOUBLE_EQ(est.estimateSortCost(1).total(), 0.0);
}

TEST(ExplainTest, PrimaryKeyEqualityIsConst) {
    Dataset ds = wideTable();
    ExplainReport r = Explainer(ds).explain("SELECT * FROM t WHERE id = 500");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.rows.size(), 1u);
    const ExplainRow& row = r.rows[0];
    EXPECT_EQ(row.type, AccessType::Const);
    EXPECT_EQ(row.rows, 1u);
    EXPECT_EQ(*row.key, "PRIMARY");
    EXPECT_EQ(*row.ref, "const");
    EXPECT_EQ(*row.key_len, 4);
    EXPECT_EQ(row.possible_keys, (std::vector<std::string>{"PRIMARY"}));
}

TEST(ExplainTest, UnindexedFilterIsFullScan) {
    Dataset ds = wideTable();
    ExplainReport r = Explainer(ds).explain("SELECT * FROM t WHERE val = 5");
    ASSERT_TRUE(r.ok());
    const ExplainRow& row = r.rows[0];
    EXPECT_EQ(row.type, AccessType::All);
    EXPECT_EQ(row.rows, 1000u);
    EXPECT_FALSE(row.key.has_value());
    EXPECT_TRUE(row.possible_keys.empty());
    EXPECT_TRUE(row.hasExtra("Using where"));
    EXPECT_EQ(row.rating(), "bad");

    ASSERT_FALSE(r.annotations.empty());
    EXPECT_EQ(r.annotations[0].severity, AnnotationSeverity::Warning);
    EXPECT_NE(r.annotations[0].recommendation.find("CREATE INDEX idx_t_val ON t(val);"), std::string::npos);
}

TEST(ExplainTest, NonUniqueEqualityIsRef) {
    Dataset ds = wideTable(true);
    ExplainReport r = Explainer(ds).explain("SELECT * FROM t WHERE val = 5");
    const ExplainRow& row = r.rows[0];
    EXPECT_EQ(row.type, AccessType::Ref);
    EXPECT_EQ(row.rows, 100u);
    EXPECT_EQ(*row.key, "idx_val");
}

TEST(ExplainTest, InequalityIsRange) {
    Dataset ds = wideTable();
    ExplainReport r = Explainer(ds).explain("SELECT * FROM t WHERE id > 10");
    const ExplainRow& row = r.rows[0];
    EXPECT_EQ(row.type, AccessType::Range);
    EXPECT_EQ(row.rows, 300u);
    EXPECT_TRUE(row.hasExtra("Using index condition"));
    EXPECT_FALSE(row.hasExtra("Using where"));
    EXPECT_FALSE(row.ref.has_value());
}

TEST(ExplainTest, CoveringIndex) {
    Dataset ds = wideTable();
    ExplainReport range = Explainer(ds).explain("SELECT id FROM t WHERE id BETWEEN 10 AND 20");
    EXPECT_EQ(range.rows[0].type, AccessType::Range);
    EXPECT_TRUE(range.rows[0].hasExtra("Using index"));
    EXPECT_FALSE(range.rows[0].hasExtra("Using index condition"));

    ExplainReport scan = Explainer(ds).explain("SELECT id FROM t");
    EXPECT_EQ(scan.rows[0].type, AccessType::Index);
    EXPECT_EQ(scan.rows[0].rating(), "caution");
}

TEST(ExplainTest, LeadingWildcardCannotUseIndex) {
    Dataset ds = wideTable();
    ds.add_index("t", "idx_label", "label");
    EXPECT_EQ(Explainer(ds).explain("SELECT * FROM t WHERE label LIKE 'row1%'").rows[0].type, AccessType::Range);
    EXPECT_EQ(Explainer(ds).explain("SELECT * FROM t WHERE label LIKE '%1'").rows[0].type, AccessType::All);
}

TEST(ExplainTest, OrderByOutsideKeyNeedsFilesort) {
    Dataset ds = wideTable();
    ExplainReport sorted = Explainer(ds).explain("SELECT * FROM t ORDER BY val");
    EXPECT_TRUE(sorted.rows[0].hasExtra("Using filesort"));
    EXPECT_GT(sorted.total_cost.total(), sorted.rows[0].cost.total());

    ExplainReport by_key = Explainer(ds).explain("SELECT * FROM t WHERE id > 5 ORDER BY id");
    EXPECT_FALSE(by_key.rows[0].hasExtra("Using filesort"));
}

TEST(ExplainTest, GroupAndOrderOnDifferentColumnsUsesTemporary) {
    Dataset ds = wideTable();
    ExplainReport r = Explainer(ds).explain("SELECT val, COUNT(*) FROM t GROUP BY val ORDER BY COUNT(*)");
    EXPECT_TRUE(r.rows[0].hasExtra("Using temporary"));
    EXPECT_TRUE(r.rows[0].hasExtra("Using filesort"));
}

TEST(ExplainTest, JoinThroughUniqueKeyIsEqRef) {
    Dataset ds = make_sample_dataset();
    ExplainReport r = Explainer(ds).explain(
        "SELECT e.name, d.name FROM employees e JOIN departments d ON e.department_id = d.id");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.rows.size(), 2u);
    EXPECT_EQ(r.rows[0].table, "employees");
    EXPECT_EQ(r.rows[0].type, AccessType::All);
    EXPECT_EQ(r.rows[1].table, "departments");
    EXPECT_EQ(r.rows[1].type, AccessType::EqRef);
    EXPECT_EQ(*r.rows[1].ref, "e.department_id");
    EXPECT_EQ(r.rows[1].id, 2);
}

TEST(ExplainTest, JoinThroughNonUniqueKeyIsRef) {
    Dataset ds = make_sample_dataset();
    ExplainReport r = Explainer(ds).explain(
        "SELECT d.name, e.name FROM departments d JOIN employees e ON e.department_id = d.id");
    ASSERT_EQ(r.rows.size(), 2u);
    EXPECT_EQ(r.rows[1].type, AccessType::Ref);
    EXPECT_EQ(*r.rows[1].key, "idx_department");
    EXPECT_EQ(*r.rows[1].ref, "d.id");
}

TEST(ExplainTest, ReportsErrorsInsteadOfRows) {
    Dataset ds = make_sample_dataset();
    Explainer explainer(ds);
    ExplainReport unknown = explainer.explain("SELECT * FROM nope");
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error->kind, ErrorKind::UnknownTable);
    EXPECT_TRUE(unknown.rows.empty());

    EXPECT_EQ(explainer.explain("").error->kind, ErrorKind::EmptyQuery);
    EXPECT_EQ(explainer.explain("DELETE FROM employees").error->kind, ErrorKind::UnsupportedFeature);
}

TEST(ExplainTest, QueryWithoutTables) {
    Dataset ds = make_sample_dataset();
    ExplainReport r = Explainer(ds).explain("SELECT 1");
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.rows.empty());
    ASSERT_EQ(r.annotations.size(), 1u);
    EXPECT_EQ(r.annotations[0].explanation, "No tables used");
}

TEST(ExplainTest, CTEReferenceIsDerived) {
    Dataset ds = make_sample_dataset();
    ExplainReport r = Explainer(ds).explain("WITH x AS (SELECT id FROM employees) SELECT * FROM x");
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.rows.size(), 1u);
    EXPECT_EQ(r.rows[0].select_type, "DERIVED");
}

TEST(IndexComparisonTest, HypotheticalIndexBeatsFullScan) {
    Dataset ds = wideTable();
    IndexComparison cmp = Explainer(ds).compare(parse_query("SELECT * FROM t WHERE val = 5"), "t");
    ASSERT_FALSE(cmp.error.has_value());
    ASSERT_EQ(cmp.options.size(), 3u);

    const IndexOption& best = cmp.options[0];
    EXPECT_TRUE(best.hypothetical);
    EXPECT_TRUE(best.optimal);
    EXPECT_EQ(best.type, AccessType::Ref);
    EXPECT_EQ(best.create_statement, "CREATE INDEX idx_t_val ON t(val);");

    EXPECT_EQ(cmp.options[1].label, "Full table scan (no index)");
    EXPECT_TRUE(cmp.options[1].chosen);
    EXPECT_FALSE(cmp.options[2].usable);
    EXPECT_FALSE(cmp.chosenIsOptimal());
}

TEST(IndexComparisonTest, ChosenIndexIsOptimal) {
    Dataset ds = wideTable(true);
    IndexComparison cmp = Explainer(ds).compare(parse_query("SELECT * FROM t WHERE id = 7 AND val = 3"), "t");
    ASSERT_FALSE(cmp.error.has_value());
    ASSERT_NE(cmp.chosen(), nullptr);
    EXPECT_EQ(cmp.chosen()->index_name, "PRIMARY");
    EXPECT_EQ(cmp.optimal(), cmp.chosen());
    EXPECT_TRUE(cmp.chosenIsOptimal());
    for (size_t i = 1; i < cmp.options.size(); ++i) {
        EXPECT_LE(cmp.options[i - 1].cost.total(), cmp.options[i].cost.total());
    }
}

TEST(IndexComparisonTest, UnknownTableInComparison) {
    Dataset ds = make_sample_dataset();
    IndexComparison cmp = Explainer(ds).compare(parse_query("SELECT * FROM employees"), "departments");
    ASSERT_TRUE(cmp.error.has_value());
    EXPECT_EQ(cmp.error->kind, ErrorKind::UnknownTable);
}
