#include <gtest/gtest.h>
#include "querylab/lexer.h"
#include "querylab/parser.h"

using namespace querylab;

TEST(LexerTest, TokenizesWithPositions) {
    auto toks = Lexer("SELECT a, 'it''s' FROM t WHERE x >= 1.5").tokenize();
    ASSERT_GE(toks.size(), 10u);
    EXPECT_EQ(toks[0].type, TokenType::KW);
    EXPECT_EQ(toks[1].type, TokenType::IDENT);
    EXPECT_EQ(toks[1].pos, 7);
    EXPECT_EQ(toks[3].type, TokenType::STRING);
    EXPECT_EQ(toks[3].text, "it's");
    EXPECT_EQ(toks.back().type, TokenType::END);
}

TEST(LexerTest, SkipsComments) {
    auto toks = Lexer("SELECT -- note\n 1 /* block */").tokenize();
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[1].type, TokenType::NUMBER);
}

TEST(ParserTest, ParsesClauses) {
    ParsedQuery q = parse_query(
        "SELECT e.name, d.name AS dept FROM employees e JOIN departments d ON e.department_id = d.id "
        "WHERE e.salary > 70000 AND d.budget >= 200000 ORDER BY e.salary DESC LIMIT 5 OFFSET 2");
    ASSERT_TRUE(q.ok());
    EXPECT_EQ(q.query_type, QueryType::SELECT);
    EXPECT_EQ(q.tables, (std::vector<std::string>{"employees", "departments"}));
    ASSERT_EQ(q.columns.size(), 2u);
    EXPECT_EQ(q.columns[1].alias, "dept");
    EXPECT_EQ(q.where_conditions.size(), 2u);
    ASSERT_EQ(q.joins.size(), 1u);
    EXPECT_EQ(q.joins[0].equalities.size(), 1u);
    EXPECT_EQ(q.resolve_table("d"), "departments");
    ASSERT_EQ(q.order_by.size(), 1u);
    EXPECT_FALSE(q.order_by[0].asc);
    EXPECT_EQ(*q.limit, 5);
    EXPECT_EQ(*q.offset, 2);
}

TEST(ParserTest, ParsesPredicateForms) {
    ParsedQuery q = parse_query(
        "SELECT * FROM t WHERE a IS NULL OR b NOT IN (1, 2) OR c BETWEEN 1 AND 3 OR d LIKE 'x%'");
    ASSERT_TRUE(q.ok());
    ASSERT_EQ(q.where_conditions.size(), 4u);
    EXPECT_EQ(q.where_conditions[0].op, CompareOp::IS_NULL);
    EXPECT_EQ(q.where_conditions[1].op, CompareOp::NOT_IN);
    EXPECT_EQ(q.where_conditions[1].list.size(), 2u);
    EXPECT_EQ(q.where_conditions[2].op, CompareOp::BETWEEN);
    EXPECT_EQ(q.where_conditions[3].op, CompareOp::LIKE);
    EXPECT_TRUE(q.where->has_or());
    EXPECT_TRUE(q.selects_star());
}

TEST(ParserTest, ExtractsCTEs) {
    ParsedQuery q = parse_query(
        "WITH RECURSIVE n(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM n WHERE x < 3), "
        "big AS (SELECT * FROM employees WHERE salary > 90000) SELECT * FROM n");
    ASSERT_TRUE(q.ok());
    EXPECT_TRUE(q.is_recursive);
    ASSERT_EQ(q.ctes.size(), 2u);
    EXPECT_EQ(q.ctes[0].name, "n");
    EXPECT_EQ(q.ctes[0].columns, (std::vector<std::string>{"x"}));
    EXPECT_TRUE(q.ctes[0].is_recursive);
    EXPECT_FALSE(q.ctes[1].is_recursive);
    EXPECT_EQ(q.ctes[1].query, "SELECT * FROM employees WHERE salary > 90000");
    EXPECT_EQ(q.main_query, "SELECT * FROM n");
    EXPECT_EQ(q.tables, (std::vector<std::string>{"n"}));
}

TEST(ParserTest, SplitUnionReportsDistinct) {
    bool distinct = true;
    auto parts = split_union("SELECT 1 UNION ALL SELECT 2", &distinct);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[1], "SELECT 2");
    EXPECT_FALSE(distinct);
    split_union("SELECT 1 UNION SELECT 2", &distinct);
    EXPECT_TRUE(distinct);
}

TEST(ParserTest, RecordsUnsupportedFeatures) {
    EXPECT_EQ(parse_query("SELECT * FROM t WHERE id IN (SELECT id FROM u)").unsupported.front(), "Subqueries");
    EXPECT_EQ(parse_query("SELECT 1 UNION SELECT 2").unsupported.front(), "UNION");
    EXPECT_EQ(parse_query("SELECT * FROM (SELECT 1) x").unsupported.front(), "Subqueries in FROM");
}

TEST(ParserTest, RecordsSyntaxIssuesWithoutThrowing) {
    ParsedQuery q = parse_query("SELECT name FORM employees");
    EXPECT_FALSE(q.issues.empty());
    EXPECT_EQ(parse_query("SELECT FROM").issues.size(), 1u);
    EXPECT_EQ(parse_query("DELETE FROM employees").query_type, QueryType::DELETE);
}
