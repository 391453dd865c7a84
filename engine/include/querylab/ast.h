#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "querylab/value.h"

namespace querylab {

enum class QueryType { SELECT, INSERT, UPDATE, DELETE, UNKNOWN };

const char* query_type_name(QueryType type);

enum class ExprKind { Literal, Column, Star, Function, Unary, Binary };

struct Expr {
    ExprKind kind = ExprKind::Literal;
    Value literal;
    std::string qualifier;   // table or alias for Column/Star
    std::string name;        // column name, or upper-cased function name
    std::string op;          // Unary/Binary operator
    bool distinct = false;   // COUNT(DISTINCT x)
    std::vector<Expr> args;
    std::string text;        // as written in the query

    static Expr column(const std::string& qualifier, const std::string& name);
    static Expr constant(Value v);

    bool is_aggregate() const;
    bool contains_aggregate() const;
    // Appends every column reference below this node.
    void collect_columns(std::vector<const Expr*>& out) const;
};

bool is_aggregate_function(const std::string& name);
bool is_scalar_function(const std::string& name);

enum class CompareOp { EQ, NE, LT, GT, LE, GE, LIKE, NOT_LIKE, IN, NOT_IN, IS_NULL, IS_NOT_NULL, BETWEEN, NOT_BETWEEN, TRUTH };

const char* compare_op_text(CompareOp op);
bool is_range_op(CompareOp op);

// One comparison leaf: `left op right`, `left IN (list)`, `left BETWEEN right AND high`.
struct Condition {
    Expr left;
    CompareOp op = CompareOp::EQ;
    Expr right;
    std::vector<Expr> list;
    Expr high;
    std::string text;

    // Bare column name on the left side, or empty when the left side is an expression.
    std::string column() const;
    std::string qualifier() const;
    std::string op_text() const { return compare_op_text(op); }
    std::string value_text() const;
    bool right_is_literal() const;
};

enum class PredicateKind { Comparison, And, Or, Not };

struct Predicate {
    PredicateKind kind = PredicateKind::Comparison;
    Condition cond;
    std::vector<Predicate> children;

    void collect_conditions(std::vector<Condition>& out) const;
    bool has_or() const;
};

struct SelectItem {
    Expr expr;
    std::string alias;
    std::string text;

    std::string output_name() const;
    bool is_star() const { return expr.kind == ExprKind::Star; }
};

enum class JoinType { INNER, LEFT, RIGHT, FULL, CROSS };

const char* join_type_name(JoinType type);

struct TableRef { std::string name; std::string alias; };

struct JoinClause {
    JoinType type = JoinType::INNER;
    TableRef table;
    std::optional<Predicate> on;
    std::string on_text;
    // Column equalities from the ON clause, `a.x = b.y`.
    std::vector<std::pair<Expr, Expr>> equalities;
};

struct OrderItem { Expr expr; std::string text; bool asc=true; };

struct CTEDefinition {
    std::string name;
    std::string query;
    std::vector<std::string> columns;
    bool is_recursive = false;
};

struct ParseIssue { std::string message; std::string near; int pos=-1; };

struct ParsedQuery {
    QueryType query_type = QueryType::UNKNOWN;
    std::string raw_query;
    std::string main_query;

    TableRef from;
    std::vector<std::string> tables;
    std::vector<SelectItem> columns;
    bool distinct = false;
    std::optional<Predicate> where;
    std::vector<Condition> where_conditions;
    std::vector<Expr> group_by;
    std::optional<Predicate> having;
    std::vector<Condition> having_conditions;
    std::vector<OrderItem> order_by;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    std::vector<JoinClause> joins;
    // alias -> table, lower-cased
    std::map<std::string, std::string> table_aliases;

    std::vector<CTEDefinition> ctes;
    bool is_recursive = false;

    std::vector<ParseIssue> issues;
    std::vector<std::string> unsupported;

    bool ok() const { return issues.empty() && unsupported.empty(); }
    bool selects_star() const;
    // Table name for an alias or name used in the query; empty if unknown.
    std::string resolve_table(const std::string& qualifier) const;
};

} // namespace querylab
