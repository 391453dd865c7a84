#include "querylab/ast.h"
#include "querylab/utils.h"

namespace querylab {

const char* query_type_name(QueryType type){
    switch(type){
        case QueryType::SELECT: return "SELECT";
        case QueryType::INSERT: return "INSERT";
        case QueryType::UPDATE: return "UPDATE";
        case QueryType::DELETE: return "DELETE";
        default: return "UNKNOWN";
    }
}

const char* join_type_name(JoinType type){
    switch(type){
        case JoinType::INNER: return "INNER";
        case JoinType::LEFT: return "LEFT";
        case JoinType::RIGHT: return "RIGHT";
        case JoinType::FULL: return "FULL";
        case JoinType::CROSS: return "CROSS";
        default: return "INNER";
    }
}

const char* compare_op_text(CompareOp op){
    switch(op){
        case CompareOp::EQ: return "=";
        case CompareOp::NE: return "<>";
        case CompareOp::LT: return "<";
        case CompareOp::GT: return ">";
        case CompareOp::LE: return "<=";
        case CompareOp::GE: return ">=";
        case CompareOp::LIKE: return "LIKE";
        case CompareOp::NOT_LIKE: return "NOT LIKE";
        case CompareOp::IN: return "IN";
        case CompareOp::NOT_IN: return "NOT IN";
        case CompareOp::IS_NULL: return "IS NULL";
        case CompareOp::IS_NOT_NULL: return "IS NOT NULL";
        case CompareOp::BETWEEN: return "BETWEEN";
        case CompareOp::NOT_BETWEEN: return "NOT BETWEEN";
        case CompareOp::TRUTH: return "IS TRUE";
        default: return "?";
    }
}

bool is_range_op(CompareOp op){
    return op==CompareOp::LT || op==CompareOp::GT || op==CompareOp::LE || op==CompareOp::GE || op==CompareOp::BETWEEN;
}

bool is_aggregate_function(const std::string &name){
    std::string up = to_upper(name);
    return up=="COUNT" || up=="SUM" || up=="AVG" || up=="MIN" || up=="MAX";
}

bool is_scalar_function(const std::string &name){
    static const std::vector<std::string> fns={"UPPER","LOWER","LENGTH","ABS","ROUND","COALESCE","IFNULL","CONCAT","YEAR","MONTH","DAY"};
    std::string up = to_upper(name);
    for(const auto &f: fns) if(up==f) return true;
    return false;
}

Expr Expr::column(const std::string &qualifier, const std::string &name){
    Expr e; e.kind=ExprKind::Column; e.qualifier=qualifier; e.name=name;
    e.text = qualifier.empty() ? name : qualifier + "." + name;
    return e;
}

Expr Expr::constant(Value v){
    Expr e; e.kind=ExprKind::Literal; e.text=v.to_literal(); e.literal=std::move(v);
    return e;
}

bool Expr::is_aggregate() const{
    return kind==ExprKind::Function && is_aggregate_function(name);
}

bool Expr::contains_aggregate() const{
    if(is_aggregate()) return true;
    for(const auto &a: args) if(a.contains_aggregate()) return true;
    return false;
}

void Expr::collect_columns(std::vector<const Expr*> &out) const{
    if(kind==ExprKind::Column){ out.push_back(this); return; }
    for(const auto &a: args) a.collect_columns(out);
}

std::string Condition::column() const{
    return left.kind==ExprKind::Column ? left.name : std::string();
}

std::string Condition::qualifier() const{
    return left.kind==ExprKind::Column ? left.qualifier : std::string();
}

std::string Condition::value_text() const{
    switch(op){
        case CompareOp::IS_NULL:
        case CompareOp::IS_NOT_NULL:
        case CompareOp::TRUTH: return "";
        case CompareOp::IN:
        case CompareOp::NOT_IN: {
            std::vector<std::string> parts;
            for(const auto &e: list) parts.push_back(e.text);
            return "(" + join(parts, ", ") + ")";
        }
        case CompareOp::BETWEEN:
        case CompareOp::NOT_BETWEEN: return right.text + " AND " + high.text;
        default: return right.text;
    }
}

bool Condition::right_is_literal() const{
    switch(op){
        case CompareOp::IS_NULL:
        case CompareOp::IS_NOT_NULL:
        case CompareOp::TRUTH: return true;
        case CompareOp::IN:
        case CompareOp::NOT_IN:
            for(const auto &e: list) if(e.kind!=ExprKind::Literal) return false;
            return true;
        case CompareOp::BETWEEN:
        case CompareOp::NOT_BETWEEN: return right.kind==ExprKind::Literal && high.kind==ExprKind::Literal;
        default: return right.kind==ExprKind::Literal;
    }
}

void Predicate::collect_conditions(std::vector<Condition> &out) const{
    if(kind==PredicateKind::Comparison){ out.push_back(cond); return; }
    for(const auto &c: children) c.collect_conditions(out);
}

bool Predicate::has_or() const{
    if(kind==PredicateKind::Or) return true;
    for(const auto &c: children) if(c.has_or()) return true;
    return false;
}

std::string SelectItem::output_name() const{
    if(!alias.empty()) return alias;
    if(expr.kind==ExprKind::Column) return expr.name;
    return text;
}

bool ParsedQuery::selects_star() const{
    for(const auto &c: columns) if(c.is_star()) return true;
    return false;
}

std::string ParsedQuery::resolve_table(const std::string &qualifier) const{
    std::string q = to_lower(qualifier);
    auto it = table_aliases.find(q);
    if(it!=table_aliases.end()) return it->second;
    for(const auto &t: tables) if(t==q) return t;
    return "";
}

} // namespace querylab
