#pragma once
#include <algorithm>
#include <string>
#include <vector>
#include "querylab/ast.h"
#include "querylab/lexer.h"

namespace querylab {

struct ParseError{ std::string message; std::string near; int pos=-1; };

// Recursive-descent scanner over the token stream. parse() never throws:
// anything it cannot make sense of is recorded in ParsedQuery::issues or
// ParsedQuery::unsupported for the executor to report.
class Parser{
    std::string src; std::vector<Token> toks; int i=0, n=0;
    ParsedQuery *q=nullptr;
public:
    explicit Parser(std::string sql);
    ParsedQuery parse();
private:
    bool parse_with(ParsedQuery &out, ParseError &err);
    bool parse_select(ParsedQuery &out, ParseError &err);
    bool parse_select_list(ParsedQuery &out, ParseError &err);
    bool parse_from(ParsedQuery &out, ParseError &err);
    bool parse_table_ref(TableRef &out, ParseError &err);
    bool parse_limit(ParsedQuery &out, ParseError &err);

    bool parse_predicate(Predicate &out, ParseError &err);
    bool parse_and(Predicate &out, ParseError &err);
    bool parse_not(Predicate &out, ParseError &err);
    bool parse_predicate_primary(Predicate &out, ParseError &err);
    bool parse_comparison(Condition &out, ParseError &err);

    bool parse_expr(Expr &out, ParseError &err);
    bool parse_term(Expr &out, ParseError &err);
    bool parse_unary(Expr &out, ParseError &err);
    bool parse_primary(Expr &out, ParseError &err);
    bool parse_function(Expr &out, ParseError &err);

    const Token& cur() const { return toks[i]; }
    const Token& ahead(int k) const { return toks[std::min(i+k, n-1)]; }
    bool at(TokenType t) const { return toks[i].type==t; }
    bool kw(const char *k, int offset=0) const;
    bool accept(TokenType t){ if(at(t)){ ++i; return true; } return false; }
    bool accept_kw(const char *k){ if(kw(k)){ ++i; return true; } return false; }
    bool fail(ParseError &err, const std::string &msg) const;
    bool at_comparison_op() const;
    bool subquery_at(int k) const;
    int matching_paren(int open) const;
    void skip_group();
    void note_unsupported(const std::string &feature);
    std::string slice(int a, int b) const;
};

ParsedQuery parse_query(const std::string &sql);

// Splits a query at top-level UNION [ALL]. `distinct` is set when any
// separator is a bare UNION.
std::vector<std::string> split_union(const std::string &sql, bool *distinct=nullptr);

} // namespace querylab
