#include "querylab/parser.h"
#include "querylab/errors.h"
#include "querylab/utils.h"
#include <cerrno>
#include <cstdlib>

using namespace querylab;

static std::string lower(const std::string &s){ return to_lower(s); }
static bool is_kw(const Token &t, const char* k){ return t.type==TokenType::KW && lower(t.text)==k; }
static bool is_cmp(const Token &t){
    if(t.type!=TokenType::OP) return false;
    return t.text=="=" || t.text=="<>" || t.text=="!=" || t.text=="<" || t.text==">" || t.text=="<=" || t.text==">=";
}
static CompareOp cmp_op(const std::string &op){
    if(op=="=") return CompareOp::EQ;
    if(op=="<>" || op=="!=") return CompareOp::NE;
    if(op=="<") return CompareOp::LT;
    if(op==">") return CompareOp::GT;
    if(op=="<=") return CompareOp::LE;
    return CompareOp::GE;
}

// Identifiers that may serve as an implicit alias: not a misspelled clause keyword.
static bool alias_candidate(const Token &t){ return t.type==TokenType::IDENT && typo_correction(t.text).empty(); }

static void add_table(ParsedQuery &out, const TableRef &t){
    if(t.name.empty()) return;
    out.tables.push_back(t.name);
    if(!t.alias.empty()) out.table_aliases[t.alias]=t.name;
}

static void collect_equalities(const Predicate &p, std::vector<std::pair<Expr,Expr>> &out){
    if(p.kind==PredicateKind::And){ for(const auto &c: p.children) collect_equalities(c, out); return; }
    if(p.kind!=PredicateKind::Comparison) return;
    const Condition &c = p.cond;
    if(c.op==CompareOp::EQ && c.left.kind==ExprKind::Column && c.right.kind==ExprKind::Column) out.emplace_back(c.left, c.right);
}

Parser::Parser(std::string sql): src(std::move(sql)){
    toks = Lexer(src).tokenize();
    n = (int)toks.size();
}

bool Parser::kw(const char *k, int offset) const{ return is_kw(ahead(offset), k); }

bool Parser::fail(ParseError &err, const std::string &msg) const{
    err = {msg, cur().text, cur().pos};
    return false;
}

bool Parser::at_comparison_op() const{
    if(is_cmp(cur()) || at(TokenType::STAR)) return true;
    if(at(TokenType::OP)) return true;
    return kw("like") || kw("in") || kw("is") || kw("between") || kw("not");
}

bool Parser::subquery_at(int k) const{
    if(k>=n) return false;
    return is_kw(toks[k],"select") || is_kw(toks[k],"with");
}

int Parser::matching_paren(int open) const{
    int depth=0;
    for(int k=open;k<n;++k){
        if(toks[k].type==TokenType::LPAREN) ++depth;
        else if(toks[k].type==TokenType::RPAREN){ if(--depth==0) return k; }
    }
    return -1;
}

void Parser::skip_group(){
    int close = matching_paren(i);
    i = close<0 ? n-1 : close+1;
}

void Parser::note_unsupported(const std::string &feature){
    if(!q) return;
    for(const auto &f: q->unsupported) if(f==feature) return;
    q->unsupported.push_back(feature);
}

std::string Parser::slice(int a, int b) const{
    if(a>=b || a>=n) return "";
    int start = toks[a].pos;
    int end = toks[std::min(b,n-1)].pos;
    if(end<start) return "";
    return trim(src.substr(start, end-start));
}

ParsedQuery Parser::parse(){
    ParsedQuery out; out.raw_query = src; q = &out;
    ParseError err;
    try{
        if(at(TokenType::END)) return out;
        if(kw("with")){
            if(!parse_with(out, err)){ out.issues.push_back({err.message, err.near, err.pos}); return out; }
        }
        out.main_query = slice(i, n-1);
        if(kw("select")){
            out.query_type = QueryType::SELECT;
            if(!parse_select(out, err)) out.issues.push_back({err.message, err.near, err.pos});
        } else if(kw("insert")) out.query_type = QueryType::INSERT;
        else if(kw("update")) out.query_type = QueryType::UPDATE;
        else if(kw("delete")) out.query_type = QueryType::DELETE;
        else {
            out.query_type = QueryType::UNKNOWN;
            if(at(TokenType::IDENT) && !typo_correction(cur().text).empty())
                out.issues.push_back({"Unrecognized statement near '"+cur().text+"'", cur().text, cur().pos});
            else
                out.issues.push_back({"Expected SELECT, INSERT, UPDATE, or DELETE", cur().text, cur().pos});
        }
    } catch(const std::exception &e){
        out.issues.push_back({std::string("Could not parse query: ")+e.what(), "", -1});
    }
    q = nullptr;
    return out;
}

bool Parser::parse_with(ParsedQuery &out, ParseError &err){
    ++i;
    if(accept_kw("recursive")) out.is_recursive=true;
    do{
        CTEDefinition cte;
        if(!at(TokenType::IDENT)) return fail(err, "Expected CTE name after WITH");
        cte.name = lower(cur().text); ++i;
        if(accept(TokenType::LPAREN)){
            do{
                if(!at(TokenType::IDENT)) return fail(err, "Expected column name in column list of CTE '"+cte.name+"'");
                cte.columns.push_back(cur().text); ++i;
            } while(accept(TokenType::COMMA));
            if(!accept(TokenType::RPAREN)) return fail(err, "Expected ) after column list of CTE '"+cte.name+"'");
        }
        if(!accept_kw("as")) return fail(err, "Expected AS after CTE name '"+cte.name+"'");
        if(!at(TokenType::LPAREN)) return fail(err, "Expected ( to open the body of CTE '"+cte.name+"'");
        int open=i, close=matching_paren(open);
        if(close<0) return fail(err, "Unbalanced parentheses in CTE '"+cte.name+"'");
        cte.query = slice(open+1, close);
        i = close+1;
        out.ctes.push_back(cte);
    } while(accept(TokenType::COMMA));

    for(auto &cte: out.ctes){
        for(const auto &branch: split_union(cte.query)){
            ParsedQuery b = parse_query(branch);
            for(const auto &t: b.tables) if(t==cte.name) cte.is_recursive=true;
        }
    }
    return true;
}

bool Parser::parse_select(ParsedQuery &out, ParseError &err){
    ++i;
    if(accept_kw("distinct")) out.distinct=true; else accept_kw("all");
    if(!parse_select_list(out, err)) return false;

    if(accept_kw("from")){ if(!parse_from(out, err)) return false; }
    if(accept_kw("where")){
        Predicate p; if(!parse_predicate(p, err)) return false;
        p.collect_conditions(out.where_conditions); out.where=p;
    }
    if(kw("group")){
        ++i; if(!accept_kw("by")) return fail(err, "Expected BY after GROUP");
        do{ Expr e; if(!parse_expr(e, err)) return false; out.group_by.push_back(e); } while(accept(TokenType::COMMA));
    }
    if(accept_kw("having")){
        Predicate p; if(!parse_predicate(p, err)) return false;
        p.collect_conditions(out.having_conditions); out.having=p;
    }
    if(kw("order")){
        ++i; if(!accept_kw("by")) return fail(err, "Expected BY after ORDER");
        do{
            OrderItem o; int s=i;
            if(!parse_expr(o.expr, err)) return false;
            o.text = slice(s,i);
            if(accept_kw("desc")) o.asc=false; else accept_kw("asc");
            out.order_by.push_back(o);
        } while(accept(TokenType::COMMA));
    }
    if(accept_kw("limit")){ if(!parse_limit(out, err)) return false; }
    accept(TokenType::SEMICOLON);

    if(kw("union")){ note_unsupported("UNION"); return true; }
    if(!at(TokenType::END)){
        if(at(TokenType::IDENT) && !typo_correction(cur().text).empty())
            return fail(err, "Unrecognized keyword '"+cur().text+"'");
        return fail(err, "Unexpected token '"+cur().text+"'");
    }
    return true;
}

bool Parser::parse_select_list(ParsedQuery &out, ParseError &err){
    do{
        SelectItem item; int s=i;
        if(at(TokenType::STAR)){ ++i; item.expr.kind=ExprKind::Star; }
        else if(at(TokenType::IDENT) && ahead(1).type==TokenType::DOT && ahead(2).type==TokenType::STAR){
            item.expr.kind=ExprKind::Star; item.expr.qualifier=cur().text; i+=3;
        }
        else if(!parse_expr(item.expr, err)) return false;
        item.text = slice(s,i);
        if(item.expr.kind==ExprKind::Star) item.expr.text = item.text;
        if(accept_kw("as")){
            if(!at(TokenType::IDENT) && !at(TokenType::STRING)) return fail(err, "Expected alias after AS");
            item.alias = cur().text; ++i;
        } else if(!item.is_star() && alias_candidate(cur())){
            item.alias = cur().text; ++i;
        }
        out.columns.push_back(item);
    } while(accept(TokenType::COMMA));
    return true;
}

bool Parser::parse_table_ref(TableRef &out, ParseError &err){
    if(at(TokenType::LPAREN)){
        note_unsupported("Subqueries in FROM");
        skip_group();
    } else {
        if(!at(TokenType::IDENT)) return fail(err, "Expected table name");
        out.name = lower(cur().text); ++i;
        if(at(TokenType::DOT) && ahead(1).type==TokenType::IDENT){ out.name = lower(ahead(1).text); i+=2; }
    }
    if(accept_kw("as")){
        if(!at(TokenType::IDENT)) return fail(err, "Expected alias after AS");
        out.alias = lower(cur().text); ++i;
    } else if(alias_candidate(cur())){
        out.alias = lower(cur().text); ++i;
    }
    return true;
}

bool Parser::parse_from(ParsedQuery &out, ParseError &err){
    if(!parse_table_ref(out.from, err)) return false;
    add_table(out, out.from);
    while(true){
        JoinClause j;
        if(accept(TokenType::COMMA)){
            j.type = JoinType::CROSS;
            if(!parse_table_ref(j.table, err)) return false;
            add_table(out, j.table); out.joins.push_back(j);
            continue;
        }
        if(accept_kw("join")) j.type = JoinType::INNER;
        else if(kw("inner") && kw("join",1)){ i+=2; j.type = JoinType::INNER; }
        else if(kw("left") || kw("right") || kw("full")){
            j.type = kw("left") ? JoinType::LEFT : (kw("right") ? JoinType::RIGHT : JoinType::FULL);
            ++i; accept_kw("outer");
            if(!accept_kw("join")) return fail(err, "Expected JOIN");
        }
        else if(kw("cross")){ ++i; if(!accept_kw("join")) return fail(err, "Expected JOIN after CROSS"); j.type = JoinType::CROSS; }
        else break;

        if(!parse_table_ref(j.table, err)) return false;
        add_table(out, j.table);
        if(accept_kw("on")){
            int s=i; Predicate p;
            if(!parse_predicate(p, err)) return false;
            j.on_text = slice(s,i); collect_equalities(p, j.equalities); j.on = p;
        } else if(j.type!=JoinType::CROSS){
            return fail(err, "JOIN requires ON clause");
        }
        out.joins.push_back(j);
    }
    return true;
}

static bool read_count(const Token &t, int64_t &out){
    if(t.type!=TokenType::NUMBER || t.text.find('.')!=std::string::npos) return false;
    errno=0; char *end=nullptr;
    long long v = std::strtoll(t.text.c_str(), &end, 10);
    if(errno!=0 || v<0) return false;
    out = v; return true;
}

bool Parser::parse_limit(ParsedQuery &out, ParseError &err){
    int64_t a=0, b=0;
    if(!read_count(cur(), a)) return fail(err, "LIMIT expects a non-negative integer");
    ++i;
    if(accept(TokenType::COMMA)){
        if(!read_count(cur(), b)) return fail(err, "LIMIT expects a non-negative integer");
        ++i; out.offset=a; out.limit=b;
        return true;
    }
    out.limit=a;
    if(accept_kw("offset")){
        if(!read_count(cur(), b)) return fail(err, "OFFSET expects a non-negative integer");
        ++i; out.offset=b;
    }
    return true;
}

bool Parser::parse_predicate(Predicate &out, ParseError &err){
    Predicate left; if(!parse_and(left, err)) return false;
    if(!kw("or")){ out=std::move(left); return true; }
    Predicate node; node.kind=PredicateKind::Or; node.children.push_back(std::move(left));
    while(accept_kw("or")){ Predicate r; if(!parse_and(r, err)) return false; node.children.push_back(std::move(r)); }
    out=std::move(node); return true;
}

bool Parser::parse_and(Predicate &out, ParseError &err){
    Predicate left; if(!parse_not(left, err)) return false;
    if(!kw("and")){ out=std::move(left); return true; }
    Predicate node; node.kind=PredicateKind::And; node.children.push_back(std::move(left));
    while(accept_kw("and")){ Predicate r; if(!parse_not(r, err)) return false; node.children.push_back(std::move(r)); }
    out=std::move(node); return true;
}

bool Parser::parse_not(Predicate &out, ParseError &err){
    if(kw("not") && !kw("exists",1)){
        ++i; Predicate inner; if(!parse_not(inner, err)) return false;
        out.kind=PredicateKind::Not; out.children.push_back(std::move(inner));
        return true;
    }
    return parse_predicate_primary(out, err);
}

bool Parser::parse_predicate_primary(Predicate &out, ParseError &err){
    if(kw("exists") || (kw("not") && kw("exists",1))){
        int s=i; accept_kw("not"); ++i;
        note_unsupported("Subqueries");
        if(at(TokenType::LPAREN)) skip_group();
        out.kind=PredicateKind::Comparison;
        out.cond.left=Expr::constant(Value::boolean(true)); out.cond.op=CompareOp::TRUTH; out.cond.text=slice(s,i);
        return true;
    }
    if(at(TokenType::LPAREN) && !subquery_at(i+1)){
        int save=i; ++i;
        Predicate inner; ParseError nested;
        if(parse_predicate(inner, nested) && accept(TokenType::RPAREN) && !at_comparison_op()){ out=std::move(inner); return true; }
        i=save;
    }
    out.kind=PredicateKind::Comparison;
    return parse_comparison(out.cond, err);
}

bool Parser::parse_comparison(Condition &out, ParseError &err){
    int s=i;
    if(!parse_expr(out.left, err)) return false;
    if(is_cmp(cur())){
        out.op = cmp_op(cur().text); ++i;
        if(kw("any") || kw("all")) { note_unsupported("Subqueries"); ++i; }
        if(!parse_expr(out.right, err)) return false;
    } else if(accept_kw("is")){
        bool neg = accept_kw("not");
        if(!accept_kw("null")) return fail(err, "Expected NULL after IS");
        out.op = neg ? CompareOp::IS_NOT_NULL : CompareOp::IS_NULL;
    } else {
        int save=i; bool neg=accept_kw("not");
        if(accept_kw("like")){
            out.op = neg ? CompareOp::NOT_LIKE : CompareOp::LIKE;
            if(!parse_expr(out.right, err)) return false;
        } else if(accept_kw("in")){
            out.op = neg ? CompareOp::NOT_IN : CompareOp::IN;
            if(!at(TokenType::LPAREN)) return fail(err, "Expected ( after IN");
            if(subquery_at(i+1)){ note_unsupported("Subqueries"); skip_group(); }
            else {
                ++i;
                do{ Expr e; if(!parse_expr(e, err)) return false; out.list.push_back(e); } while(accept(TokenType::COMMA));
                if(!accept(TokenType::RPAREN)) return fail(err, "Expected ) to close IN list");
            }
        } else if(accept_kw("between")){
            out.op = neg ? CompareOp::NOT_BETWEEN : CompareOp::BETWEEN;
            if(!parse_expr(out.right, err)) return false;
            if(!accept_kw("and")) return fail(err, "Expected AND in BETWEEN");
            if(!parse_expr(out.high, err)) return false;
        } else {
            if(neg){ i=save+1; return fail(err, "Expected LIKE, IN or BETWEEN after NOT"); }
            out.op = CompareOp::TRUTH;
        }
    }
    out.text = slice(s,i);
    return true;
}

bool Parser::parse_expr(Expr &out, ParseError &err){
    int s=i;
    Expr left; if(!parse_term(left, err)) return false;
    while(at(TokenType::OP) && (cur().text=="+" || cur().text=="-" || cur().text=="||")){
        std::string op = cur().text=="||" ? "CONCAT" : cur().text; ++i;
        Expr r; if(!parse_term(r, err)) return false;
        Expr b;
        if(op=="CONCAT"){ b.kind=ExprKind::Function; b.name="CONCAT"; }
        else { b.kind=ExprKind::Binary; b.op=op; }
        b.args.push_back(std::move(left)); b.args.push_back(std::move(r));
        b.text = slice(s,i);
        left = std::move(b);
    }
    out = std::move(left);
    return true;
}

bool Parser::parse_term(Expr &out, ParseError &err){
    int s=i;
    Expr left; if(!parse_unary(left, err)) return false;
    while(at(TokenType::STAR) || (at(TokenType::OP) && (cur().text=="/" || cur().text=="%"))){
        std::string op = cur().text; ++i;
        Expr r; if(!parse_unary(r, err)) return false;
        Expr b; b.kind=ExprKind::Binary; b.op=op;
        b.args.push_back(std::move(left)); b.args.push_back(std::move(r));
        b.text = slice(s,i);
        left = std::move(b);
    }
    out = std::move(left);
    return true;
}

bool Parser::parse_unary(Expr &out, ParseError &err){
    int s=i;
    if(at(TokenType::OP) && cur().text=="+"){ ++i; return parse_unary(out, err); }
    if(at(TokenType::OP) && cur().text=="-"){
        ++i;
        Expr inner; if(!parse_unary(inner, err)) return false;
        if(inner.kind==ExprKind::Literal && inner.literal.kind()==ValueKind::Integer){
            out = Expr::constant(Value::integer(-inner.literal.as_int()));
        } else if(inner.kind==ExprKind::Literal && inner.literal.kind()==ValueKind::Float){
            out = Expr::constant(Value::real(-inner.literal.as_double()));
        } else {
            out.kind=ExprKind::Unary; out.op="-"; out.args.push_back(std::move(inner));
        }
        out.text = slice(s,i);
        return true;
    }
    return parse_primary(out, err);
}

bool Parser::parse_primary(Expr &out, ParseError &err){
    int s=i;
    const Token &t = cur();
    if(t.type==TokenType::NUMBER){
        errno=0;
        if(t.text.find('.')!=std::string::npos){
            out = Expr::constant(Value::real(std::strtod(t.text.c_str(), nullptr)));
        } else {
            long long v = std::strtoll(t.text.c_str(), nullptr, 10);
            out = errno==ERANGE ? Expr::constant(Value::real(std::strtod(t.text.c_str(), nullptr))) : Expr::constant(Value::integer(v));
        }
        ++i; out.text = t.text;
        return true;
    }
    if(t.type==TokenType::STRING){ out = Expr::constant(Value::text(t.text)); ++i; out.text=slice(s,i); return true; }
    if(is_kw(t,"true") || is_kw(t,"false")){ out = Expr::constant(Value::boolean(is_kw(t,"true"))); ++i; out.text=t.text; return true; }
    if(is_kw(t,"null")){ out = Expr::constant(Value::null()); ++i; out.text=t.text; return true; }
    if(is_kw(t,"case")){
        note_unsupported("CASE expressions");
        int depth=0;
        while(!at(TokenType::END)){
            if(kw("case")) ++depth;
            else if(kw("end") && --depth==0){ ++i; break; }
            ++i;
        }
        out = Expr::constant(Value::null()); out.text = slice(s,i);
        return true;
    }
    if(t.type==TokenType::LPAREN){
        if(subquery_at(i+1)){
            note_unsupported("Subqueries");
            skip_group();
            out = Expr::constant(Value::null()); out.text = slice(s,i);
            return true;
        }
        ++i;
        if(!parse_expr(out, err)) return false;
        if(!accept(TokenType::RPAREN)) return fail(err, "Expected )");
        out.text = slice(s,i);
        return true;
    }
    if(t.type==TokenType::IDENT){
        if(ahead(1).type==TokenType::LPAREN) return parse_function(out, err);
        if(ahead(1).type==TokenType::DOT){
            if(ahead(2).type!=TokenType::IDENT){ i+=2; return fail(err, "Expected column name after '"+t.text+".'"); }
            out = Expr::column(t.text, ahead(2).text); i+=3;
            return true;
        }
        out = Expr::column("", t.text); ++i;
        return true;
    }
    if(t.type==TokenType::END) return fail(err, "Unexpected end of query");
    return fail(err, "Expected expression near '"+t.text+"'");
}

bool Parser::parse_function(Expr &out, ParseError &err){
    int s=i;
    out.kind=ExprKind::Function; out.name=to_upper(cur().text);
    i+=2;
    if(at(TokenType::STAR)){
        ++i; Expr star; star.kind=ExprKind::Star; star.text="*"; out.args.push_back(star);
    } else if(!at(TokenType::RPAREN)){
        if(accept_kw("distinct")) out.distinct=true;
        do{ Expr a; if(!parse_expr(a, err)) return false; out.args.push_back(std::move(a)); } while(accept(TokenType::COMMA));
    }
    if(!accept(TokenType::RPAREN)) return fail(err, "Expected ) to close "+out.name+"(");
    out.text = slice(s,i);
    return true;
}

ParsedQuery querylab::parse_query(const std::string &sql){
    return Parser(sql).parse();
}

std::vector<std::string> querylab::split_union(const std::string &sql, bool *distinct){
    std::vector<Token> toks = Lexer(sql).tokenize();
    std::vector<std::string> parts;
    if(distinct) *distinct=false;
    int depth=0; size_t start=0;
    for(size_t k=0;k<toks.size();++k){
        const Token &t = toks[k];
        if(t.type==TokenType::LPAREN) ++depth;
        else if(t.type==TokenType::RPAREN) --depth;
        else if(depth==0 && is_kw(t,"union")){
            parts.push_back(trim(sql.substr(start, t.pos-start)));
            if(k+1<toks.size() && is_kw(toks[k+1],"all")) ++k;
            else if(distinct) *distinct=true;
            start = k+1<toks.size() ? toks[k+1].pos : sql.size();
        }
    }
    parts.push_back(trim(sql.substr(std::min(start, sql.size()))));
    return parts;
}
