#include "querylab/expression.h"
#include "querylab/utils.h"
#include <cmath>
#include <limits>
#include <set>

namespace querylab {

TriBool tri_and(TriBool a, TriBool b){
    if(a==TriBool::False || b==TriBool::False) return TriBool::False;
    if(a==TriBool::Unknown || b==TriBool::Unknown) return TriBool::Unknown;
    return TriBool::True;
}

TriBool tri_or(TriBool a, TriBool b){
    if(a==TriBool::True || b==TriBool::True) return TriBool::True;
    if(a==TriBool::Unknown || b==TriBool::Unknown) return TriBool::Unknown;
    return TriBool::False;
}

TriBool tri_not(TriBool a){
    if(a==TriBool::Unknown) return a;
    return a==TriBool::True ? TriBool::False : TriBool::True;
}

static TriBool from_bool(bool b){ return b ? TriBool::True : TriBool::False; }

bool like_match(const std::string &text, const std::string &pattern){
    std::string s = to_lower(text), p = to_lower(pattern);
    size_t si=0, pi=0, star=std::string::npos, mark=0;
    while(si<s.size()){
        if(pi<p.size() && (p[pi]=='_' || p[pi]==s[si])){ ++si; ++pi; }
        else if(pi<p.size() && p[pi]=='%'){ star=pi++; mark=si; }
        else if(star!=std::string::npos){ pi=star+1; si=++mark; }
        else return false;
    }
    while(pi<p.size() && p[pi]=='%') ++pi;
    return pi==p.size();
}

int ExpressionEvaluator::resolve(const std::string &qualifier, const std::string &name) const{
    for(size_t k=0;k<slots_.size();++k){
        if(!iequals(slots_[k].name, name)) continue;
        if(qualifier.empty() || iequals(slots_[k].qualifier, qualifier)) return (int)k;
    }
    if(qualifier.empty()) return -1;
    for(size_t k=0;k<slots_.size();++k){
        if(iequals(slots_[k].name, name) && iequals(slots_[k].table, qualifier)) return (int)k;
    }
    return -1;
}

Value ExpressionEvaluator::evaluate(const Expr &e, const RowScope &scope) const{
    switch(e.kind){
        case ExprKind::Literal: return e.literal;
        case ExprKind::Star: return Value::null();
        case ExprKind::Column: {
            if(e.qualifier.empty() && scope.outputs){
                for(const auto &o: *scope.outputs) if(iequals(o.first, e.name)) return o.second;
            }
            int idx = resolve(e.qualifier, e.name);
            if(idx<0 || !scope.row) return Value::null();
            return (*scope.row)[idx];
        }
        case ExprKind::Unary: {
            Value v = evaluate(e.args[0], scope);
            return arithmetic(Value::integer(0), '-', v);
        }
        case ExprKind::Binary:
            return arithmetic(evaluate(e.args[0], scope), e.op[0], evaluate(e.args[1], scope));
        case ExprKind::Function:
            return e.is_aggregate() ? aggregate(e, scope) : scalar(e, scope);
    }
    return Value::null();
}

Value ExpressionEvaluator::aggregate(const Expr &e, const RowScope &scope) const{
    std::vector<const std::vector<Value>*> single;
    const std::vector<const std::vector<Value>*> *rows = scope.group;
    if(!rows){ if(scope.row) single.push_back(scope.row); rows=&single; }

    if(e.name=="COUNT" && (e.args.empty() || e.args[0].kind==ExprKind::Star))
        return Value::integer((int64_t)rows->size());

    std::vector<Value> vals;
    std::set<std::string> seen;
    for(const auto *r: *rows){
        RowScope inner; inner.row=r;
        Value v = e.args.empty() ? Value::null() : evaluate(e.args[0], inner);
        if(v.is_null()) continue;
        if(e.distinct && !seen.insert(group_key(v)).second) continue;
        vals.push_back(v);
    }

    if(e.name=="COUNT") return Value::integer((int64_t)vals.size());
    if(e.name=="MIN" || e.name=="MAX"){
        if(vals.empty()) return Value::null();
        Value best = vals[0];
        for(const auto &v: vals){
            int c = order_values(v, best);
            if((e.name=="MIN" && c<0) || (e.name=="MAX" && c>0)) best=v;
        }
        return best;
    }

    bool all_int=true; int64_t isum=0; double dsum=0.0; size_t count=0;
    for(const auto &v: vals){
        if(!v.is_numeric()) continue;
        if(v.kind()==ValueKind::Float || __builtin_add_overflow(isum, v.as_int(), &isum)) all_int=false;
        dsum+=v.as_double(); ++count;
    }
    if(count==0) return Value::null();
    if(e.name=="SUM") return all_int ? Value::integer(isum) : Value::real(dsum);
    return Value::real(dsum/double(count));
}

static Value date_part(const Value &v, int part){
    DateValue d;
    if(v.kind()==ValueKind::Date) d=v.as_date();
    else if(v.kind()==ValueKind::Text){ auto parsed=parse_date(v.as_text()); if(!parsed) return Value::null(); d=*parsed; }
    else return Value::null();
    return Value::integer(part==0 ? d.year : (part==1 ? d.month : d.day));
}

Value ExpressionEvaluator::scalar(const Expr &e, const RowScope &scope) const{
    std::vector<Value> args;
    for(const auto &a: e.args) args.push_back(evaluate(a, scope));
    const std::string &fn = e.name;

    if(fn=="COALESCE" || fn=="IFNULL"){
        for(const auto &v: args) if(!v.is_null()) return v;
        return Value::null();
    }
    if(fn=="CONCAT"){
        std::string out;
        for(const auto &v: args){ if(v.is_null()) return Value::null(); out+=v.to_string(); }
        return Value::text(out);
    }
    if(args.empty() || args[0].is_null()) return Value::null();
    const Value &v = args[0];

    if(fn=="UPPER") return Value::text(to_upper(v.to_string()));
    if(fn=="LOWER") return Value::text(to_lower(v.to_string()));
    if(fn=="LENGTH") return Value::integer((int64_t)v.to_string().size());
    if(fn=="YEAR") return date_part(v, 0);
    if(fn=="MONTH") return date_part(v, 1);
    if(fn=="DAY") return date_part(v, 2);
    if(!v.is_numeric()) return Value::null();
    if(fn=="ABS"){
        if(v.kind()==ValueKind::Float) return Value::real(std::fabs(v.as_double()));
        int64_t n = v.as_int();
        if(n==std::numeric_limits<int64_t>::min()) return Value::real(-double(n));
        return Value::integer(n<0 ? -n : n);
    }
    if(fn=="ROUND"){
        int64_t digits = 0;
        if(args.size()>1){ if(!args[1].is_numeric()) return Value::null(); digits=args[1].as_int(); }
        if(v.kind()!=ValueKind::Float && digits>=0) return Value::integer(v.as_int());
        double f = std::pow(10.0, (double)digits);
        return Value::real(std::round(v.as_double()*f)/f);
    }
    return Value::null();
}

std::optional<int> ExpressionEvaluator::compareChecked(const Expr &left, const Value &a, const Value &b) const{
    if(a.is_null() || b.is_null()) return std::nullopt;
    auto c = compare_values(a, b);
    if(!c && diagnostics_ && !diagnostics_->type_mismatch)
        diagnostics_->type_mismatch = type_mismatch_error(left.text, kind_name(a.kind()), kind_name(b.kind()));
    return c;
}

TriBool ExpressionEvaluator::compare(const Condition &c, const RowScope &scope) const{
    Value a = evaluate(c.left, scope);
    switch(c.op){
        case CompareOp::IS_NULL: return from_bool(a.is_null());
        case CompareOp::IS_NOT_NULL: return from_bool(!a.is_null());
        case CompareOp::TRUTH:
            if(a.is_null() || !a.is_numeric()) return TriBool::Unknown;
            return from_bool(a.as_bool());
        case CompareOp::LIKE:
        case CompareOp::NOT_LIKE: {
            Value p = evaluate(c.right, scope);
            if(a.is_null() || p.is_null()) return TriBool::Unknown;
            bool m = like_match(a.to_string(), p.to_string());
            return from_bool(c.op==CompareOp::LIKE ? m : !m);
        }
        case CompareOp::IN:
        case CompareOp::NOT_IN: {
            if(a.is_null()) return TriBool::Unknown;
            bool found=false, saw_null=false;
            for(const auto &item: c.list){
                Value v = evaluate(item, scope);
                if(v.is_null()){ saw_null=true; continue; }
                auto r = compareChecked(c.left, a, v);
                if(r && *r==0){ found=true; break; }
            }
            TriBool res = found ? TriBool::True : (saw_null ? TriBool::Unknown : TriBool::False);
            return c.op==CompareOp::IN ? res : tri_not(res);
        }
        case CompareOp::BETWEEN:
        case CompareOp::NOT_BETWEEN: {
            Value lo = evaluate(c.right, scope), hi = evaluate(c.high, scope);
            auto r1 = compareChecked(c.left, a, lo), r2 = compareChecked(c.left, a, hi);
            TriBool ge = r1 ? from_bool(*r1>=0) : TriBool::Unknown;
            TriBool le = r2 ? from_bool(*r2<=0) : TriBool::Unknown;
            TriBool res = tri_and(ge, le);
            return c.op==CompareOp::BETWEEN ? res : tri_not(res);
        }
        default: break;
    }
    Value b = evaluate(c.right, scope);
    auto r = compareChecked(c.left, a, b);
    if(!r) return TriBool::Unknown;
    switch(c.op){
        case CompareOp::EQ: return from_bool(*r==0);
        case CompareOp::NE: return from_bool(*r!=0);
        case CompareOp::LT: return from_bool(*r<0);
        case CompareOp::GT: return from_bool(*r>0);
        case CompareOp::LE: return from_bool(*r<=0);
        case CompareOp::GE: return from_bool(*r>=0);
        default: return TriBool::Unknown;
    }
}

TriBool ExpressionEvaluator::test(const Predicate &p, const RowScope &scope) const{
    switch(p.kind){
        case PredicateKind::Comparison: return compare(p.cond, scope);
        case PredicateKind::Not: return tri_not(test(p.children[0], scope));
        case PredicateKind::And: {
            TriBool acc = TriBool::True;
            for(const auto &c: p.children){ acc = tri_and(acc, test(c, scope)); if(acc==TriBool::False) break; }
            return acc;
        }
        case PredicateKind::Or: {
            TriBool acc = TriBool::False;
            for(const auto &c: p.children){ acc = tri_or(acc, test(c, scope)); if(acc==TriBool::True) break; }
            return acc;
        }
    }
    return TriBool::Unknown;
}

} // namespace querylab
