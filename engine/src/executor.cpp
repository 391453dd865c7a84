#include "querylab/executor.h"
#include "querylab/parser.h"
#include "querylab/utils.h"
#include <algorithm>
#include <chrono>
#include <sstream>

namespace querylab {

namespace {

std::string rowKey(const std::vector<Value>& values) {
    std::string key;
    for (const auto& v : values) {
        key += group_key(v);
        key += '\x1f';
    }
    return key;
}

void dedupeRows(std::vector<std::vector<Value>>& rows) {
    std::set<std::string> seen;
    std::vector<std::vector<Value>> kept;
    for (auto& r : rows) {
        if (seen.insert(rowKey(r)).second) kept.push_back(std::move(r));
    }
    rows = std::move(kept);
}

template <typename Fn>
void visitPredicate(const Predicate& p, Fn&& fn) {
    if (p.kind != PredicateKind::Comparison) {
        for (const auto& child : p.children) visitPredicate(child, fn);
        return;
    }
    const Condition& c = p.cond;
    fn(c.left);
    switch (c.op) {
        case CompareOp::IS_NULL:
        case CompareOp::IS_NOT_NULL:
        case CompareOp::TRUTH:
            break;
        case CompareOp::IN:
        case CompareOp::NOT_IN:
            for (const auto& e : c.list) fn(e);
            break;
        case CompareOp::BETWEEN:
        case CompareOp::NOT_BETWEEN:
            fn(c.right);
            fn(c.high);
            break;
        default:
            fn(c.right);
            break;
    }
}

std::string predicateText(const Predicate& p) {
    switch (p.kind) {
        case PredicateKind::Comparison:
            return p.cond.text;
        case PredicateKind::Not:
            return "NOT (" + predicateText(p.children[0]) + ")";
        case PredicateKind::And: {
            std::vector<std::string> parts;
            for (const auto& c : p.children) {
                std::string t = predicateText(c);
                parts.push_back(c.kind == PredicateKind::Or ? "(" + t + ")" : t);
            }
            return join(parts, " AND ");
        }
        case PredicateKind::Or: {
            std::vector<std::string> parts;
            for (const auto& c : p.children) parts.push_back(predicateText(c));
            return join(parts, " OR ");
        }
    }
    return "";
}

std::string unsupportedAlternative(const std::string& feature) {
    if (feature == "UNION") return "UNION is only supported between the branches of a CTE body";
    if (feature == "Subqueries") return "Rewrite the subquery as a JOIN or move it into a WITH clause";
    if (feature == "Subqueries in FROM") return "Move the derived table into a WITH clause and select from it";
    return "";
}

bool isPosition(const Expr& e) {
    return e.kind == ExprKind::Literal && e.literal.kind() == ValueKind::Integer;
}

} // namespace

QueryExecutor::QueryExecutor(const Dataset& dataset, const Config& config, std::shared_ptr<Logger> logger)
    : dataset_(dataset), config_(config), logger_(std::move(logger)) {}

void QueryExecutor::debug(const std::string& message) const {
    if (logger_) logger_->debug(message);
}

void QueryExecutor::warn(const std::string& message) const {
    if (logger_) logger_->warn(message);
}

std::vector<std::string> QueryExecutor::availableTables() const {
    std::vector<std::string> names = dataset_.table_names();
    for (const auto& kv : cte_tables_) {
        if (std::find(names.begin(), names.end(), kv.first) == names.end()) names.push_back(kv.first);
    }
    return names;
}

QueryResult QueryExecutor::execute(const std::string& sql) {
    auto start = std::chrono::high_resolution_clock::now();
    QueryResult result;
    result.query = sql;
    cte_tables_.clear();
    warnings_.clear();
    diagnostics_ = EvalDiagnostics();

    try {
        if (trim(sql).empty()) throw QueryException(empty_query_error());

        ParsedQuery q = parse_query(sql);
        debug("Parsed " + std::string(query_type_name(q.query_type)) + ": " + std::to_string(q.tables.size()) +
              " table(s), " + std::to_string(q.columns.size()) + " select item(s), " +
              std::to_string(q.ctes.size()) + " CTE(s)");
        checkParsed(q);
        materializeCTEs(q, result);

        Table out = runSelect(q, &result.stages);
        result.columns = out.columns;
        for (const auto& values : out.rows) {
            Row row;
            for (size_t i = 0; i < values.size(); ++i) row.append(out.columns[i], values[i]);
            result.rows.push_back(std::move(row));
        }
        result.row_count = result.rows.size();
        result.success = true;
    } catch (const QueryException& e) {
        result.error = e.error();
        warn("Query failed: " + e.error().str());
    } catch (const std::exception& e) {
        result.error = syntax_error(std::string("Query execution failed: ") + e.what());
        warn("Query failed: " + result.error->str());
    }

    if (diagnostics_.type_mismatch) {
        warnings_.push_back(diagnostics_.type_mismatch->message +
                            "; rows with incompatible values were treated as non-matching");
    }
    result.warnings = warnings_;
    cte_tables_.clear();

    auto end = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end - start).count();
    debug("Query finished in " + std::to_string(result.execution_time_ms) + " ms, " +
          std::to_string(result.row_count) + " row(s)");
    return result;
}

void QueryExecutor::checkParsed(const ParsedQuery& q) const {
    if (!q.issues.empty()) {
        const ParseIssue& issue = q.issues.front();
        throw QueryException(syntax_error(issue.message, issue.near));
    }
    if (q.query_type != QueryType::SELECT) {
        throw QueryException(unsupported_feature_error(std::string(query_type_name(q.query_type)) + " queries",
                                                       "Only SELECT queries are supported"));
    }
    if (!q.unsupported.empty()) {
        const std::string& feature = q.unsupported.front();
        throw QueryException(unsupported_feature_error(feature, unsupportedAlternative(feature)));
    }
}

std::vector<ParsedQuery> QueryExecutor::parseBody(const CTEDefinition& cte, bool* distinct) const {
    std::vector<ParsedQuery> branches;
    for (const auto& text : split_union(cte.query, distinct)) {
        if (text.empty()) {
            throw QueryException(syntax_error("CTE '" + cte.name + "' has an empty query", cte.name));
        }
        ParsedQuery b = parse_query(text);
        checkParsed(b);
        if (!b.ctes.empty()) {
            throw QueryException(unsupported_feature_error("Nested WITH clauses",
                                                           "Declare every CTE in the outer WITH list"));
        }
        branches.push_back(std::move(b));
    }
    return branches;
}

void QueryExecutor::checkForwardReferences(const ParsedQuery& q) const {
    for (size_t i = 0; i < q.ctes.size(); ++i) {
        for (size_t j = 0; j < i; ++j) {
            if (q.ctes[j].name == q.ctes[i].name) {
                throw QueryException(syntax_error("CTE '" + q.ctes[i].name + "' is defined more than once"));
            }
        }
    }
    for (size_t i = 0; i < q.ctes.size(); ++i) {
        for (const auto& text : split_union(q.ctes[i].query)) {
            ParsedQuery b = parse_query(text);
            for (const auto& t : b.tables) {
                for (size_t j = i + 1; j < q.ctes.size(); ++j) {
                    if (q.ctes[j].name == t) throw QueryException(forward_reference_error(q.ctes[i].name, t));
                }
            }
        }
    }
}

void QueryExecutor::materializeCTEs(const ParsedQuery& q, QueryResult& result) {
    if (q.ctes.empty()) return;
    checkForwardReferences(q);

    for (const auto& cte : q.ctes) {
        CTEInfo info;
        info.name = cte.name;
        info.is_recursive = cte.is_recursive;
        if (cte.is_recursive && !q.is_recursive) {
            warnings_.push_back("CTE '" + cte.name + "' references itself without WITH RECURSIVE; it was evaluated recursively");
        }

        Table table = cte.is_recursive ? evaluateRecursiveCTE(cte, info) : evaluateCTE(cte, info);
        info.row_count = table.rows.size();
        info.columns = table.columns;
        debug("CTE '" + cte.name + "' materialized " + std::to_string(info.row_count) + " row(s)");

        cte_tables_[cte.name] = std::move(table);
        result.cte_info.push_back(std::move(info));
    }
}

QueryExecutor::Table QueryExecutor::runBranches(const std::vector<ParsedQuery>& branches, const std::string& cte_name) {
    Table acc;
    bool first = true;
    for (const auto& b : branches) {
        Table t = runSelect(b, nullptr);
        if (first) {
            acc.columns = t.columns;
            first = false;
        } else if (t.columns.size() != acc.columns.size()) {
            throw QueryException(syntax_error("UNION branches of CTE '" + cte_name + "' return " +
                                              std::to_string(acc.columns.size()) + " and " +
                                              std::to_string(t.columns.size()) + " columns"));
        }
        for (auto& r : t.rows) acc.rows.push_back(std::move(r));
    }
    return acc;
}

void QueryExecutor::applyColumnNames(const CTEDefinition& cte, Table& table) const {
    if (cte.columns.empty()) return;
    if (cte.columns.size() != table.columns.size()) {
        throw QueryException(syntax_error("CTE '" + cte.name + "' declares " + std::to_string(cte.columns.size()) +
                                          " column(s) but its query returns " + std::to_string(table.columns.size())));
    }
    table.columns = cte.columns;
}

QueryExecutor::Table QueryExecutor::evaluateCTE(const CTEDefinition& cte, CTEInfo& info) {
    bool distinct = false;
    std::vector<ParsedQuery> branches = parseBody(cte, &distinct);
    Table table = runBranches(branches, cte.name);
    if (distinct) dedupeRows(table.rows);
    applyColumnNames(cte, table);
    info.iterations = 0;
    return table;
}

QueryExecutor::Table QueryExecutor::evaluateRecursiveCTE(const CTEDefinition& cte, CTEInfo& info) {
    bool distinct = false;
    std::vector<ParsedQuery> anchors, members;
    for (auto& b : parseBody(cte, &distinct)) {
        bool self = std::find(b.tables.begin(), b.tables.end(), cte.name) != b.tables.end();
        (self ? members : anchors).push_back(std::move(b));
    }
    if (anchors.empty()) {
        throw QueryException(syntax_error("Recursive CTE '" + cte.name +
                                          "' needs a non-recursive anchor query before UNION ALL", cte.name));
    }

    Table acc = runBranches(anchors, cte.name);
    if (distinct) dedupeRows(acc.rows);
    applyColumnNames(cte, acc);

    std::set<std::string> seen;
    if (distinct) {
        for (const auto& r : acc.rows) seen.insert(rowKey(r));
    }

    const int limit = std::max(1, config_.getInt("max_recursion_depth", 100));
    auto step = [&](const std::vector<std::vector<Value>>& input) {
        cte_tables_[cte.name] = Table{acc.columns, input};
        std::vector<std::vector<Value>> produced;
        for (const auto& member : members) {
            Table out = runSelect(member, nullptr);
            if (out.columns.size() != acc.columns.size()) {
                throw QueryException(syntax_error("Recursive member of CTE '" + cte.name + "' returns " +
                                                  std::to_string(out.columns.size()) + " columns, anchor returns " +
                                                  std::to_string(acc.columns.size())));
            }
            for (auto& r : out.rows) {
                if (distinct && !seen.insert(rowKey(r)).second) continue;
                produced.push_back(std::move(r));
            }
        }
        return produced;
    };

    std::vector<std::vector<Value>> working = acc.rows;
    int iteration = 0;
    while (!working.empty() && iteration < limit) {
        std::vector<std::vector<Value>> produced = step(working);
        ++iteration;
        debug("CTE '" + cte.name + "' iteration " + std::to_string(iteration) + ": " +
              std::to_string(produced.size()) + " new row(s)");
        acc.rows.insert(acc.rows.end(), produced.begin(), produced.end());
        working = std::move(produced);
    }
    // At the ceiling, one more step tells a finished recursion from a cut-off one.
    bool cut_off = !working.empty() && !step(working).empty();
    cte_tables_.erase(cte.name);

    info.iterations = iteration;
    if (cut_off) {
        info.truncated = true;
        std::string msg = "Recursive CTE '" + cte.name + "' stopped after " + std::to_string(limit) +
                          " iterations (max_recursion_depth); results may be incomplete";
        warnings_.push_back(msg);
        warn(msg);
    }
    return acc;
}

QueryExecutor::Relation QueryExecutor::scan(const TableRef& ref) const {
    Relation rel;
    const std::string qualifier = ref.alias.empty() ? ref.name : ref.alias;

    auto cte = cte_tables_.find(ref.name);
    if (cte != cte_tables_.end()) {
        for (const auto& col : cte->second.columns) rel.slots.push_back({qualifier, ref.name, col});
        rel.rows = cte->second.rows;
        return rel;
    }
    if (!dataset_.has_table(ref.name)) {
        throw QueryException(unknown_table_error(ref.name, availableTables()));
    }

    std::vector<std::string> columns = dataset_.get_table_columns(ref.name);
    for (const auto& col : columns) rel.slots.push_back({qualifier, ref.name, col});
    for (const Row& row : dataset_.get_table(ref.name)) {
        std::vector<Value> values;
        values.reserve(columns.size());
        for (const auto& col : columns) values.push_back(row.get(col));
        rel.rows.push_back(std::move(values));
    }
    return rel;
}

QueryExecutor::Relation QueryExecutor::joinRelations(const Relation& left, const Relation& right, const JoinClause& clause) {
    Relation out;
    out.slots = left.slots;
    out.slots.insert(out.slots.end(), right.slots.begin(), right.slots.end());

    ExpressionEvaluator eval(out.slots, &diagnostics_);
    auto combine = [](const std::vector<Value>& a, const std::vector<Value>& b) {
        std::vector<Value> r(a);
        r.insert(r.end(), b.begin(), b.end());
        return r;
    };
    auto matches = [&](const std::vector<Value>& combined) {
        if (!clause.on) return true;
        RowScope scope;
        scope.row = &combined;
        return eval.test(*clause.on, scope) == TriBool::True;
    };
    const std::vector<Value> left_nulls(left.slots.size());
    const std::vector<Value> right_nulls(right.slots.size());

    if (clause.type == JoinType::RIGHT) {
        for (const auto& r : right.rows) {
            bool matched = false;
            for (const auto& l : left.rows) {
                std::vector<Value> c = combine(l, r);
                if (matches(c)) {
                    out.rows.push_back(std::move(c));
                    matched = true;
                }
            }
            if (!matched) out.rows.push_back(combine(left_nulls, r));
        }
        return out;
    }

    std::vector<bool> right_matched(right.rows.size(), false);
    for (const auto& l : left.rows) {
        bool matched = false;
        for (size_t k = 0; k < right.rows.size(); ++k) {
            std::vector<Value> c = combine(l, right.rows[k]);
            if (matches(c)) {
                out.rows.push_back(std::move(c));
                matched = true;
                right_matched[k] = true;
            }
        }
        if (!matched && (clause.type == JoinType::LEFT || clause.type == JoinType::FULL)) {
            out.rows.push_back(combine(l, right_nulls));
        }
    }
    if (clause.type == JoinType::FULL) {
        for (size_t k = 0; k < right.rows.size(); ++k) {
            if (!right_matched[k]) out.rows.push_back(combine(left_nulls, right.rows[k]));
        }
    }
    return out;
}

void QueryExecutor::validateExpr(const Expr& e, const ParsedQuery& q, const std::vector<ColumnSlot>& slots,
                                 const std::string& clause, const std::set<std::string>& aliases,
                                 bool in_aggregate) const {
    ExpressionEvaluator resolver(slots);
    auto knownQualifier = [&](const std::string& qualifier) {
        for (const auto& s : slots) {
            if (iequals(s.qualifier, qualifier) || iequals(s.table, qualifier)) return true;
        }
        return false;
    };
    auto qualifierError = [&](const std::string& qualifier) {
        std::vector<std::string> names = q.tables;
        for (const auto& kv : q.table_aliases) names.push_back(kv.first);
        return QueryException(unknown_table_error(qualifier, names));
    };

    switch (e.kind) {
        case ExprKind::Literal:
            return;
        case ExprKind::Star:
            if (!e.qualifier.empty() && !knownQualifier(e.qualifier)) throw qualifierError(e.qualifier);
            if (slots.empty() && !in_aggregate) throw QueryException(no_tables_error());
            return;
        case ExprKind::Column: {
            if (e.qualifier.empty() && !aliases.count(to_lower(e.name))) {
                std::vector<std::string> qualified;
                for (const auto& s : slots) {
                    if (!iequals(s.name, e.name)) continue;
                    std::string candidate = s.qualifier + "." + s.name;
                    if (std::find(qualified.begin(), qualified.end(), candidate) == qualified.end()) {
                        qualified.push_back(candidate);
                    }
                }
                if (qualified.size() > 1) throw QueryException(ambiguous_column_error(e.name, qualified));
            }
            if (resolver.resolve(e.qualifier, e.name) >= 0) return;
            if (e.qualifier.empty()) {
                if (aliases.count(to_lower(e.name))) return;
                if (slots.empty()) throw QueryException(no_tables_error());
                std::vector<std::string> available;
                for (const auto& s : slots) {
                    if (std::find(available.begin(), available.end(), s.name) == available.end()) available.push_back(s.name);
                }
                std::string table = q.tables.size() == 1 ? q.tables.front() : join(q.tables, ", ");
                throw QueryException(unknown_column_error(e.name, table, available));
            }
            if (!knownQualifier(e.qualifier)) throw qualifierError(e.qualifier);
            std::vector<std::string> available;
            for (const auto& s : slots) {
                if (iequals(s.qualifier, e.qualifier) || iequals(s.table, e.qualifier)) available.push_back(s.name);
            }
            std::string table = q.resolve_table(e.qualifier);
            throw QueryException(unknown_column_error(e.name, table.empty() ? e.qualifier : table, available));
        }
        case ExprKind::Unary:
        case ExprKind::Binary:
            for (const auto& a : e.args) validateExpr(a, q, slots, clause, aliases, in_aggregate);
            return;
        case ExprKind::Function:
            break;
    }

    if (e.is_aggregate()) {
        if (clause == "WHERE" || clause == "ON" || clause == "GROUP BY") {
            QueryError err = syntax_error("Aggregate function " + e.name + "() is not allowed in " + clause);
            err.suggestion = "Filter on aggregates with HAVING";
            throw QueryException(err);
        }
        if (in_aggregate) throw QueryException(syntax_error("Aggregate functions cannot be nested: " + e.text));
        if (e.args.size() != 1) throw QueryException(syntax_error(e.name + "() expects exactly one argument"));
        if (e.args[0].kind == ExprKind::Star && (e.name != "COUNT" || !e.args[0].qualifier.empty())) {
            throw QueryException(syntax_error(e.name + "(*) is not valid; only COUNT(*) accepts *"));
        }
        const std::set<std::string> none;
        validateExpr(e.args[0], q, slots, clause, none, true);
        return;
    }
    if (!is_scalar_function(e.name)) {
        throw QueryException(unsupported_feature_error(
            "Function " + e.name + "()",
            "Supported functions: COUNT, SUM, AVG, MIN, MAX, UPPER, LOWER, LENGTH, ABS, ROUND, COALESCE, IFNULL, "
            "CONCAT, YEAR, MONTH, DAY"));
    }
    if (e.args.empty()) throw QueryException(syntax_error(e.name + "() expects at least one argument"));
    for (const auto& a : e.args) {
        if (a.kind == ExprKind::Star) throw QueryException(syntax_error(e.name + "(*) is not valid"));
        validateExpr(a, q, slots, clause, aliases, in_aggregate);
    }
}

void QueryExecutor::validate(const ParsedQuery& q, const std::vector<ColumnSlot>& slots) const {
    const std::set<std::string> none;
    std::set<std::string> aliases;
    for (const auto& item : q.columns) {
        if (!item.alias.empty()) aliases.insert(to_lower(item.alias));
    }
    // ORDER BY sees every select-list output, not only AS aliases.
    std::set<std::string> output_names = aliases;
    for (const auto& item : q.columns) {
        if (!item.is_star()) output_names.insert(to_lower(item.output_name()));
    }

    for (const auto& item : q.columns) validateExpr(item.expr, q, slots, "SELECT", none, false);
    for (const auto& j : q.joins) {
        if (j.on) visitPredicate(*j.on, [&](const Expr& e) { validateExpr(e, q, slots, "ON", none, false); });
    }
    if (q.where) visitPredicate(*q.where, [&](const Expr& e) { validateExpr(e, q, slots, "WHERE", none, false); });
    for (const auto& g : q.group_by) validateExpr(g, q, slots, "GROUP BY", aliases, false);
    if (q.having) visitPredicate(*q.having, [&](const Expr& e) { validateExpr(e, q, slots, "HAVING", aliases, false); });
    for (const auto& o : q.order_by) {
        if (isPosition(o.expr)) {
            int64_t pos = o.expr.literal.as_int();
            size_t width = 0;
            for (const auto& item : q.columns) {
                if (!item.is_star()) { ++width; continue; }
                for (const auto& s : slots) {
                    if (item.expr.qualifier.empty() || iequals(s.qualifier, item.expr.qualifier) ||
                        iequals(s.table, item.expr.qualifier)) ++width;
                }
            }
            if (pos < 1 || static_cast<size_t>(pos) > width) {
                throw QueryException(syntax_error("ORDER BY position " + std::to_string(pos) +
                                                  " is not in the select list", o.text));
            }
            continue;
        }
        validateExpr(o.expr, q, slots, "ORDER BY", output_names, false);
    }
}

QueryExecutor::Table QueryExecutor::runSelect(const ParsedQuery& q, std::vector<StageInfo>* stages) {
    auto record = [&](const char* name, const std::string& clause, size_t in, size_t out, bool active) {
        if (stages) stages->push_back({name, clause, in, out, active});
    };

    // FROM and the joined tables, scanned up front so validation sees every slot.
    Relation rel;
    std::vector<Relation> joined;
    if (!q.tables.empty()) {
        rel = scan(q.from);
        for (const auto& j : q.joins) joined.push_back(scan(j.table));
    }
    std::vector<ColumnSlot> all_slots = rel.slots;
    for (const auto& r : joined) all_slots.insert(all_slots.end(), r.slots.begin(), r.slots.end());
    validate(q, all_slots);

    if (q.tables.empty()) rel.rows.emplace_back();
    record("FROM", join(q.tables, ", "), rel.rows.size(), rel.rows.size(), !q.tables.empty());

    size_t before = rel.rows.size();
    std::vector<std::string> join_texts;
    for (size_t k = 0; k < joined.size(); ++k) {
        const JoinClause& j = q.joins[k];
        rel = joinRelations(rel, joined[k], j);
        join_texts.push_back(std::string(join_type_name(j.type)) + " JOIN " + j.table.name +
                             (j.on_text.empty() ? "" : " ON " + j.on_text));
    }
    record("JOIN", join(join_texts, "; "), before, rel.rows.size(), !q.joins.empty());

    ExpressionEvaluator eval(rel.slots, &diagnostics_);

    before = rel.rows.size();
    if (q.where) {
        std::vector<std::vector<Value>> kept;
        for (auto& row : rel.rows) {
            RowScope scope;
            scope.row = &row;
            if (eval.test(*q.where, scope) == TriBool::True) kept.push_back(std::move(row));
        }
        rel.rows = std::move(kept);
    }
    record("WHERE", q.where ? predicateText(*q.where) : "", before, rel.rows.size(), q.where.has_value());

    bool grouped = !q.group_by.empty() || q.having.has_value();
    for (const auto& item : q.columns) grouped = grouped || item.expr.contains_aggregate();
    for (const auto& o : q.order_by) grouped = grouped || o.expr.contains_aggregate();

    struct Group {
        std::vector<const std::vector<Value>*> members;
        const std::vector<Value>* representative = nullptr;
    };
    const std::vector<Value> null_row(rel.slots.size());
    std::vector<Group> groups;
    std::vector<std::string> group_texts;
    if (grouped) {
        // GROUP BY may name a select alias or a select-list position.
        std::vector<const Expr*> keys;
        for (const auto& g : q.group_by) {
            group_texts.push_back(g.text);
            const Expr* key = &g;
            if (isPosition(g)) {
                int64_t pos = g.literal.as_int();
                if (pos < 1 || static_cast<size_t>(pos) > q.columns.size() || q.columns[pos - 1].is_star()) {
                    throw QueryException(syntax_error("GROUP BY position " + std::to_string(pos) +
                                                      " is not in the select list", g.text));
                }
                key = &q.columns[pos - 1].expr;
            } else if (g.kind == ExprKind::Column && g.qualifier.empty() && eval.resolve("", g.name) < 0) {
                for (const auto& item : q.columns) {
                    if (iequals(item.alias, g.name)) key = &item.expr;
                }
            }
            if (key->contains_aggregate()) {
                throw QueryException(syntax_error("Cannot GROUP BY an aggregate: " + g.text, g.text));
            }
            keys.push_back(key);
        }

        std::map<std::string, size_t> index;
        for (const auto& row : rel.rows) {
            RowScope scope;
            scope.row = &row;
            std::string key;
            for (const Expr* k : keys) {
                key += group_key(eval.evaluate(*k, scope));
                key += '\x1f';
            }
            auto it = index.find(key);
            if (it == index.end()) {
                index.emplace(key, groups.size());
                groups.push_back(Group());
                groups.back().members.push_back(&row);
            } else {
                groups[it->second].members.push_back(&row);
            }
        }
        if (q.group_by.empty() && groups.empty()) groups.push_back(Group());
        for (auto& g : groups) g.representative = g.members.empty() ? &null_row : g.members.front();
    }
    record("GROUP BY", join(group_texts, ", "), rel.rows.size(), grouped ? groups.size() : rel.rows.size(),
           !q.group_by.empty());

    // Output columns, with stars expanded against the joined relation.
    std::vector<std::string> columns;
    std::vector<std::vector<size_t>> star_slots(q.columns.size());
    for (size_t i = 0; i < q.columns.size(); ++i) {
        const SelectItem& item = q.columns[i];
        if (!item.is_star()) {
            columns.push_back(item.output_name());
            continue;
        }
        for (size_t k = 0; k < rel.slots.size(); ++k) {
            const ColumnSlot& s = rel.slots[k];
            if (item.expr.qualifier.empty() || iequals(s.qualifier, item.expr.qualifier) ||
                iequals(s.table, item.expr.qualifier)) {
                columns.push_back(s.name);
                star_slots[i].push_back(k);
            }
        }
    }

    auto project = [&](const RowScope& scope) {
        std::vector<Value> values;
        values.reserve(columns.size());
        for (size_t i = 0; i < q.columns.size(); ++i) {
            if (q.columns[i].is_star()) {
                for (size_t k : star_slots[i]) values.push_back((*scope.row)[k]);
            } else {
                values.push_back(eval.evaluate(q.columns[i].expr, scope));
            }
        }
        return values;
    };
    auto namedOutputs = [&](const std::vector<Value>& values) {
        std::vector<std::pair<std::string, Value>> outputs;
        for (size_t i = 0; i < values.size(); ++i) outputs.emplace_back(columns[i], values[i]);
        return outputs;
    };

    struct OutputRow {
        std::vector<Value> values;
        RowScope scope;
    };
    std::vector<OutputRow> out;
    if (grouped) {
        for (const auto& g : groups) {
            RowScope scope;
            scope.row = g.representative;
            scope.group = &g.members;
            std::vector<Value> values = project(scope);
            if (q.having) {
                auto outputs = namedOutputs(values);
                RowScope having_scope = scope;
                having_scope.outputs = &outputs;
                if (eval.test(*q.having, having_scope) != TriBool::True) continue;
            }
            out.push_back({std::move(values), scope});
        }
        record("HAVING", q.having ? predicateText(*q.having) : "", groups.size(), out.size(), q.having.has_value());
    } else {
        for (const auto& row : rel.rows) {
            RowScope scope;
            scope.row = &row;
            out.push_back({project(scope), scope});
        }
        record("HAVING", "", out.size(), out.size(), false);
    }

    std::vector<std::string> select_texts;
    for (const auto& item : q.columns) select_texts.push_back(item.text + (item.alias.empty() ? "" : " AS " + item.alias));
    record("SELECT", join(select_texts, ", "), out.size(), out.size(), true);

    before = out.size();
    if (q.distinct) {
        std::set<std::string> seen;
        std::vector<OutputRow> kept;
        for (auto& r : out) {
            if (seen.insert(rowKey(r.values)).second) kept.push_back(std::move(r));
        }
        out = std::move(kept);
    }
    record("DISTINCT", q.distinct ? "DISTINCT" : "", before, out.size(), q.distinct);

    std::vector<std::string> order_texts;
    if (!q.order_by.empty()) {
        std::vector<std::vector<Value>> keys(out.size());
        for (size_t i = 0; i < out.size(); ++i) {
            auto outputs = namedOutputs(out[i].values);
            RowScope scope = out[i].scope;
            scope.outputs = &outputs;
            for (const auto& o : q.order_by) {
                if (isPosition(o.expr)) keys[i].push_back(out[i].values[o.expr.literal.as_int() - 1]);
                else keys[i].push_back(eval.evaluate(o.expr, scope));
            }
        }
        std::vector<size_t> idx(out.size());
        for (size_t i = 0; i < idx.size(); ++i) idx[i] = i;
        std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
            for (size_t k = 0; k < q.order_by.size(); ++k) {
                int c = order_values(keys[a][k], keys[b][k]);
                if (c != 0) return q.order_by[k].asc ? c < 0 : c > 0;
            }
            return false;
        });
        std::vector<OutputRow> sorted;
        sorted.reserve(out.size());
        for (size_t i : idx) sorted.push_back(std::move(out[i]));
        out = std::move(sorted);
        for (const auto& o : q.order_by) order_texts.push_back(o.text + (o.asc ? "" : " DESC"));
    }
    record("ORDER BY", join(order_texts, ", "), out.size(), out.size(), !q.order_by.empty());

    before = out.size();
    std::string limit_text;
    if (q.offset) {
        size_t skip = static_cast<size_t>(*q.offset);
        out.erase(out.begin(), out.begin() + std::min(skip, out.size()));
    }
    if (q.limit && out.size() > static_cast<size_t>(*q.limit)) out.resize(static_cast<size_t>(*q.limit));
    if (q.limit) limit_text = "LIMIT " + std::to_string(*q.limit);
    if (q.offset) limit_text += (limit_text.empty() ? "" : " ") + std::string("OFFSET ") + std::to_string(*q.offset);
    record("LIMIT", limit_text, before, out.size(), q.limit.has_value() || q.offset.has_value());

    Table result;
    result.columns = std::move(columns);
    for (auto& r : out) result.rows.push_back(std::move(r.values));
    return result;
}

} // namespace querylab
