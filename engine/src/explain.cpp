#include "querylab/explain.h"
#include "querylab/parser.h"
#include "querylab/utils.h"
#include <algorithm>

namespace querylab {

namespace {

const char* typeExplanation(AccessType type) {
    switch (type) {
        case AccessType::System: return "Table has only one row. This is the best possible case.";
        case AccessType::Const: return "One row match using PRIMARY KEY or UNIQUE index. Very efficient.";
        case AccessType::EqRef: return "One row per join using unique index. Used in JOINs.";
        case AccessType::Ref: return "All rows with matching index value are read. Good for non-unique indexes.";
        case AccessType::Range: return "Index range scan. Retrieves rows in a given range.";
        case AccessType::Index: return "Full index scan. Reads entire index, better than ALL.";
        case AccessType::All: return "Full table scan. Reads every row in the table. Usually bad for large tables.";
        default: return "Unknown access type";
    }
}

bool containsColumn(const std::vector<std::string>& columns, const std::string& name) {
    for (const auto& c : columns) {
        if (iequals(c, name)) return true;
    }
    return false;
}

void conditionColumns(const Condition& c, std::vector<const Expr*>& out) {
    c.left.collect_columns(out);
    c.right.collect_columns(out);
    c.high.collect_columns(out);
    for (const auto& e : c.list) e.collect_columns(out);
}

} // namespace

bool ExplainRow::hasExtra(const std::string& note) const {
    return std::find(extra.begin(), extra.end(), note) != extra.end();
}

const char* annotation_severity_name(AnnotationSeverity severity) {
    switch (severity) {
        case AnnotationSeverity::Info: return "info";
        case AnnotationSeverity::Caution: return "caution";
        case AnnotationSeverity::Warning: return "warning";
        default: return "info";
    }
}

std::string create_index_statement(const std::string& table, const std::string& column) {
    return "CREATE INDEX idx_" + table + "_" + column + " ON " + table + "(" + column + ");";
}

const IndexOption* IndexComparison::chosen() const {
    for (const auto& o : options) {
        if (o.chosen) return &o;
    }
    return nullptr;
}

const IndexOption* IndexComparison::optimal() const {
    for (const auto& o : options) {
        if (o.optimal) return &o;
    }
    return nullptr;
}

bool IndexComparison::chosenIsOptimal() const {
    const IndexOption* c = chosen();
    const IndexOption* o = optimal();
    if (!c || !o) return false;
    return c == o || c->cost.total() <= o->cost.total();
}

std::vector<Explainer::TableContext> Explainer::tableContexts(const ParsedQuery& q) const {
    std::vector<TableContext> out;
    if (q.from.name.empty()) return out;
    out.push_back({q.from.name, q.from.alias.empty() ? q.from.name : q.from.alias, 0});
    for (size_t i = 0; i < q.joins.size(); ++i) {
        const TableRef& t = q.joins[i].table;
        out.push_back({t.name, t.alias.empty() ? t.name : t.alias, i + 1});
    }
    return out;
}

bool Explainer::belongsTo(const Expr& column, const TableContext& table) const {
    if (column.kind != ExprKind::Column) return false;
    if (!column.qualifier.empty()) {
        return iequals(column.qualifier, table.qualifier) || iequals(column.qualifier, table.name);
    }
    return containsColumn(dataset_.get_table_columns(table.name), column.name);
}

std::vector<const Condition*> Explainer::conditionsOn(const ParsedQuery& q, const TableContext& table) const {
    std::vector<const Condition*> out;
    for (const auto& c : q.where_conditions) {
        if (belongsTo(c.left, table)) out.push_back(&c);
    }
    return out;
}

std::vector<std::string> Explainer::referencedColumns(const ParsedQuery& q, const TableContext& table) const {
    std::vector<std::string> names;
    auto collect = [&](const std::vector<const Expr*>& refs) {
        for (const Expr* e : refs) {
            if (belongsTo(*e, table) && !containsColumn(names, e->name)) names.push_back(to_lower(e->name));
        }
    };

    std::vector<const Expr*> refs;
    for (const auto& item : q.columns) item.expr.collect_columns(refs);
    for (const auto& c : q.where_conditions) conditionColumns(c, refs);
    for (const auto& c : q.having_conditions) conditionColumns(c, refs);
    for (const auto& g : q.group_by) g.collect_columns(refs);
    for (const auto& o : q.order_by) o.expr.collect_columns(refs);
    collect(refs);

    for (const auto& j : q.joins) {
        if (!j.on) continue;
        std::vector<Condition> on;
        j.on->collect_conditions(on);
        std::vector<const Expr*> on_refs;
        for (const auto& c : on) conditionColumns(c, on_refs);
        collect(on_refs);
    }
    return names;
}

std::optional<Explainer::Candidate> Explainer::classify(const ParsedQuery& q, const TableContext& table,
                                                        const IndexDefinition& index) const {
    std::optional<Candidate> best;
    auto consider = [&](AccessType type, const std::string& ref) {
        if (best && access_rank(best->type) <= access_rank(type)) return;
        Candidate c;
        c.type = type;
        c.key = index.name;
        c.column = index.column;
        c.ref = ref;
        c.unique = index.unique;
        best = c;
    };

    for (const Condition* c : conditionsOn(q, table)) {
        if (!iequals(c->column(), index.column) || !c->right_is_literal()) continue;
        switch (c->op) {
            case CompareOp::EQ:
                consider(index.unique ? AccessType::Const : AccessType::Ref, "const");
                break;
            case CompareOp::IS_NULL:
                consider(AccessType::Ref, "const");
                break;
            case CompareOp::LT:
            case CompareOp::GT:
            case CompareOp::LE:
            case CompareOp::GE:
            case CompareOp::BETWEEN:
            case CompareOp::IN:
                consider(AccessType::Range, "");
                break;
            case CompareOp::LIKE: {
                std::string pattern = c->right.literal.to_string();
                if (!pattern.empty() && pattern[0] != '%' && pattern[0] != '_') consider(AccessType::Range, "");
                break;
            }
            default:
                break;
        }
    }

    // Join target reached through an equality on the indexed column.
    if (table.position > 0 && table.position <= q.joins.size()) {
        for (const auto& eq : q.joins[table.position - 1].equalities) {
            const Expr* mine = nullptr;
            const Expr* other = nullptr;
            if (belongsTo(eq.first, table) && !belongsTo(eq.second, table)) {
                mine = &eq.first;
                other = &eq.second;
            } else if (belongsTo(eq.second, table) && !belongsTo(eq.first, table)) {
                mine = &eq.second;
                other = &eq.first;
            }
            if (!mine || !iequals(mine->name, index.column)) continue;
            consider(index.unique ? AccessType::EqRef : AccessType::Ref, other->text);
        }
    }

    if (!best && !q.selects_star()) {
        for (const auto& item : q.columns) {
            if (item.is_star() && (iequals(item.expr.qualifier, table.qualifier) || iequals(item.expr.qualifier, table.name))) {
                return best;
            }
        }
        std::vector<std::string> cols = referencedColumns(q, table);
        if (!cols.empty() && cols.size() == 1 && iequals(cols.front(), index.column)) {
            consider(AccessType::Index, "");
        }
    }
    return best;
}

Explainer::Candidate Explainer::choose(const ParsedQuery& q, const TableContext& table) const {
    Candidate best;
    size_t total = dataset_.row_count(table.name);
    AccessEstimate best_est = estimator_.estimateAccess(AccessType::All, total);
    for (const auto& idx : dataset_.indexes(table.name)) {
        auto c = classify(q, table, idx);
        if (!c) continue;
        AccessEstimate est = estimator_.estimateAccess(c->type, total);
        bool better = access_rank(c->type) < access_rank(best.type) ||
                      (access_rank(c->type) == access_rank(best.type) && est.cost.total() < best_est.cost.total());
        if (better) {
            best = *c;
            best_est = est;
        }
    }
    return best;
}

std::optional<int> Explainer::keyLength(const std::string& table, const std::string& column) const {
    bool has_null = false;
    bool has_time = false;
    ValueKind kind = ValueKind::Null;
    size_t max_len = 0;
    for (const auto& row : dataset_.get_table(table)) {
        const Value* v = row.find(column);
        if (!v || v->is_null()) {
            has_null = true;
            continue;
        }
        if (kind == ValueKind::Null) kind = v->kind();
        if (v->kind() == ValueKind::Text) max_len = std::max(max_len, v->as_text().size());
        if (v->kind() == ValueKind::Date && v->as_date().has_time) has_time = true;
    }

    int len = 4;
    switch (kind) {
        case ValueKind::Integer: len = 4; break;
        case ValueKind::Float: len = 8; break;
        case ValueKind::Boolean: len = 1; break;
        case ValueKind::Date: len = has_time ? 5 : 3; break;
        case ValueKind::Text: len = static_cast<int>(4 * max_len + 2); break;
        default: break;
    }
    return has_null ? len + 1 : len;
}

ExplainRow Explainer::buildRow(const ParsedQuery& q, const TableContext& table) const {
    ExplainRow row;
    row.id = static_cast<int>(table.position) + 1;
    row.table = table.name;

    std::vector<const Condition*> conds = conditionsOn(q, table);
    size_t n = conds.size();
    row.filtered = n == 0 ? 100.0 : std::min(100.0, std::max(10.0, 100.0 / (n + 1)));

    if (!dataset_.has_table(table.name)) {
        // CTE reference: materialized at run time, nothing to estimate.
        row.select_type = "DERIVED";
        row.extra.push_back("Materialized CTE");
        return row;
    }

    size_t total = dataset_.row_count(table.name);
    std::vector<std::string> join_columns;
    if (table.position > 0 && table.position <= q.joins.size()) {
        for (const auto& eq : q.joins[table.position - 1].equalities) {
            if (belongsTo(eq.first, table)) join_columns.push_back(eq.first.name);
            if (belongsTo(eq.second, table)) join_columns.push_back(eq.second.name);
        }
    }
    for (const auto& idx : dataset_.indexes(table.name)) {
        bool relevant = containsColumn(join_columns, idx.column);
        for (const Condition* c : conds) relevant = relevant || iequals(c->column(), idx.column);
        if (relevant) row.possible_keys.push_back(idx.name);
    }

    Candidate c = choose(q, table);
    AccessEstimate est = estimator_.estimateAccess(c.type, total);
    row.type = c.type;
    row.rows = est.rows;
    row.cost = est.cost;
    if (!c.key.empty()) {
        row.key = c.key;
        row.key_len = keyLength(table.name, c.column);
        if (!c.ref.empty()) row.ref = c.ref;
    }

    std::vector<std::string> referenced = referencedColumns(q, table);
    bool star = q.selects_star();
    for (const auto& item : q.columns) {
        if (item.is_star() && (iequals(item.expr.qualifier, table.qualifier) || iequals(item.expr.qualifier, table.name))) star = true;
    }
    bool covering = c.type == AccessType::Index ||
                    (!c.key.empty() && !star && !referenced.empty() && referenced.size() == 1 &&
                     iequals(referenced.front(), c.column));
    bool residual = false;
    for (const Condition* cond : conds) {
        if (c.key.empty() || !iequals(cond->column(), c.column)) residual = true;
    }

    if (!conds.empty() && (c.type == AccessType::All || residual)) row.extra.push_back("Using where");
    if (covering) row.extra.push_back("Using index");
    if (c.type == AccessType::Range && !covering) row.extra.push_back("Using index condition");

    if (table.position == 0) {
        bool sorted_by_key = q.order_by.size() == 1 && q.order_by.front().expr.kind == ExprKind::Column &&
                             !c.key.empty() && iequals(q.order_by.front().expr.name, c.column);
        if (!q.order_by.empty() && !sorted_by_key) row.extra.push_back("Using filesort");

        if (!q.group_by.empty() && !q.order_by.empty()) {
            std::vector<std::string> g, o;
            for (const auto& e : q.group_by) g.push_back(to_lower(e.text));
            for (const auto& e : q.order_by) o.push_back(to_lower(e.expr.text));
            if (g != o) row.extra.push_back("Using temporary");
        }
    }
    return row;
}

void Explainer::annotate(const ParsedQuery& q, const ExplainRow& row, const TableContext& table,
                         std::vector<ExplainAnnotation>& out) const {
    auto add = [&](const std::string& field, const std::string& value, const std::string& explanation,
                   AnnotationSeverity severity, const std::string& recommendation) {
        out.push_back({row.table, field, value, explanation, recommendation, severity});
    };

    std::string unindexed;
    for (const Condition* c : conditionsOn(q, table)) {
        if (c->column().empty()) continue;
        bool indexed = false;
        for (const auto& idx : dataset_.indexes(table.name)) indexed = indexed || iequals(idx.column, c->column());
        if (!indexed) {
            unindexed = to_lower(c->column());
            break;
        }
    }

    if (row.type == AccessType::All) {
        std::string rec = "Consider adding an index on filtered columns";
        if (!unindexed.empty()) rec += ": " + create_index_statement(table.name, unindexed);
        add("type", row.typeName(), typeExplanation(row.type), AnnotationSeverity::Warning, rec);
    } else {
        add("type", row.typeName(), typeExplanation(row.type), AnnotationSeverity::Info, "");
    }

    if (row.key) {
        add("key", *row.key, "Using index \"" + *row.key + "\" to find rows", AnnotationSeverity::Info, "");
    } else if (!row.possible_keys.empty()) {
        add("key", "NULL", "No index used despite available indexes", AnnotationSeverity::Caution,
            "Query conditions may not match index columns");
    }

    add("rows", std::to_string(row.rows), "MySQL estimates examining " + std::to_string(row.rows) + " rows",
        row.rows > 100 ? AnnotationSeverity::Caution : AnnotationSeverity::Info, "");

    for (const auto& note : row.extra) {
        if (note == "Using filesort") {
            std::string rec = "Consider adding index that matches ORDER BY";
            const Expr& first = q.order_by.front().expr;
            if (first.kind == ExprKind::Column && belongsTo(first, table)) {
                rec += ": " + create_index_statement(table.name, to_lower(first.name));
            }
            add("Extra", note, "MySQL must do an extra sorting pass", AnnotationSeverity::Caution, rec);
        } else if (note == "Using temporary") {
            add("Extra", note, "MySQL creates a temporary table for this query", AnnotationSeverity::Caution,
                "Usually caused by GROUP BY + ORDER BY on different columns");
        } else if (note == "Using where") {
            add("Extra", note, "Rows are filtered after being read from table", AnnotationSeverity::Info, "");
        } else if (note == "Using index") {
            add("Extra", note, "Query satisfied entirely from index (covering index)", AnnotationSeverity::Info, "");
        } else if (note == "Using index condition") {
            add("Extra", note, "Index conditions pushed down to storage engine", AnnotationSeverity::Info, "");
        }
    }
}

std::optional<QueryError> Explainer::checkQuery(const ParsedQuery& q) const {
    if (!q.issues.empty()) return syntax_error(q.issues.front().message, q.issues.front().near);
    if (q.query_type != QueryType::SELECT) {
        return unsupported_feature_error(std::string("EXPLAIN of ") + query_type_name(q.query_type) + " queries",
                                         "Only SELECT queries can be explained");
    }
    std::vector<std::string> available = dataset_.table_names();
    for (const auto& cte : q.ctes) available.push_back(cte.name);
    for (const auto& t : q.tables) {
        if (!containsColumn(available, t)) return unknown_table_error(t, available);
    }
    return std::nullopt;
}

ExplainReport Explainer::explain(const std::string& sql) const {
    if (trim(sql).empty()) {
        ExplainReport report;
        report.error = empty_query_error();
        return report;
    }
    return explain(parse_query(sql));
}

ExplainReport Explainer::explain(const ParsedQuery& q) const {
    ExplainReport report;
    report.error = checkQuery(q);
    if (report.error) return report;

    if (q.tables.empty()) {
        report.annotations.push_back({"", "table", "NULL", "No tables used", "", AnnotationSeverity::Info});
        return report;
    }

    for (const auto& ctx : tableContexts(q)) {
        ExplainRow row = buildRow(q, ctx);
        report.total_cost += row.cost;
        if (row.hasExtra("Using filesort")) report.total_cost += estimator_.estimateSortCost(row.rows);
        if (row.hasExtra("Using temporary")) report.total_cost += estimator_.estimateTemporaryTable(row.rows);
        annotate(q, row, ctx, report.annotations);
        report.rows.push_back(std::move(row));
    }
    return report;
}

IndexComparison Explainer::compare(const ParsedQuery& q, const std::string& table) const {
    IndexComparison cmp;
    cmp.table = to_lower(table);
    cmp.error = checkQuery(q);
    if (cmp.error) return cmp;

    std::optional<TableContext> ctx;
    for (const auto& c : tableContexts(q)) {
        if (c.name == cmp.table) {
            ctx = c;
            break;
        }
    }
    if (!ctx) {
        cmp.error = unknown_table_error(cmp.table, q.tables);
        return cmp;
    }
    if (!dataset_.has_table(cmp.table)) {
        cmp.error = unsupported_feature_error("Index comparison on CTE '" + cmp.table + "'",
                                              "Compare indexes on the base tables the CTE reads");
        return cmp;
    }

    size_t total = dataset_.row_count(cmp.table);
    Candidate chosen = choose(q, *ctx);

    IndexOption scan;
    scan.label = "Full table scan (no index)";
    scan.type = AccessType::All;
    AccessEstimate scan_est = estimator_.estimateAccess(AccessType::All, total);
    scan.rows = scan_est.rows;
    scan.cost = scan_est.cost;
    scan.chosen = chosen.key.empty();
    cmp.options.push_back(scan);

    for (const auto& idx : dataset_.indexes(cmp.table)) {
        IndexOption opt;
        opt.label = idx.name + " (" + idx.column + ")";
        opt.index_name = idx.name;
        opt.column = idx.column;
        auto c = classify(q, *ctx, idx);
        opt.usable = c.has_value();
        opt.type = c ? c->type : AccessType::All;
        AccessEstimate est = estimator_.estimateAccess(opt.type, total);
        opt.rows = est.rows;
        opt.cost = est.cost;
        opt.chosen = !chosen.key.empty() && chosen.key == idx.name;
        cmp.options.push_back(opt);
    }

    std::vector<std::string> seen;
    for (const Condition* c : conditionsOn(q, *ctx)) {
        std::string col = to_lower(c->column());
        if (col.empty() || containsColumn(seen, col)) continue;
        seen.push_back(col);
        bool indexed = false;
        for (const auto& idx : dataset_.indexes(cmp.table)) indexed = indexed || iequals(idx.column, col);
        if (indexed) continue;

        IndexDefinition hypothetical;
        hypothetical.name = "idx_" + cmp.table + "_" + col;
        hypothetical.column = col;
        auto cand = classify(q, *ctx, hypothetical);
        if (!cand) continue;

        IndexOption opt;
        opt.label = hypothetical.name + " (" + col + ", hypothetical)";
        opt.index_name = hypothetical.name;
        opt.column = col;
        opt.hypothetical = true;
        opt.type = cand->type;
        AccessEstimate est = estimator_.estimateAccess(opt.type, total);
        opt.rows = est.rows;
        opt.cost = est.cost;
        opt.create_statement = create_index_statement(cmp.table, col);
        cmp.options.push_back(opt);
    }

    std::stable_sort(cmp.options.begin(), cmp.options.end(), [](const IndexOption& a, const IndexOption& b) {
        if (a.cost.total() != b.cost.total()) return a.cost.total() < b.cost.total();
        if (a.type != b.type) return access_rank(a.type) < access_rank(b.type);
        return a.usable && !b.usable;
    });
    if (!cmp.options.empty()) cmp.options.front().optimal = true;
    return cmp;
}

} // namespace querylab
