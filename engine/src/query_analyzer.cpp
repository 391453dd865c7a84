#include "querylab/query_analyzer.h"
#include "querylab/parser.h"
#include "querylab/utils.h"
#include <algorithm>
#include <regex>
#include <set>

namespace querylab {

namespace {

const std::regex kYearEquals(R"(\bYEAR\(\s*([\w.]+)\s*\)\s*=\s*(\d{4})\b)", std::regex::icase);

bool hasLeadingWildcard(const std::string& sql) {
    std::string upper = to_upper(sql);
    return upper.find("LIKE '%") != std::string::npos || upper.find("LIKE \"%") != std::string::npos;
}

// WHERE combines different columns with OR.
bool orAcrossColumns(const ParsedQuery& q) {
    if (!q.where || !q.where->has_or() || q.where_conditions.size() < 2) return false;
    std::set<std::string> columns;
    for (const auto& c : q.where_conditions) columns.insert(to_lower(c.column()));
    return columns.size() > 1;
}

// Column a select item reads, looking through one level of function call.
std::string itemColumn(const SelectItem& item) {
    const Expr& e = item.expr;
    if (e.kind == ExprKind::Column) return to_lower(e.name);
    if (e.kind == ExprKind::Function && e.args.size() == 1 && e.args[0].kind == ExprKind::Column)
        return to_lower(e.args[0].name);
    return "";
}

void addUnique(std::vector<std::string>& list, const std::string& value) {
    if (!value.empty() && std::find(list.begin(), list.end(), value) == list.end()) list.push_back(value);
}

} // namespace

const char* issue_severity_name(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::Info: return "info";
        case IssueSeverity::Warning: return "warning";
        case IssueSeverity::Error: return "error";
    }
    return "info";
}

bool QueryAnalysis::hasIssue(const std::string& title) const {
    for (const auto& issue : issues) {
        if (issue.title == title) return true;
    }
    return false;
}

QueryAnalysis QueryAnalyzer::analyze(const std::string& sql) const {
    QueryAnalysis analysis;
    analysis.query = sql;

    if (trim(sql).empty()) {
        analysis.error = empty_query_error();
        return analysis;
    }

    analysis.parsed = parse_query(sql);
    const ParsedQuery& q = analysis.parsed;

    QueryExecutor executor(dataset_, config_, logger_);
    QueryResult result = executor.execute(sql);
    if (!result.success && result.error) {
        analysis.error = result.error;
        if (logger_) logger_->debug("analyze: execution failed: " + result.error->message);
    }
    analysis.result = std::move(result);

    analysis.issues = detectIssues(sql, q);
    analysis.overall_severity = overallSeverity(analysis.issues);

    if (!q.tables.empty()) {
        Explainer explainer(dataset_);
        ExplainReport report = explainer.explain(q);
        if (report.ok()) {
            analysis.explain_rows = report.rows;
            analysis.explain_annotations = report.annotations;
            analysis.access_rating = accessRating(report.rows);
        } else if (logger_) {
            logger_->debug("analyze: EXPLAIN skipped: " + report.error->message);
        }
    }

    analysis.index_recommendations = recommendIndexes(q);
    analysis.rewrites = suggestRewrites(sql, q);
    analysis.optimized_query = optimizedQuery(sql, analysis);
    analysis.tips = tips(analysis);
    return analysis;
}

std::vector<QueryIssue> QueryAnalyzer::detectIssues(const std::string& sql, const ParsedQuery& q) const {
    std::vector<QueryIssue> issues;
    const std::string upper = to_upper(sql);

    if (q.selects_star()) {
        issues.push_back({IssueSeverity::Warning, "SELECT * Usage",
                          "Fetching all columns when you might only need specific ones.",
                          "List only the columns you need: SELECT id, name, salary FROM ..."});
    }

    static const char* functions[] = {"YEAR", "MONTH", "DATE", "UPPER", "LOWER", "CONCAT"};
    for (const char* fn : functions) {
        if (upper.find(std::string(fn) + "(") == std::string::npos) continue;
        std::string call = std::string(fn) + "()";
        issues.push_back({IssueSeverity::Error, "Function on Column: " + call,
                          "Using functions on columns prevents index usage. MySQL must scan all rows.",
                          "Rewrite to compare against a range instead of using " + call});
        break;
    }

    if (hasLeadingWildcard(sql)) {
        issues.push_back({IssueSeverity::Error, "Leading Wildcard LIKE",
                          "LIKE '%value' or LIKE '%value%' cannot use B-tree indexes.",
                          "Use trailing wildcard LIKE 'value%' or consider FULLTEXT index"});
    }

    if (orAcrossColumns(q)) {
        issues.push_back({IssueSeverity::Warning, "OR on Different Columns",
                          "OR conditions on different columns often prevent efficient index usage.",
                          "Consider UNION of separate queries, each using its own index"});
    }

    if (upper.find("NOT IN") != std::string::npos) {
        issues.push_back({IssueSeverity::Warning, "NOT IN Usage",
                          "NOT IN can have unexpected behavior with NULL values and may not use indexes efficiently.",
                          "Use NOT EXISTS for safer NULL handling and potentially better performance"});
    }

    if (!q.order_by.empty() && !q.limit) {
        issues.push_back({IssueSeverity::Warning, "ORDER BY Without LIMIT",
                          "Sorting all rows without a LIMIT can be expensive for large tables.",
                          "Add LIMIT to retrieve only the rows you need"});
    }

    if (q.distinct) {
        issues.push_back({IssueSeverity::Info, "DISTINCT Usage",
                          "DISTINCT requires sorting/hashing all results. Sometimes it indicates a JOIN issue.",
                          "Verify if DISTINCT is necessary or if the JOIN logic can be fixed"});
    }

    // A second SELECT in the main statement; CTE bodies do not count.
    std::string main = to_upper(q.main_query.empty() ? sql : q.main_query);
    size_t first = main.find("SELECT");
    if (first != std::string::npos && main.find("SELECT", first + 6) != std::string::npos) {
        issues.push_back({IssueSeverity::Info, "Subquery Detected",
                          "Subqueries can sometimes be rewritten as JOINs for better performance.",
                          "Consider whether a JOIN would be more efficient"});
    }

    if (q.where_conditions.empty() && !q.tables.empty()) {
        issues.push_back({IssueSeverity::Info, "No WHERE Clause",
                          "Query will scan the entire table. This is fine for small tables.",
                          "Add filtering conditions if you need specific rows"});
    }

    return issues;
}

std::string QueryAnalyzer::overallSeverity(const std::vector<QueryIssue>& issues) const {
    bool warning = false;
    for (const auto& issue : issues) {
        if (issue.severity == IssueSeverity::Error) return "critical";
        if (issue.severity == IssueSeverity::Warning) warning = true;
    }
    return warning ? "warning" : "good";
}

std::string QueryAnalyzer::accessRating(const std::vector<ExplainRow>& rows) const {
    std::string rating = "good";
    for (const auto& row : rows) {
        std::string r = row.rating();
        if (r == "bad") return r;
        if (r == "caution") rating = r;
    }
    return rating;
}

std::vector<IndexRecommendation> QueryAnalyzer::recommendIndexes(const ParsedQuery& q) const {
    std::vector<IndexRecommendation> out;
    if (q.tables.empty()) return out;

    const std::string table = q.tables.front();
    std::set<std::string> indexed;
    for (const auto& idx : dataset_.indexes(table)) indexed.insert(to_lower(idx.column));

    std::vector<std::string> where_cols;
    for (const auto& c : q.where_conditions) addUnique(where_cols, to_lower(c.column()));

    for (const auto& col : where_cols) {
        if (indexed.count(col)) continue;
        out.push_back({"WHERE filter", {col}, table, create_index_statement(table, col),
                       "Query filters on '" + col + "' - an index would speed up row lookup"});
    }

    std::vector<std::string> order_cols;
    for (const auto& o : q.order_by) {
        if (o.expr.kind == ExprKind::Column) addUnique(order_cols, to_lower(o.expr.name));
    }

    if (!order_cols.empty() && !indexed.count(order_cols.front())) {
        out.push_back({"ORDER BY", order_cols, table,
                       "CREATE INDEX idx_" + table + "_" + join(order_cols, "_") + " ON " + table + "(" +
                           join(order_cols, ", ") + ");",
                       "Index on ORDER BY columns avoids filesort"});
    }

    if (!where_cols.empty() && !order_cols.empty()) {
        std::vector<std::string> all = where_cols;
        for (const auto& c : order_cols) addUnique(all, c);
        if (all.size() > 1) {
            out.push_back({"Composite", all, table,
                           "CREATE INDEX idx_" + table + "_composite ON " + table + "(" + join(all, ", ") + ");",
                           "Composite index covers both WHERE and ORDER BY in one index"});
        }
    }

    if (!q.selects_star() && q.columns.size() <= 5) {
        std::vector<std::string> needed;
        for (const auto& item : q.columns) addUnique(needed, itemColumn(item));
        for (const auto& c : where_cols) addUnique(needed, c);
        if (needed.size() > 1 && needed.size() <= 5) {
            out.push_back({"Covering", needed, table,
                           "CREATE INDEX idx_" + table + "_covering ON " + table + "(" + join(needed, ", ") + ");",
                           "Covering index includes all needed columns - query can be answered from index alone"});
        }
    }

    if (out.size() > 3) out.resize(3);
    return out;
}

std::vector<QueryRewrite> QueryAnalyzer::suggestRewrites(const std::string& sql, const ParsedQuery& q) const {
    std::vector<QueryRewrite> out;
    const std::string upper = to_upper(sql);

    if (q.selects_star() && !q.tables.empty()) {
        out.push_back({"SELECT *", "SELECT id, name, ... FROM " + q.tables.front(),
                       "Specify only needed columns", "Reduces data transfer and enables covering indexes"});
    }

    std::smatch m;
    if (std::regex_search(sql, m, kYearEquals)) {
        std::string col = m[1].str();
        int year = std::stoi(m[2].str());
        out.push_back({"YEAR(" + col + ") = " + m[2].str(),
                       col + " >= '" + std::to_string(year) + "-01-01' AND " + col + " < '" +
                           std::to_string(year + 1) + "-01-01'",
                       "Avoid function on column", "Allows index usage on the date column"});
    }

    if (hasLeadingWildcard(sql)) {
        out.push_back({"LIKE '%value%'", "LIKE 'value%' (if possible) or use FULLTEXT INDEX",
                       "Leading wildcard prevents B-tree index usage", "Trailing wildcard can use B-tree index"});
    }

    if (upper.find("NOT IN") != std::string::npos) {
        out.push_back({"NOT IN (subquery)", "NOT EXISTS (SELECT 1 FROM ... WHERE ...)",
                       "NOT IN can fail with NULLs", "NOT EXISTS handles NULLs correctly and may be faster"});
    }

    if (orAcrossColumns(q)) {
        out.push_back({"WHERE col1 = x OR col2 = y",
                       "(SELECT ... WHERE col1 = x) UNION (SELECT ... WHERE col2 = y)",
                       "OR on different columns prevents single index usage",
                       "UNION allows each query to use its own index"});
    }

    return out;
}

std::optional<std::string> QueryAnalyzer::optimizedQuery(const std::string& sql,
                                                         const QueryAnalysis& analysis) const {
    if (analysis.issues.empty()) return std::nullopt;
    // The needed column list is unknown, so no rewrite is offered for SELECT *.
    if (analysis.hasIssue("SELECT * Usage") && !analysis.parsed.tables.empty()) return std::nullopt;

    std::smatch m;
    if (!std::regex_search(sql, m, kYearEquals)) return std::nullopt;

    std::string col = m[1].str();
    int year = std::stoi(m[2].str());
    std::string replacement = col + " >= '" + std::to_string(year) + "-01-01' AND " + col + " < '" +
                              std::to_string(year + 1) + "-01-01'";

    std::string out = sql;
    const std::string pattern = m[0].str();
    for (size_t pos = out.find(pattern); pos != std::string::npos; pos = out.find(pattern, pos + replacement.size())) {
        out.replace(pos, pattern.size(), replacement);
    }
    return out;
}

std::vector<std::string> QueryAnalyzer::tips(const QueryAnalysis& analysis) const {
    std::vector<std::string> out;

    if (analysis.access_rating == "bad")
        out.push_back("Consider adding indexes on filtered columns to avoid full table scans");
    if (analysis.hasIssue("SELECT * Usage"))
        out.push_back("Selecting specific columns reduces I/O and memory usage");

    for (const auto& row : analysis.explain_rows) {
        if (row.hasExtra("Using filesort"))
            addUnique(out, "Add an index that matches your ORDER BY to avoid filesort");
        if (row.hasExtra("Using temporary"))
            addUnique(out, "GROUP BY and ORDER BY on different columns causes temporary tables");
    }

    if (analysis.result && analysis.result->success && analysis.result->row_count > 100)
        out.push_back("Consider adding LIMIT if you don't need all rows");

    if (out.empty()) out.push_back("Query looks reasonable! Check actual execution time on production data.");
    return out;
}

} // namespace querylab
