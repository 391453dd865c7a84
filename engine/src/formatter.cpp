#include "querylab/formatter.h"
#include "querylab/utils.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace querylab {

namespace {

std::string fixed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

std::string separator(const std::vector<size_t>& widths) {
    std::string line = "+";
    for (size_t w : widths) line += std::string(w + 2, '-') + "+";
    return line + "\n";
}

std::string gridRow(const std::vector<std::string>& cells, const std::vector<size_t>& widths) {
    std::string line = "|";
    for (size_t i = 0; i < widths.size(); ++i) {
        const std::string cell = i < cells.size() ? cells[i] : "";
        line += " " + cell + std::string(widths[i] - cell.size(), ' ') + " |";
    }
    return line + "\n";
}

std::string orNull(const std::optional<std::string>& value) {
    return value ? *value : "NULL";
}

void renderTree(const TreeView& node, std::ostringstream& out) {
    std::vector<std::string> keys;
    for (const auto& k : node.keys) keys.push_back(k.to_string());
    out << std::string(node.level * 2, ' ') << "[" << join(keys, " | ") << "]";
    if (node.is_leaf) out << " (leaf)";
    out << "\n";
    for (const auto& child : node.children) renderTree(child, out);
}

} // namespace

std::string format_table(const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    std::vector<size_t> widths;
    for (const auto& h : headers) widths.push_back(h.size());
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i) widths[i] = std::max(widths[i], row[i].size());
    }

    std::string out = separator(widths) + gridRow(headers, widths) + separator(widths);
    for (const auto& row : rows) out += gridRow(row, widths);
    if (!rows.empty()) out += separator(widths);
    return out;
}

std::string format_error(const QueryError& error) {
    std::ostringstream out;
    out << error_kind_name(error.kind) << " (" << severity_name(error.severity) << "): " << error.message << "\n";
    if (!error.suggestion.empty()) out << "  Suggestion: " << error.suggestion << "\n";
    return out.str();
}

std::string format_result(const QueryResult& result) {
    std::ostringstream out;
    if (!result.success) {
        if (result.error) out << format_error(*result.error);
        else out << "Query failed\n";
        return out.str();
    }

    std::vector<std::vector<std::string>> cells;
    for (const auto& row : result.rows) {
        std::vector<std::string> line;
        for (size_t i = 0; i < result.columns.size(); ++i) line.push_back(i < row.size() ? row.at(i).to_string() : "");
        cells.push_back(std::move(line));
    }
    out << format_table(result.columns, cells);
    out << result.row_count << (result.row_count == 1 ? " row" : " rows") << " in "
        << fixed(result.execution_time_ms, 2) << " ms\n";

    for (const auto& cte : result.cte_info) {
        out << "CTE " << cte.name << ": " << cte.row_count << " rows";
        if (cte.is_recursive) {
            out << ", recursive, " << cte.iterations << " iterations";
            if (cte.truncated) out << " (truncated)";
        }
        out << "\n";
    }
    for (const auto& w : result.warnings) out << "Warning: " << w << "\n";
    return out.str();
}

std::string format_stages(const std::vector<StageInfo>& stages) {
    std::vector<std::vector<std::string>> rows;
    int step = 1;
    for (const auto& s : stages) {
        if (!s.active) continue;
        rows.push_back({std::to_string(step++), s.name, s.clause, std::to_string(s.input_rows),
                        std::to_string(s.output_rows)});
    }
    return format_table({"step", "stage", "clause", "rows in", "rows out"}, rows);
}

std::string format_explain(const ExplainReport& report) {
    std::ostringstream out;
    if (!report.ok()) {
        out << format_error(*report.error);
        return out.str();
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& r : report.rows) {
        rows.push_back({std::to_string(r.id), r.select_type, r.table, r.typeName(),
                        r.possible_keys.empty() ? "NULL" : join(r.possible_keys, ","), orNull(r.key),
                        r.key_len ? std::to_string(*r.key_len) : "NULL", orNull(r.ref), std::to_string(r.rows),
                        fixed(r.filtered, 2), join(r.extra, "; ")});
    }
    out << format_table({"id", "select_type", "table", "type", "possible_keys", "key", "key_len", "ref", "rows",
                         "filtered", "Extra"},
                        rows);
    out << "Estimated cost: " << fixed(report.total_cost.total(), 2) << "\n";

    for (const auto& a : report.annotations) {
        out << "[" << annotation_severity_name(a.severity) << "] ";
        if (!a.table.empty()) out << a.table << ".";
        out << a.field << " = " << a.value << ": " << a.explanation << "\n";
        if (!a.recommendation.empty()) out << "    -> " << a.recommendation << "\n";
    }
    return out.str();
}

std::string format_comparison(const IndexComparison& comparison) {
    std::ostringstream out;
    if (comparison.error) {
        out << format_error(*comparison.error);
        return out.str();
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& o : comparison.options) {
        std::string flags;
        if (o.chosen) flags += "chosen";
        if (o.optimal) flags += flags.empty() ? "optimal" : ", optimal";
        if (o.hypothetical) flags += flags.empty() ? "hypothetical" : ", hypothetical";
        if (!o.usable) flags += flags.empty() ? "not usable" : ", not usable";
        rows.push_back({o.label, access_type_name(o.type), std::to_string(o.rows), fixed(o.cost.total(), 2), flags});
    }
    out << "Index options for " << comparison.table << ":\n";
    out << format_table({"option", "type", "rows", "cost", "notes"}, rows);
    if (!comparison.chosenIsOptimal()) {
        const IndexOption* best = comparison.optimal();
        if (best && !best->create_statement.empty()) out << "Cheaper with: " << best->create_statement << "\n";
    }
    return out.str();
}

std::string format_tree(const TreeView& tree) {
    std::ostringstream out;
    renderTree(tree, out);
    return out.str();
}

std::string format_trace(const std::vector<TraversalStep>& trace) {
    std::ostringstream out;
    int step = 1;
    for (const auto& s : trace) {
        std::vector<std::string> keys;
        for (const auto& k : s.keys) keys.push_back(k.to_string());
        out << std::setw(3) << step++ << ". node " << s.node_id << " [" << join(keys, " | ") << "] "
            << action_name(s.action) << ": " << s.comparison << "\n";
    }
    return out.str();
}

std::string format_analysis(const QueryAnalysis& analysis) {
    std::ostringstream out;
    if (analysis.error) out << format_error(*analysis.error);
    else if (analysis.result) out << format_result(*analysis.result);

    out << "\nOverall: " << analysis.overall_severity << ", access: " << analysis.access_rating << "\n";
    if (!analysis.issues.empty()) {
        out << "\nIssues:\n";
        for (const auto& issue : analysis.issues) {
            out << "  [" << issue_severity_name(issue.severity) << "] " << issue.title << ": "
                << issue.description << "\n";
            if (!issue.fix.empty()) out << "      fix: " << issue.fix << "\n";
        }
    }
    if (!analysis.explain_rows.empty()) {
        ExplainReport report;
        report.rows = analysis.explain_rows;
        report.annotations = analysis.explain_annotations;
        for (const auto& r : report.rows) report.total_cost += r.cost;
        out << "\n" << format_explain(report);
    }
    if (!analysis.index_recommendations.empty()) {
        out << "\nIndex recommendations:\n";
        for (const auto& rec : analysis.index_recommendations) {
            out << "  " << rec.kind << ": " << rec.sql << "\n      " << rec.reason << "\n";
        }
    }
    if (!analysis.rewrites.empty()) {
        out << "\nRewrites:\n";
        for (const auto& rw : analysis.rewrites) {
            out << "  " << rw.original_pattern << "  =>  " << rw.rewritten << "\n      " << rw.reason << "; "
                << rw.improvement << "\n";
        }
    }
    if (analysis.optimized_query) out << "\nOptimized query:\n  " << *analysis.optimized_query << "\n";
    if (analysis.result && analysis.result->success && !analysis.result->stages.empty()) {
        out << "\nExecution order:\n" << format_stages(analysis.result->stages);
    }
    out << "\nTips:\n";
    for (const auto& tip : analysis.tips) out << "  - " << tip << "\n";
    return out.str();
}

} // namespace querylab
