#include "querylab/errors.h"
#include "querylab/utils.h"
#include <map>
#include <sstream>

namespace querylab {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Syntax: return "SyntaxError";
        case ErrorKind::UnknownTable: return "UnknownTableError";
        case ErrorKind::UnknownColumn: return "UnknownColumnError";
        case ErrorKind::TypeMismatch: return "TypeMismatchError";
        case ErrorKind::UnsupportedFeature: return "UnsupportedFeatureError";
        case ErrorKind::EmptyQuery: return "EmptyQueryError";
        case ErrorKind::NoTables: return "NoTablesError";
        default: return "QueryError";
    }
}

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
        default: return "error";
    }
}

std::string QueryError::context_value(const std::string& key) const {
    for (const auto& kv : context) {
        if (kv.first == key) return kv.second;
    }
    return "";
}

std::string QueryError::str() const {
    std::ostringstream oss;
    oss << error_kind_name(kind) << ": " << message;
    if (!suggestion.empty()) {
        oss << " (" << suggestion << ")";
    }
    return oss.str();
}

std::string typo_correction(const std::string& word) {
    static const std::map<std::string, std::string> fixes = {
        {"selec", "SELECT"}, {"slect", "SELECT"}, {"selct", "SELECT"},
        {"form", "FROM"}, {"fom", "FROM"}, {"frm", "FROM"},
        {"whre", "WHERE"}, {"wher", "WHERE"}, {"were", "WHERE"},
        {"oder", "ORDER"}, {"ordr", "ORDER"},
        {"gorup", "GROUP"}, {"gruop", "GROUP"}, {"grup", "GROUP"},
        {"havng", "HAVING"}, {"limt", "LIMIT"},
    };
    auto it = fixes.find(to_lower(word));
    return it == fixes.end() ? std::string() : it->second;
}

QueryError syntax_error(const std::string& message, const std::string& near) {
    QueryError err;
    err.kind = ErrorKind::Syntax;
    err.message = message;
    err.severity = Severity::Error;
    if (!near.empty()) {
        std::string fix = typo_correction(near);
        if (!fix.empty()) err.suggestion = "Did you mean: " + fix + "?";
        err.context.emplace_back("near", near);
    }
    return err;
}

QueryError unknown_table_error(const std::string& table, const std::vector<std::string>& available) {
    QueryError err;
    err.kind = ErrorKind::UnknownTable;
    err.message = "Unknown table: '" + table + "'";
    std::string match = closest_match(table, available);
    if (!match.empty()) {
        err.suggestion = "Did you mean: " + match + "?";
    } else {
        err.suggestion = "Available tables: " + join(available, ", ");
    }
    err.severity = Severity::Error;
    err.context.emplace_back("table", table);
    err.context.emplace_back("available", join(available, ", "));
    return err;
}

QueryError unknown_column_error(const std::string& column, const std::string& table,
                                const std::vector<std::string>& available) {
    QueryError err;
    err.kind = ErrorKind::UnknownColumn;
    err.message = "Unknown column: '" + column + "' in table '" + table + "'";
    std::string match = closest_match(column, available);
    if (!match.empty()) {
        err.suggestion = "Did you mean: " + match + "?";
    } else {
        err.suggestion = "Available columns in " + table + ": " + join(available, ", ");
    }
    err.severity = Severity::Error;
    err.context.emplace_back("column", column);
    err.context.emplace_back("table", table);
    err.context.emplace_back("available", join(available, ", "));
    return err;
}

QueryError ambiguous_column_error(const std::string& column, const std::vector<std::string>& qualified) {
    QueryError err;
    err.kind = ErrorKind::UnknownColumn;
    err.message = "Column '" + column + "' is ambiguous (exists in " + std::to_string(qualified.size()) + " tables)";
    err.suggestion = "Qualify the column: " + join(qualified, " or ");
    err.severity = Severity::Error;
    err.context.emplace_back("column", column);
    err.context.emplace_back("candidates", join(qualified, ", "));
    return err;
}

QueryError type_mismatch_error(const std::string& column, const std::string& expected, const std::string& got) {
    QueryError err;
    err.kind = ErrorKind::TypeMismatch;
    err.message = "Type mismatch: column '" + column + "' is " + expected + ", but compared with " + got;
    err.suggestion = "Use a " + expected + " value for comparison";
    err.severity = Severity::Error;
    err.context.emplace_back("column", column);
    err.context.emplace_back("expected", expected);
    err.context.emplace_back("got", got);
    return err;
}

QueryError unsupported_feature_error(const std::string& feature, const std::string& alternative) {
    QueryError err;
    err.kind = ErrorKind::UnsupportedFeature;
    err.message = "Unsupported feature: " + feature;
    err.suggestion = alternative.empty() ? "This feature is not available in querylab" : alternative;
    err.severity = Severity::Warning;
    err.context.emplace_back("feature", feature);
    return err;
}

QueryError empty_query_error() {
    QueryError err;
    err.kind = ErrorKind::EmptyQuery;
    err.message = "Empty query";
    err.suggestion = "Enter a SQL query like: SELECT * FROM employees";
    err.severity = Severity::Info;
    return err;
}

QueryError no_tables_error() {
    QueryError err;
    err.kind = ErrorKind::NoTables;
    err.message = "No table specified in query";
    err.suggestion = "Add a FROM clause: SELECT * FROM employees";
    err.severity = Severity::Error;
    return err;
}

QueryError forward_reference_error(const std::string& referrer, const std::string& cte) {
    QueryError err;
    err.kind = ErrorKind::UnknownTable;
    err.message = "CTE '" + cte + "' is referenced by '" + referrer + "' before it is defined";
    err.suggestion = "Move '" + cte + "' earlier in the WITH list";
    err.severity = Severity::Error;
    err.context.emplace_back("table", cte);
    err.context.emplace_back("referenced_by", referrer);
    return err;
}

} // namespace querylab
