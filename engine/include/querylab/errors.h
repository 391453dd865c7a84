#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace querylab {

enum class ErrorKind { Syntax, UnknownTable, UnknownColumn, TypeMismatch, UnsupportedFeature, EmptyQuery, NoTables };
enum class Severity { Info, Warning, Error };

const char* error_kind_name(ErrorKind kind);
const char* severity_name(Severity severity);

// A structured, user-facing query failure.
struct QueryError {
    ErrorKind kind = ErrorKind::Syntax;
    std::string message;
    std::string suggestion;
    Severity severity = Severity::Error;
    std::vector<std::pair<std::string, std::string>> context;

    std::string context_value(const std::string& key) const;
    std::string str() const;
};

// Correction for a commonly misspelled clause keyword ("form" -> "FROM"), or empty.
std::string typo_correction(const std::string& word);

QueryError syntax_error(const std::string& message, const std::string& near = "");
QueryError unknown_table_error(const std::string& table, const std::vector<std::string>& available);
QueryError unknown_column_error(const std::string& column, const std::string& table,
                                const std::vector<std::string>& available);
// Unqualified column present in several joined tables; `qualified` lists e.g. "e.id", "d.id".
QueryError ambiguous_column_error(const std::string& column, const std::vector<std::string>& qualified);
QueryError type_mismatch_error(const std::string& column, const std::string& expected, const std::string& got);
QueryError unsupported_feature_error(const std::string& feature, const std::string& alternative = "");
QueryError empty_query_error();
QueryError no_tables_error();
// A CTE (or the main query) naming a CTE that is only defined later in the WITH list.
QueryError forward_reference_error(const std::string& referrer, const std::string& cte);

class QueryException : public std::runtime_error {
private:
    QueryError error_;

public:
    explicit QueryException(QueryError error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    const QueryError& error() const { return error_; }
};

} // namespace querylab
