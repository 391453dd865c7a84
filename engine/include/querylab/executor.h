#pragma once
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "querylab/ast.h"
#include "querylab/config.h"
#include "querylab/dataset.h"
#include "querylab/errors.h"
#include "querylab/expression.h"
#include "querylab/logger.h"
#include "querylab/value.h"

namespace querylab {

struct CTEInfo {
    std::string name;
    size_t row_count = 0;
    std::vector<std::string> columns;
    bool is_recursive = false;
    int iterations = 0;      // recursive steps run after the anchor
    bool truncated = false;  // stopped by max_recursion_depth
};

// One logical stage of the main query, in SQL evaluation order.
struct StageInfo {
    std::string name;
    std::string clause;
    size_t input_rows = 0;
    size_t output_rows = 0;
    bool active = false;
};

struct QueryResult {
    std::vector<Row> rows;
    std::vector<std::string> columns;
    size_t row_count = 0;
    double execution_time_ms = 0.0;
    std::string query;
    std::vector<std::string> warnings;
    std::vector<CTEInfo> cte_info;
    std::vector<StageInfo> stages;
    bool success = false;
    std::optional<QueryError> error;
};

// Runs SELECT queries (with CTEs) against a Dataset. Each execute() call is
// independent; the executor never modifies the dataset.
class QueryExecutor {
private:
    struct Relation {
        std::vector<ColumnSlot> slots;
        std::vector<std::vector<Value>> rows;
    };

    struct Table {
        std::vector<std::string> columns;
        std::vector<std::vector<Value>> rows;
    };

    const Dataset& dataset_;
    Config config_;
    std::shared_ptr<Logger> logger_;

    // Per-execution state, reset by execute().
    std::map<std::string, Table> cte_tables_;
    std::vector<std::string> warnings_;
    EvalDiagnostics diagnostics_;

    void checkParsed(const ParsedQuery& q) const;
    void checkForwardReferences(const ParsedQuery& q) const;
    void materializeCTEs(const ParsedQuery& q, QueryResult& result);
    std::vector<ParsedQuery> parseBody(const CTEDefinition& cte, bool* distinct) const;
    Table evaluateCTE(const CTEDefinition& cte, CTEInfo& info);
    Table evaluateRecursiveCTE(const CTEDefinition& cte, CTEInfo& info);
    Table runBranches(const std::vector<ParsedQuery>& branches, const std::string& cte_name);
    void applyColumnNames(const CTEDefinition& cte, Table& table) const;

    Table runSelect(const ParsedQuery& q, std::vector<StageInfo>* stages);
    Relation scan(const TableRef& ref) const;
    Relation joinRelations(const Relation& left, const Relation& right, const JoinClause& clause);
    // Fails on unknown tables, columns, qualifiers and functions before any row is read.
    void validate(const ParsedQuery& q, const std::vector<ColumnSlot>& slots) const;
    void validateExpr(const Expr& e, const ParsedQuery& q, const std::vector<ColumnSlot>& slots,
                      const std::string& clause, const std::set<std::string>& aliases, bool in_aggregate) const;

    std::vector<std::string> availableTables() const;
    void debug(const std::string& message) const;
    void warn(const std::string& message) const;

public:
    explicit QueryExecutor(const Dataset& dataset, const Config& config = Config(),
                           std::shared_ptr<Logger> logger = nullptr);

    QueryResult execute(const std::string& sql);
};

} // namespace querylab
