#pragma once
#include <optional>
#include <string>
#include <vector>
#include "querylab/ast.h"
#include "querylab/cost_estimator.h"
#include "querylab/dataset.h"
#include "querylab/errors.h"

namespace querylab {

struct ExplainRow {
    int id = 1;
    std::string select_type = "SIMPLE";
    std::string table;
    AccessType type = AccessType::All;
    std::vector<std::string> possible_keys;
    std::optional<std::string> key;
    std::optional<int> key_len;
    std::optional<std::string> ref;
    size_t rows = 0;
    double filtered = 100.0;
    std::vector<std::string> extra;
    CostComponents cost;

    std::string typeName() const { return access_type_name(type); }
    std::string rating() const { return access_rating(type); }
    bool hasExtra(const std::string& note) const;
};

enum class AnnotationSeverity { Info, Caution, Warning };

const char* annotation_severity_name(AnnotationSeverity severity);

struct ExplainAnnotation {
    std::string table;
    std::string field;
    std::string value;
    std::string explanation;
    std::string recommendation;
    AnnotationSeverity severity = AnnotationSeverity::Info;
};

struct ExplainReport {
    std::vector<ExplainRow> rows;
    std::vector<ExplainAnnotation> annotations;
    CostComponents total_cost;
    std::optional<QueryError> error;

    bool ok() const { return !error.has_value(); }
};

// One way of reading a table, real index or not.
struct IndexOption {
    std::string label;
    std::string index_name;  // empty for the full table scan
    std::string column;
    bool hypothetical = false;
    bool usable = true;      // false when the query cannot use this index
    AccessType type = AccessType::All;
    size_t rows = 0;
    CostComponents cost;
    bool chosen = false;
    bool optimal = false;
    std::string create_statement;
};

struct IndexComparison {
    std::string table;
    std::vector<IndexOption> options;  // cheapest first
    std::optional<QueryError> error;

    const IndexOption* chosen() const;
    const IndexOption* optimal() const;
    bool chosenIsOptimal() const;
};

// `CREATE INDEX idx_<table>_<column> ON <table>(<column>);`
std::string create_index_statement(const std::string& table, const std::string& column);

// Heuristic EXPLAIN over a Dataset's advertised indexes. Nothing is executed.
class Explainer {
private:
    struct TableContext {
        std::string name;
        std::string qualifier;
        size_t position = 0;  // 0 is the FROM table, n the n-th JOIN target
    };

    struct Candidate {
        AccessType type = AccessType::All;
        std::string key;
        std::string column;
        std::string ref;
        bool unique = false;
    };

    const Dataset& dataset_;
    CostEstimator estimator_;

    std::vector<TableContext> tableContexts(const ParsedQuery& q) const;
    bool belongsTo(const Expr& column, const TableContext& table) const;
    std::vector<const Condition*> conditionsOn(const ParsedQuery& q, const TableContext& table) const;
    std::vector<std::string> referencedColumns(const ParsedQuery& q, const TableContext& table) const;
    std::optional<Candidate> classify(const ParsedQuery& q, const TableContext& table,
                                      const IndexDefinition& index) const;
    Candidate choose(const ParsedQuery& q, const TableContext& table) const;
    std::optional<int> keyLength(const std::string& table, const std::string& column) const;
    ExplainRow buildRow(const ParsedQuery& q, const TableContext& table) const;
    void annotate(const ParsedQuery& q, const ExplainRow& row, const TableContext& table,
                  std::vector<ExplainAnnotation>& out) const;
    std::optional<QueryError> checkQuery(const ParsedQuery& q) const;

public:
    explicit Explainer(const Dataset& dataset) : dataset_(dataset) {}

    ExplainReport explain(const std::string& sql) const;
    ExplainReport explain(const ParsedQuery& q) const;
    // Every advertised index, a full scan, and a hypothetical index per
    // filtered column without one, costed and ranked.
    IndexComparison compare(const ParsedQuery& q, const std::string& table) const;
};

} // namespace querylab
