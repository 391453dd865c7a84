#pragma once
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "querylab/ast.h"
#include "querylab/config.h"
#include "querylab/dataset.h"
#include "querylab/errors.h"
#include "querylab/executor.h"
#include "querylab/explain.h"
#include "querylab/logger.h"

namespace querylab {

enum class IssueSeverity { Info, Warning, Error };

const char* issue_severity_name(IssueSeverity severity);

// A detected anti-pattern.
struct QueryIssue {
    IssueSeverity severity = IssueSeverity::Info;
    std::string title;
    std::string description;
    std::string fix;
};

struct IndexRecommendation {
    std::string kind;  // "WHERE filter", "ORDER BY", "Composite", "Covering"
    std::vector<std::string> columns;
    std::string table;
    std::string sql;
    std::string reason;
};

struct QueryRewrite {
    std::string original_pattern;
    std::string rewritten;
    std::string reason;
    std::string improvement;
};

struct QueryAnalysis {
    std::string query;
    std::optional<QueryResult> result;
    std::optional<QueryError> error;
    ParsedQuery parsed;

    std::vector<QueryIssue> issues;
    std::string overall_severity = "good";  // good / warning / critical

    std::vector<ExplainRow> explain_rows;
    std::vector<ExplainAnnotation> explain_annotations;
    std::string access_rating = "good";     // good / caution / bad

    std::vector<IndexRecommendation> index_recommendations;
    std::vector<QueryRewrite> rewrites;
    std::optional<std::string> optimized_query;
    std::vector<std::string> tips;

    bool hasIssue(const std::string& title) const;
};

// Runs a query through the executor and the EXPLAIN simulator and reports
// anti-patterns, index recommendations, rewrites and tips. Never throws for a
// bad query; failures land in QueryAnalysis::error.
class QueryAnalyzer {
private:
    const Dataset& dataset_;
    Config config_;
    std::shared_ptr<Logger> logger_;

    std::vector<QueryIssue> detectIssues(const std::string& sql, const ParsedQuery& q) const;
    std::string overallSeverity(const std::vector<QueryIssue>& issues) const;
    std::string accessRating(const std::vector<ExplainRow>& rows) const;
    std::vector<IndexRecommendation> recommendIndexes(const ParsedQuery& q) const;
    std::vector<QueryRewrite> suggestRewrites(const std::string& sql, const ParsedQuery& q) const;
    std::optional<std::string> optimizedQuery(const std::string& sql, const QueryAnalysis& analysis) const;
    std::vector<std::string> tips(const QueryAnalysis& analysis) const;

public:
    explicit QueryAnalyzer(const Dataset& dataset, const Config& config = Config(),
                           std::shared_ptr<Logger> logger = nullptr)
        : dataset_(dataset), config_(config), logger_(std::move(logger)) {}

    QueryAnalysis analyze(const std::string& sql) const;
};

} // namespace querylab
