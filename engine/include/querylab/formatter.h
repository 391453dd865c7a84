#pragma once
#include <string>
#include <vector>
#include "querylab/btree.h"
#include "querylab/errors.h"
#include "querylab/executor.h"
#include "querylab/explain.h"
#include "querylab/query_analyzer.h"

namespace querylab {

// Plain-text renderings used by the CLI.

// Boxed grid; every row must have headers.size() cells.
std::string format_table(const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows);

std::string format_error(const QueryError& error);
// Rows, timing, warnings and CTE metadata; the error when the query failed.
std::string format_result(const QueryResult& result);
std::string format_stages(const std::vector<StageInfo>& stages);

std::string format_explain(const ExplainReport& report);
std::string format_comparison(const IndexComparison& comparison);

// One line per node, indented by level: `[10 | 20]`.
std::string format_tree(const TreeView& tree);
std::string format_trace(const std::vector<TraversalStep>& trace);

std::string format_analysis(const QueryAnalysis& analysis);

} // namespace querylab
