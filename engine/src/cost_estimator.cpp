#include "querylab/cost_estimator.h"
#include <algorithm>
#include <cmath>

namespace querylab {

const char* access_type_name(AccessType type) {
    switch (type) {
        case AccessType::System: return "system";
        case AccessType::Const: return "const";
        case AccessType::EqRef: return "eq_ref";
        case AccessType::Ref: return "ref";
        case AccessType::Range: return "range";
        case AccessType::Index: return "index";
        case AccessType::All: return "ALL";
        default: return "ALL";
    }
}

int access_rank(AccessType type) {
    return static_cast<int>(type);
}

const char* access_rating(AccessType type) {
    switch (type) {
        case AccessType::Index: return "caution";
        case AccessType::All: return "bad";
        default: return "good";
    }
}

size_t CostEstimator::estimateRows(AccessType type, size_t table_rows) const {
    switch (type) {
        case AccessType::System:
        case AccessType::Const:
        case AccessType::EqRef:
            return 1;
        case AccessType::Ref:
            return std::max<size_t>(1, static_cast<size_t>(table_rows * REF_FRACTION));
        case AccessType::Range:
            return std::max<size_t>(1, static_cast<size_t>(table_rows * RANGE_FRACTION));
        case AccessType::Index:
        case AccessType::All:
        default:
            return table_rows;
    }
}

CostComponents CostEstimator::estimateTableScan(size_t table_rows) const {
    CostComponents cost;
    cost.io_cost = table_rows * SEQ_PAGE_COST;
    cost.cpu_cost = table_rows * CPU_TUPLE_COST;
    return cost;
}

CostComponents CostEstimator::estimateIndexScan(size_t table_rows) const {
    CostComponents cost;
    cost.io_cost = INDEX_LOOKUP_COST + table_rows * SEQ_PAGE_COST * 0.5;
    cost.cpu_cost = table_rows * CPU_TUPLE_COST;
    return cost;
}

CostComponents CostEstimator::estimateIndexLookup(size_t matched_rows) const {
    CostComponents cost;
    cost.io_cost = INDEX_LOOKUP_COST + matched_rows * SEQ_PAGE_COST;
    cost.cpu_cost = matched_rows * CPU_TUPLE_COST;
    return cost;
}

CostComponents CostEstimator::estimateUniqueProbe() const {
    CostComponents cost;
    cost.io_cost = INDEX_LOOKUP_COST + RAND_PAGE_COST;
    cost.cpu_cost = CPU_TUPLE_COST;
    return cost;
}

CostComponents CostEstimator::estimateSortCost(size_t rows) const {
    CostComponents cost;
    if (rows < 2) return cost;
    cost.cpu_cost = rows * std::log2(static_cast<double>(rows)) * SORT_COST_PER_TUPLE;
    cost.memory_cost = rows * TEMP_ROW_MEMORY_COST;
    return cost;
}

CostComponents CostEstimator::estimateTemporaryTable(size_t rows) const {
    CostComponents cost;
    cost.cpu_cost = rows * CPU_TUPLE_COST;
    cost.memory_cost = rows * TEMP_ROW_MEMORY_COST;
    return cost;
}

AccessEstimate CostEstimator::estimateAccess(AccessType type, size_t table_rows) const {
    AccessEstimate est;
    est.type = type;
    est.rows = estimateRows(type, table_rows);
    switch (type) {
        case AccessType::EqRef:
            est.cost = estimateUniqueProbe();
            break;
        case AccessType::System:
        case AccessType::Const:
        case AccessType::Ref:
        case AccessType::Range:
            est.cost = estimateIndexLookup(est.rows);
            break;
        case AccessType::Index:
            est.cost = estimateIndexScan(table_rows);
            break;
        case AccessType::All:
        default:
            est.cost = estimateTableScan(table_rows);
            break;
    }
    return est;
}

} // namespace querylab
