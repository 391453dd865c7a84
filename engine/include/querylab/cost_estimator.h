#pragma once
#include <cstddef>
#include <string>

namespace querylab {

// MySQL EXPLAIN access types, best first.
enum class AccessType { System, Const, EqRef, Ref, Range, Index, All };

const char* access_type_name(AccessType type);
int access_rank(AccessType type);
// good / caution / bad
const char* access_rating(AccessType type);

struct CostComponents {
    double io_cost = 0.0;      // page reads
    double cpu_cost = 0.0;     // tuple processing
    double memory_cost = 0.0;  // sort buffers and temporary tables

    double total() const { return io_cost + cpu_cost + memory_cost; }

    CostComponents& operator+=(const CostComponents& other) {
        io_cost += other.io_cost;
        cpu_cost += other.cpu_cost;
        memory_cost += other.memory_cost;
        return *this;
    }
};

struct AccessEstimate {
    AccessType type = AccessType::All;
    size_t rows = 0;
    CostComponents cost;
};

// The single cost model behind EXPLAIN and the index comparison. The
// constants are heuristics, not measurements.
class CostEstimator {
private:
    static constexpr double SEQ_PAGE_COST = 1.0;
    static constexpr double RAND_PAGE_COST = 4.0;
    static constexpr double CPU_TUPLE_COST = 0.01;
    static constexpr double INDEX_LOOKUP_COST = 2.0;
    static constexpr double SORT_COST_PER_TUPLE = 0.1;
    static constexpr double TEMP_ROW_MEMORY_COST = 0.1;

    static constexpr double REF_FRACTION = 0.1;
    static constexpr double RANGE_FRACTION = 0.3;

public:
    // Rows examined by an access path on a table of `table_rows` rows.
    size_t estimateRows(AccessType type, size_t table_rows) const;

    CostComponents estimateTableScan(size_t table_rows) const;
    // Full scan of a covering index: half the width of a table row.
    CostComponents estimateIndexScan(size_t table_rows) const;
    // B-tree descent plus a sequential walk over the matching entries.
    CostComponents estimateIndexLookup(size_t matched_rows) const;
    // One unique-index lookup per row of the driving table.
    CostComponents estimateUniqueProbe() const;

    CostComponents estimateSortCost(size_t rows) const;
    CostComponents estimateTemporaryTable(size_t rows) const;

    AccessEstimate estimateAccess(AccessType type, size_t table_rows) const;
};

} // namespace querylab
