#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "querylab/value.h"

namespace querylab {

// Index advertised by the dataset: one column, its non-null values sorted.
struct IndexDefinition {
    std::string name;
    std::string column;
    bool unique = false;
    std::vector<Value> sorted_values;
};

// In-memory tables owned by the caller. The engine only reads it.
class Dataset {
private:
    struct TableData {
        std::string name;
        std::string description;
        std::vector<std::string> columns;
        std::vector<Row> rows;
        std::vector<IndexDefinition> indexes;
    };

    std::vector<std::string> order_;
    std::map<std::string, TableData> tables_;

    const TableData* lookup(const std::string& name) const;
    TableData* lookup(const std::string& name);

public:
    Dataset() = default;

    void add_table(const std::string& name, const std::vector<std::string>& columns,
                   const std::vector<Row>& rows = {}, const std::string& description = "");
    void add_row(const std::string& table, Row row);
    // Builds the index from the rows present; later add_row calls keep it current.
    void add_index(const std::string& table, const std::string& index_name,
                   const std::string& column, bool unique = false);

    bool has_table(const std::string& name) const;
    const std::vector<Row>& get_table(const std::string& name) const;
    std::vector<std::string> get_table_columns(const std::string& name) const;
    std::vector<std::string> table_names() const;
    std::string description(const std::string& name) const;
    size_t row_count(const std::string& name) const;

    const std::vector<IndexDefinition>& indexes(const std::string& table) const;
    const IndexDefinition* find_index(const std::string& table, const std::string& index_name) const;
    // (key, row id) pairs for an index, sorted by key; row ids are 1-based row positions.
    std::vector<std::pair<Value, int64_t>> index_entries(const std::string& table,
                                                         const std::string& index_name) const;
};

// The six-table company/order schema used by the CLI and the tests.
Dataset make_sample_dataset();

} // namespace querylab
