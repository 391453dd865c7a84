#include "querylab/dataset.h"
#include "querylab/utils.h"
#include <algorithm>
#include <stdexcept>

namespace querylab {

const Dataset::TableData* Dataset::lookup(const std::string& name) const {
    auto it = tables_.find(to_lower(name));
    return it == tables_.end() ? nullptr : &it->second;
}

Dataset::TableData* Dataset::lookup(const std::string& name) {
    auto it = tables_.find(to_lower(name));
    return it == tables_.end() ? nullptr : &it->second;
}

void Dataset::add_table(const std::string& name, const std::vector<std::string>& columns,
                        const std::vector<Row>& rows, const std::string& description) {
    std::string key = to_lower(name);
    if (tables_.find(key) == tables_.end()) {
        order_.push_back(key);
    }
    TableData& data = tables_[key];
    data.name = key;
    data.description = description;
    data.columns = columns;
    data.rows.clear();
    data.indexes.clear();
    for (const auto& row : rows) {
        add_row(key, row);
    }
}

void Dataset::add_row(const std::string& table, Row row) {
    TableData* data = lookup(table);
    if (!data) {
        throw std::invalid_argument("add_row: unknown table '" + table + "'");
    }
    // Rows always carry every column, in schema order.
    Row normalized;
    for (const auto& col : data->columns) {
        normalized.append(col, row.get(col));
    }
    for (auto& idx : data->indexes) {
        Value key = normalized.get(idx.column);
        if (key.is_null()) continue;
        auto pos = std::upper_bound(idx.sorted_values.begin(), idx.sorted_values.end(), key,
                                    [](const Value& a, const Value& b) { return order_values(a, b) < 0; });
        idx.sorted_values.insert(pos, key);
    }
    data->rows.push_back(std::move(normalized));
}

void Dataset::add_index(const std::string& table, const std::string& index_name,
                        const std::string& column, bool unique) {
    TableData* data = lookup(table);
    if (!data) {
        throw std::invalid_argument("add_index: unknown table '" + table + "'");
    }
    IndexDefinition idx;
    idx.name = index_name;
    idx.column = to_lower(column);
    idx.unique = unique || index_name == "PRIMARY";
    for (const auto& row : data->rows) {
        Value v = row.get(idx.column);
        if (!v.is_null()) idx.sorted_values.push_back(v);
    }
    std::stable_sort(idx.sorted_values.begin(), idx.sorted_values.end(),
                     [](const Value& a, const Value& b) { return order_values(a, b) < 0; });

    for (auto& existing : data->indexes) {
        if (existing.name == index_name) {
            existing = std::move(idx);
            return;
        }
    }
    data->indexes.push_back(std::move(idx));
}

bool Dataset::has_table(const std::string& name) const {
    return lookup(name) != nullptr;
}

const std::vector<Row>& Dataset::get_table(const std::string& name) const {
    static const std::vector<Row> empty;
    const TableData* data = lookup(name);
    return data ? data->rows : empty;
}

std::vector<std::string> Dataset::get_table_columns(const std::string& name) const {
    const TableData* data = lookup(name);
    return data ? data->columns : std::vector<std::string>();
}

std::vector<std::string> Dataset::table_names() const {
    return order_;
}

std::string Dataset::description(const std::string& name) const {
    const TableData* data = lookup(name);
    return data ? data->description : std::string();
}

size_t Dataset::row_count(const std::string& name) const {
    const TableData* data = lookup(name);
    return data ? data->rows.size() : 0;
}

const std::vector<IndexDefinition>& Dataset::indexes(const std::string& table) const {
    static const std::vector<IndexDefinition> none;
    const TableData* data = lookup(table);
    return data ? data->indexes : none;
}

const IndexDefinition* Dataset::find_index(const std::string& table, const std::string& index_name) const {
    for (const auto& idx : indexes(table)) {
        if (iequals(idx.name, index_name)) return &idx;
    }
    return nullptr;
}

std::vector<std::pair<Value, int64_t>> Dataset::index_entries(const std::string& table,
                                                              const std::string& index_name) const {
    std::vector<std::pair<Value, int64_t>> entries;
    const IndexDefinition* idx = find_index(table, index_name);
    if (!idx) return entries;

    const auto& rows = get_table(table);
    for (size_t r = 0; r < rows.size(); ++r) {
        Value key = rows[r].get(idx->column);
        if (key.is_null()) continue;
        entries.emplace_back(key, static_cast<int64_t>(r + 1));
    }
    std::stable_sort(entries.begin(), entries.end(),
                     [](const std::pair<Value, int64_t>& a, const std::pair<Value, int64_t>& b) {
                         return order_values(a.first, b.first) < 0;
                     });
    return entries;
}

} // namespace querylab
