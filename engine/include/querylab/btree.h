#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "querylab/value.h"

namespace querylab {

enum class TraversalAction { Compare, Descend, Found, NotFound, Scan };

const char* action_name(TraversalAction action);

struct TraversalStep {
    int64_t node_id = 0;
    std::vector<Value> keys;
    std::string comparison;
    TraversalAction action = TraversalAction::Compare;
};

struct BTreeNode {
    int64_t id = 0;
    std::vector<Value> keys;
    std::vector<int64_t> values;     // leaf only, parallel to keys
    std::vector<size_t> children;    // internal only, arena indices
    bool is_leaf = true;
    std::optional<size_t> next_leaf;
};

struct SearchResult {
    std::optional<int64_t> value;
    std::vector<TraversalStep> trace;
};

struct RangeResult {
    std::vector<std::pair<Value, int64_t>> entries;
    std::vector<TraversalStep> trace;
};

struct NodeSnapshot {
    int64_t id = 0;
    std::vector<Value> keys;
    std::vector<int64_t> values;
    std::vector<int64_t> child_ids;
    bool is_leaf = true;
    int level = 0;
    int position = 0;
};

struct TreeView {
    int64_t id = 0;
    std::vector<Value> keys;
    bool is_leaf = true;
    int level = 0;
    int position = 0;
    std::vector<TreeView> children;
};

// B+tree over an arena of nodes. `order` is the maximum number of children;
// a node holds at most order-1 keys. A node reaching `order` keys is split
// in half on the way back up, so every node keeps at least one key.
class BTree {
private:
    int order_;
    std::vector<BTreeNode> nodes_;
    size_t root_ = 0;
    size_t size_ = 0;

    // Separator and new right sibling produced by an overflowing node.
    struct Split {
        Value separator;
        size_t right = 0;
    };

    static std::atomic<int64_t> next_id_;

    size_t newNode(bool leaf);
    Split splitNode(size_t node);
    std::optional<Split> insertInto(size_t node, const Value& key, int64_t value);
    TreeView buildView(size_t node, int level, std::vector<int>& positions) const;

public:
    explicit BTree(int order = 4);

    int order() const { return order_; }
    size_t size() const { return size_; }
    int height() const;
    int64_t rootId() const { return nodes_[root_].id; }

    void insert(const Value& key, int64_t value);
    SearchResult search(const Value& key) const;
    // Collects lo <= key <= hi, following the leaf chain across siblings.
    RangeResult rangeSearch(const Value& low, const Value& high) const;

    std::vector<NodeSnapshot> allNodes() const;
    TreeView treeStructure() const;
};

// Sorts (key, row id) pairs and inserts them in order.
BTree build_index(std::vector<std::pair<Value, int64_t>> entries, int order = 4);
// Row ids are the 1-based positions of the values in `column_values`.
BTree build_index(const std::vector<Value>& column_values, int order = 4);

} // namespace querylab
