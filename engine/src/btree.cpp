#include "querylab/btree.h"
#include <algorithm>
#include <deque>
#include <stdexcept>

namespace querylab {

std::atomic<int64_t> BTree::next_id_{1};

const char* action_name(TraversalAction action) {
    switch (action) {
        case TraversalAction::Compare: return "compare";
        case TraversalAction::Descend: return "descend";
        case TraversalAction::Found: return "found";
        case TraversalAction::NotFound: return "not_found";
        case TraversalAction::Scan: return "scan";
        default: return "compare";
    }
}

// Number of keys <= k: the child to follow for an exact lookup.
static size_t upperIndex(const std::vector<Value>& keys, const Value& k) {
    size_t i = 0;
    while (i < keys.size() && order_values(k, keys[i]) >= 0) ++i;
    return i;
}

// Number of keys < k: the child holding the first key >= k.
static size_t lowerIndex(const std::vector<Value>& keys, const Value& k) {
    size_t i = 0;
    while (i < keys.size() && order_values(keys[i], k) < 0) ++i;
    return i;
}

BTree::BTree(int order) : order_(order) {
    if (order < 3) {
        throw std::invalid_argument("B-tree order must be at least 3, got " + std::to_string(order));
    }
    root_ = newNode(true);
}

size_t BTree::newNode(bool leaf) {
    BTreeNode node;
    node.id = next_id_.fetch_add(1);
    node.is_leaf = leaf;
    nodes_.push_back(std::move(node));
    return nodes_.size() - 1;
}

int BTree::height() const {
    int h = 1;
    size_t node = root_;
    while (!nodes_[node].is_leaf) {
        node = nodes_[node].children.front();
        ++h;
    }
    return h;
}

BTree::Split BTree::splitNode(size_t node) {
    bool leaf = nodes_[node].is_leaf;
    size_t right = newNode(leaf);

    BTreeNode& c = nodes_[node];
    BTreeNode& r = nodes_[right];
    size_t mid = c.keys.size() / 2;
    Split split;
    split.right = right;

    if (leaf) {
        // Copy-up: the right half keeps its first key, which also becomes the separator.
        r.keys.assign(c.keys.begin() + mid, c.keys.end());
        r.values.assign(c.values.begin() + mid, c.values.end());
        c.keys.resize(mid);
        c.values.resize(mid);
        split.separator = r.keys.front();
        r.next_leaf = c.next_leaf;
        c.next_leaf = right;
    } else {
        split.separator = c.keys[mid];
        r.keys.assign(c.keys.begin() + mid + 1, c.keys.end());
        r.children.assign(c.children.begin() + mid + 1, c.children.end());
        c.keys.resize(mid);
        c.children.resize(mid + 1);
    }
    return split;
}

std::optional<BTree::Split> BTree::insertInto(size_t node, const Value& key, int64_t value) {
    size_t pos = upperIndex(nodes_[node].keys, key);
    if (nodes_[node].is_leaf) {
        BTreeNode& leaf = nodes_[node];
        leaf.keys.insert(leaf.keys.begin() + pos, key);
        leaf.values.insert(leaf.values.begin() + pos, value);
    } else {
        std::optional<Split> below = insertInto(nodes_[node].children[pos], key, value);
        if (!below) return std::nullopt;
        BTreeNode& n = nodes_[node];
        n.keys.insert(n.keys.begin() + pos, below->separator);
        n.children.insert(n.children.begin() + pos + 1, below->right);
    }
    if (static_cast<int>(nodes_[node].keys.size()) < order_) return std::nullopt;
    return splitNode(node);
}

void BTree::insert(const Value& key, int64_t value) {
    if (key.is_null()) {
        throw std::invalid_argument("B-tree keys cannot be NULL");
    }
    std::optional<Split> split = insertInto(root_, key, value);
    if (split) {
        size_t new_root = newNode(false);
        nodes_[new_root].keys.push_back(split->separator);
        nodes_[new_root].children.push_back(root_);
        nodes_[new_root].children.push_back(split->right);
        root_ = new_root;
    }
    ++size_;
}

static std::string descendText(const Value& key, const std::vector<Value>& keys, size_t idx, bool inclusive) {
    std::string target = key.to_literal();
    std::string suffix = " -> descend to child " + std::to_string(idx);
    if (keys.empty()) return "no separator keys" + suffix;
    if (idx < keys.size()) {
        return target + (inclusive ? " <= " : " < ") + keys[idx].to_literal() + suffix;
    }
    return target + (inclusive ? " > " : " >= ") + keys.back().to_literal() + suffix;
}

SearchResult BTree::search(const Value& key) const {
    SearchResult result;
    size_t node = root_;
    while (!nodes_[node].is_leaf) {
        const BTreeNode& n = nodes_[node];
        size_t idx = upperIndex(n.keys, key);
        result.trace.push_back({n.id, n.keys, descendText(key, n.keys, idx, false), TraversalAction::Descend});
        node = n.children[idx];
    }

    const BTreeNode& leaf = nodes_[node];
    size_t i = lowerIndex(leaf.keys, key);
    TraversalStep step{leaf.id, leaf.keys, "", TraversalAction::NotFound};
    if (i < leaf.keys.size() && order_values(leaf.keys[i], key) == 0) {
        step.action = TraversalAction::Found;
        step.comparison = key.to_literal() + " = " + leaf.keys[i].to_literal() + " -> found at position " + std::to_string(i);
        result.value = leaf.values[i];
    } else if (leaf.keys.empty()) {
        step.comparison = "leaf is empty -> not found";
    } else if (i < leaf.keys.size()) {
        step.comparison = key.to_literal() + " < " + leaf.keys[i].to_literal() + " -> not found";
    } else {
        step.comparison = key.to_literal() + " > " + leaf.keys.back().to_literal() + " -> not found";
    }
    result.trace.push_back(step);
    return result;
}

RangeResult BTree::rangeSearch(const Value& low, const Value& high) const {
    RangeResult result;
    std::string bounds = "[" + low.to_literal() + ", " + high.to_literal() + "]";
    if (order_values(low, high) > 0) {
        result.trace.push_back({nodes_[root_].id, nodes_[root_].keys, "empty range " + bounds, TraversalAction::Compare});
        return result;
    }

    size_t node = root_;
    while (!nodes_[node].is_leaf) {
        const BTreeNode& n = nodes_[node];
        size_t idx = lowerIndex(n.keys, low);
        result.trace.push_back({n.id, n.keys, descendText(low, n.keys, idx, true), TraversalAction::Descend});
        node = n.children[idx];
    }

    const BTreeNode* leaf = &nodes_[node];
    size_t i = lowerIndex(leaf->keys, low);
    result.trace.push_back({leaf->id, leaf->keys,
                            "start at position " + std::to_string(i) + " (first key >= " + low.to_literal() + ")",
                            TraversalAction::Compare});

    bool done = false;
    while (leaf && !done) {
        size_t collected = 0;
        for (; i < leaf->keys.size(); ++i) {
            if (order_values(leaf->keys[i], high) > 0) {
                done = true;
                break;
            }
            result.entries.emplace_back(leaf->keys[i], leaf->values[i]);
            ++collected;
        }
        result.trace.push_back({leaf->id, leaf->keys,
                                "scan leaf: " + std::to_string(collected) + " key(s) in " + bounds,
                                TraversalAction::Scan});
        if (done || !leaf->next_leaf) break;
        leaf = &nodes_[*leaf->next_leaf];
        i = 0;
    }
    return result;
}

std::vector<NodeSnapshot> BTree::allNodes() const {
    std::vector<NodeSnapshot> out;
    std::vector<int> positions;
    std::deque<std::pair<size_t, int>> queue;
    queue.emplace_back(root_, 0);
    while (!queue.empty()) {
        auto [node, level] = queue.front();
        queue.pop_front();
        if (static_cast<int>(positions.size()) <= level) positions.push_back(0);

        const BTreeNode& n = nodes_[node];
        NodeSnapshot snap;
        snap.id = n.id;
        snap.keys = n.keys;
        snap.values = n.values;
        snap.is_leaf = n.is_leaf;
        snap.level = level;
        snap.position = positions[level]++;
        for (size_t child : n.children) {
            snap.child_ids.push_back(nodes_[child].id);
            queue.emplace_back(child, level + 1);
        }
        out.push_back(std::move(snap));
    }
    return out;
}

TreeView BTree::buildView(size_t node, int level, std::vector<int>& positions) const {
    if (static_cast<int>(positions.size()) <= level) positions.push_back(0);
    const BTreeNode& n = nodes_[node];
    TreeView view;
    view.id = n.id;
    view.keys = n.keys;
    view.is_leaf = n.is_leaf;
    view.level = level;
    view.position = positions[level]++;
    for (size_t child : n.children) {
        view.children.push_back(buildView(child, level + 1, positions));
    }
    return view;
}

TreeView BTree::treeStructure() const {
    std::vector<int> positions;
    return buildView(root_, 0, positions);
}

BTree build_index(std::vector<std::pair<Value, int64_t>> entries, int order) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const std::pair<Value, int64_t>& a, const std::pair<Value, int64_t>& b) {
                         return order_values(a.first, b.first) < 0;
                     });
    BTree tree(order);
    for (const auto& e : entries) {
        if (e.first.is_null()) continue;
        tree.insert(e.first, e.second);
    }
    return tree;
}

BTree build_index(const std::vector<Value>& column_values, int order) {
    std::vector<std::pair<Value, int64_t>> entries;
    for (size_t i = 0; i < column_values.size(); ++i) {
        entries.emplace_back(column_values[i], static_cast<int64_t>(i + 1));
    }
    return build_index(std::move(entries), order);
}

} // namespace querylab
