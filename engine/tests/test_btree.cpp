#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>
#include "querylab/btree.h"
#include "querylab/dataset.h"

using namespace querylab;

static BTree sequentialTree(int count, int order = 4) {
    BTree tree(order);
    for (int i = 1; i <= count; ++i) tree.insert(Value::integer(i * 10), i);
    return tree;
}

TEST(BTreeTest, RejectsSmallOrder) {
    EXPECT_THROW(BTree(2), std::invalid_argument);
    EXPECT_NO_THROW(BTree(3));
}

TEST(BTreeTest, RejectsNullKeys) {
    BTree tree;
    EXPECT_THROW(tree.insert(Value::null(), 1), std::invalid_argument);
}

TEST(BTreeTest, SearchFindsEveryInsertedKey) {
    BTree tree = sequentialTree(50);
    EXPECT_EQ(tree.size(), 50u);
    for (int i = 1; i <= 50; ++i) {
        SearchResult r = tree.search(Value::integer(i * 10));
        ASSERT_TRUE(r.value.has_value()) << "key " << i * 10;
        EXPECT_EQ(*r.value, i);
        EXPECT_EQ(r.trace.back().action, TraversalAction::Found);
    }
}

TEST(BTreeTest, SearchMissesAbsentKeys) {
    BTree tree = sequentialTree(50);
    for (int k : {5, 15, 255, 1000}) {
        SearchResult r = tree.search(Value::integer(k));
        EXPECT_FALSE(r.value.has_value());
        EXPECT_EQ(r.trace.back().action, TraversalAction::NotFound);
    }
}

TEST(BTreeTest, TraceVisitsOneNodePerLevel) {
    BTree small = sequentialTree(2);
    EXPECT_EQ(small.height(), 1);
    EXPECT_EQ(small.search(Value::integer(10)).trace.size(), 1u);

    BTree tree = sequentialTree(100);
    EXPECT_GT(tree.height(), 2);
    SearchResult r = tree.search(Value::integer(730));
    ASSERT_EQ(static_cast<int>(r.trace.size()), tree.height());
    EXPECT_EQ(r.trace.front().node_id, tree.rootId());
    for (size_t i = 0; i + 1 < r.trace.size(); ++i) EXPECT_EQ(r.trace[i].action, TraversalAction::Descend);
}

TEST(BTreeTest, RangeWithinOneLeaf) {
    BTree tree = sequentialTree(3, 5);
    ASSERT_EQ(tree.height(), 1);
    RangeResult r = tree.rangeSearch(Value::integer(15), Value::integer(30));
    ASSERT_EQ(r.entries.size(), 2u);
    EXPECT_EQ(r.entries[0].first.as_int(), 20);
    EXPECT_EQ(r.entries[1].second, 3);
}

TEST(BTreeTest, RangeFollowsLeafChain) {
    BTree tree = sequentialTree(40);
    RangeResult r = tree.rangeSearch(Value::integer(55), Value::integer(205));
    ASSERT_EQ(r.entries.size(), 15u);
    for (size_t i = 0; i < r.entries.size(); ++i) {
        EXPECT_EQ(r.entries[i].first.as_int(), static_cast<int64_t>((i + 6) * 10));
    }
    size_t scans = 0;
    for (const auto& step : r.trace) scans += step.action == TraversalAction::Scan ? 1 : 0;
    EXPECT_GT(scans, 1u);
}

TEST(BTreeTest, InvertedRangeIsEmpty) {
    BTree tree = sequentialTree(10);
    RangeResult r = tree.rangeSearch(Value::integer(90), Value::integer(20));
    EXPECT_TRUE(r.entries.empty());
    EXPECT_EQ(r.trace.size(), 1u);
}

TEST(BTreeTest, DuplicateKeysAreAllReturnedByRange) {
    BTree tree = build_index({Value::integer(2), Value::integer(1), Value::integer(2), Value::integer(3),
                              Value::integer(2)},
                             3);
    RangeResult r = tree.rangeSearch(Value::integer(2), Value::integer(2));
    ASSERT_EQ(r.entries.size(), 3u);
    EXPECT_EQ(r.entries[0].second, 1);
    EXPECT_EQ(r.entries[1].second, 3);
    EXPECT_EQ(r.entries[2].second, 5);
    EXPECT_TRUE(tree.search(Value::integer(2)).value.has_value());
}

TEST(BTreeTest, SnapshotsAreBreadthFirst) {
    BTree tree = sequentialTree(20);
    std::vector<NodeSnapshot> nodes = tree.allNodes();
    ASSERT_FALSE(nodes.empty());
    EXPECT_EQ(nodes.front().id, tree.rootId());
    EXPECT_EQ(nodes.front().level, 0);
    size_t leaf_keys = 0;
    for (size_t i = 1; i < nodes.size(); ++i) EXPECT_GE(nodes[i].level, nodes[i - 1].level);
    for (const auto& n : nodes) leaf_keys += n.is_leaf ? n.keys.size() : 0;
    EXPECT_EQ(leaf_keys, 20u);

    TreeView view = tree.treeStructure();
    EXPECT_EQ(view.id, tree.rootId());
    EXPECT_FALSE(view.is_leaf);
}

TEST(BTreeTest, BuildsFromDatasetIndexSkippingNulls) {
    Dataset ds = make_sample_dataset();
    BTree tree = build_index(ds.index_entries("employees", "idx_manager"), 4);
    EXPECT_EQ(tree.size(), 15u);
    RangeResult r = tree.rangeSearch(Value::integer(9), Value::integer(9));
    EXPECT_EQ(r.entries.size(), 4u);
}

static std::vector<int> shuffledKeys(int count, unsigned seed) {
    std::vector<int> keys(count);
    std::iota(keys.begin(), keys.end(), 1);
    std::mt19937 rng(seed);
    std::shuffle(keys.begin(), keys.end(), rng);
    return keys;
}

TEST(BTreeTest, SearchHoldsForAnyInsertionOrder) {
    for (int order : {3, 4, 5, 7}) {
        std::vector<int> reversed(60);
        std::iota(reversed.rbegin(), reversed.rend(), 1);
        for (const std::vector<int>& keys : {reversed, shuffledKeys(60, 7u), shuffledKeys(60, 1234u)}) {
            BTree tree(order);
            for (int k : keys) tree.insert(Value::integer(k * 3), k);
            ASSERT_EQ(tree.size(), keys.size());
            for (int k : keys) {
                SearchResult r = tree.search(Value::integer(k * 3));
                ASSERT_TRUE(r.value.has_value()) << "order " << order << " key " << k * 3;
                EXPECT_EQ(*r.value, k);
                EXPECT_FALSE(tree.search(Value::integer(k * 3 + 1)).value.has_value());
            }
        }
    }
}

TEST(BTreeTest, MinimumOrderNeverLeavesEmptyNodes) {
    for (const std::vector<int>& keys : {shuffledKeys(40, 3u), shuffledKeys(40, 99u)}) {
        BTree tree(3);
        for (int k : keys) tree.insert(Value::integer(k), k);
        for (const auto& node : tree.allNodes()) {
            EXPECT_FALSE(node.keys.empty()) << "node " << node.id;
            EXPECT_LE(node.keys.size(), 2u);
            if (!node.is_leaf) EXPECT_EQ(node.child_ids.size(), node.keys.size() + 1);
        }
    }
}

TEST(BTreeTest, FloatKeys) {
    BTree tree(4);
    std::vector<double> keys = {2.5, -1.25, 9.75, 0.5, 3.125, 7.0, -4.5, 1.0};
    for (size_t i = 0; i < keys.size(); ++i) tree.insert(Value::real(keys[i]), static_cast<int64_t>(i));
    for (size_t i = 0; i < keys.size(); ++i) {
        SearchResult r = tree.search(Value::real(keys[i]));
        ASSERT_TRUE(r.value.has_value()) << keys[i];
        EXPECT_EQ(*r.value, static_cast<int64_t>(i));
    }
    EXPECT_FALSE(tree.search(Value::real(2.4)).value.has_value());

    RangeResult r = tree.rangeSearch(Value::real(0.0), Value::real(3.2));
    ASSERT_EQ(r.entries.size(), 4u);
    EXPECT_DOUBLE_EQ(r.entries.front().first.as_double(), 0.5);
    EXPECT_DOUBLE_EQ(r.entries.back().first.as_double(), 3.125);
}

TEST(BTreeTest, RangeMatchesLinearFilter) {
    std::vector<int> keys = shuffledKeys(80, 42u);
    for (int order : {3, 4, 6}) {
        BTree tree(order);
        for (int k : keys) tree.insert(Value::integer(k), k * 100);
        for (auto bounds : {std::make_pair(1, 80), std::make_pair(7, 33), std::make_pair(40, 41),
                            std::make_pair(79, 200), std::make_pair(-5, 0)}) {
            std::vector<int> expected;
            for (int k = 1; k <= 80; ++k) {
                if (k >= bounds.first && k <= bounds.second) expected.push_back(k);
            }
            RangeResult r = tree.rangeSearch(Value::integer(bounds.first), Value::integer(bounds.second));
            ASSERT_EQ(r.entries.size(), expected.size()) << "order " << order << " [" << bounds.first << ", "
                                                         << bounds.second << "]";
            for (size_t i = 0; i < expected.size(); ++i) {
                EXPECT_EQ(r.entries[i].first.as_int(), expected[i]);
                EXPECT_EQ(r.entries[i].second, expected[i] * 100);
            }
        }
    }
}

TEST(BTreeTest, TraceGrowsWithHeight) {
    for (int order : {3, 4}) {
        BTree tree(order);
        int last_height = tree.height();
        size_t last_trace = 0;
        for (int k = 1; k <= 300; ++k) {
            tree.insert(Value::integer(k), k);
            size_t trace = tree.search(Value::integer(1)).trace.size();
            EXPECT_EQ(static_cast<int>(trace), tree.height());
            if (tree.height() > last_height) {
                EXPECT_GT(trace, last_trace) << "order " << order << " after " << k << " keys";
                last_height = tree.height();
            }
            EXPECT_GE(trace, last_trace);
            last_trace = trace;
        }
        EXPECT_GE(last_height, 4);
    }
}
