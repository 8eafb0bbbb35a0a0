// tests/graph/test_fas_sort.cpp
// Tests for graph/weighted_digraph.h and graph/fas_sort.h

#include <prefsort/graph/fas_sort.h>
#include <prefsort/graph/weighted_digraph.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace prefsort;
using namespace prefsort::graph;

namespace {

using tokens = std::vector<token>;
using edges = std::vector<weighted_edge>;

std::ptrdiff_t pos(tokens const& v, token const& t) {
    return std::find(v.begin(), v.end(), t) - v.begin();
}

} // namespace

// =============================================================================
// weighted_digraph_builder
// =============================================================================

TEST(WeightedDigraph, NodesInFirstAppearanceOrder) {
    weighted_digraph_builder b;
    b.add_edge("b", "a", 1.0);
    b.add_edge("c", "b", 2.0);
    auto g = b.finalise();
    ASSERT_EQ(g.node_count(), 3u);
    EXPECT_EQ(g.label(node_id{0}), "b");
    EXPECT_EQ(g.label(node_id{1}), "a");
    EXPECT_EQ(g.label(node_id{2}), "c");
    EXPECT_EQ(g.edge_count(), 2u);
    EXPECT_DOUBLE_EQ(g.out_weight(node_id{2}), 2.0);
    EXPECT_DOUBLE_EQ(g.in_weight(node_id{0}), 2.0);
}

TEST(WeightedDigraph, SelfEdgeDroppedNodeKept) {
    weighted_digraph_builder b;
    b.add_edge("j", "j", 1.0);
    auto g = b.finalise();
    EXPECT_EQ(g.node_count(), 1u);
    EXPECT_EQ(g.edge_count(), 0u);
}

TEST(WeightedDigraph, DuplicateEdgeKeepsLastWeight) {
    weighted_digraph_builder b;
    b.add_edge("a", "b", 5.0);
    b.add_edge("a", "b", 0.5);
    auto g = b.finalise();
    EXPECT_EQ(g.edge_count(), 1u);
    EXPECT_DOUBLE_EQ(g.out_weight(node_id{0}), 0.5);
    EXPECT_DOUBLE_EQ(g.in_weight(node_id{1}), 0.5);
}

TEST(WeightedDigraph, InvalidWeightsRejected) {
    weighted_digraph_builder b;
    EXPECT_THROW(b.add_edge("a", "b", -1.0), std::invalid_argument);
    EXPECT_THROW(b.add_edge("a", "b", std::numeric_limits<double>::quiet_NaN()),
                 std::invalid_argument);
    EXPECT_THROW(b.add_edge("a", "b", std::numeric_limits<double>::infinity()),
                 std::invalid_argument);
    EXPECT_NO_THROW(b.add_edge("a", "b", 0.0));
}

// =============================================================================
// fas_sort
// =============================================================================

TEST(FasSort, SimpleChain) {
    edges const e{{"A", "B", 1}, {"B", "C", 1}};
    EXPECT_EQ(fas_sort(e), (tokens{"A", "B", "C"}));
}

TEST(FasSort, UnitCycleKeepsTwoOfThreeEdges) {
    edges const e{{"A", "B", 1}, {"B", "C", 1}, {"C", "A", 1}};
    auto const first = fas_sort(e);
    ASSERT_EQ(first.size(), 3u);
    EXPECT_EQ(fas_sort(e), first);

    int preserved = 0;
    if (pos(first, "A") < pos(first, "B")) ++preserved;
    if (pos(first, "B") < pos(first, "C")) ++preserved;
    if (pos(first, "C") < pos(first, "A")) ++preserved;
    EXPECT_EQ(preserved, 2);
    EXPECT_EQ(first, (tokens{"A", "B", "C"}));
}

TEST(FasSort, HeavyEdgeIsKept) {
    edges const e{{"A", "B", 1}, {"B", "C", 1}, {"C", "A", 10}};
    auto const order = fas_sort(e);
    EXPECT_LT(pos(order, "C"), pos(order, "A"));
    EXPECT_EQ(order, (tokens{"C", "A", "B"}));
}

TEST(FasSort, EmptyInput) {
    EXPECT_TRUE(fas_sort(edges{}).empty());
    EXPECT_TRUE(fas_sort(weighted_digraph{}).empty());
}

TEST(FasSort, DisconnectedComponents) {
    edges const e{{"A", "B", 1}, {"C", "D", 1}};
    EXPECT_EQ(fas_sort(e), (tokens{"A", "B", "C", "D"}));
}

TEST(FasSort, SelfLoopNodeStillPlaced) {
    edges const e{{"G", "H", 1}, {"H", "I", 1}, {"J", "J", 1}};
    auto const order = fas_sort(e);
    ASSERT_EQ(order.size(), 4u);
    EXPECT_LT(pos(order, "G"), pos(order, "H"));
    EXPECT_LT(pos(order, "H"), pos(order, "I"));
    EXPECT_NE(pos(order, "J"), 4);
}

TEST(FasSort, LastDuplicateWeightDecides) {
    // a -> b ends at 0.5, lighter than b -> a, so b goes first.
    edges const e{{"a", "b", 5}, {"b", "a", 1}, {"a", "b", 0.5}};
    EXPECT_EQ(fas_sort(e), (tokens{"b", "a"}));
}

TEST(FasSort, IsolatedNodesKeepFirstAppearanceOrder) {
    weighted_digraph_builder b;
    (void)b.add_node("x");
    (void)b.add_node("y");
    (void)b.add_node("z");
    EXPECT_EQ(fas_sort(b.finalise()), (tokens{"x", "y", "z"}));
}

TEST(FasSort, AcyclicInputIsTopological) {
    edges const e{{"d", "b", 1}, {"a", "b", 2}, {"b", "c", 1}, {"d", "a", 3}, {"c", "e", 1}};
    auto const order = fas_sort(e);
    ASSERT_EQ(order.size(), 5u);
    for (auto const& x : e) {
        EXPECT_LT(pos(order, x.src), pos(order, x.dst)) << x.src << " -> " << x.dst;
    }
}

TEST(FasSort, EveryNodeExactlyOnce) {
    edges const e{{"a", "b", 1}, {"b", "a", 1}, {"b", "c", 2}, {"c", "a", 1},
                  {"c", "d", 1}, {"d", "b", 3}, {"e", "a", 1}};
    auto order = fas_sort(e);
    ASSERT_EQ(order.size(), 5u);
    std::sort(order.begin(), order.end());
    EXPECT_EQ(order, (tokens{"a", "b", "c", "d", "e"}));
}
