// tests/graph/test_list_graph.cpp — Tests for the adjacency-list graph
//
// Coverage: node/edge insertion, directed vs undirected storage,
// parallel edges, neighbour iteration order, weights, range checks.

#include <graphkit/list_graph.h>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using namespace graphkit;

namespace {

template<typename G>
std::vector<node_index> neighbours_of(G const& g, node_index u) {
    std::vector<node_index> out;
    for (auto v : g.out_neighbors(u)) out.push_back(v);
    return out;
}

} // namespace

static_assert(graph_queryable<list_graph<int, directed>>);
static_assert(graph_queryable<list_graph<std::string, undirected, double>>);
static_assert(!matrix_queryable<list_graph<int, directed>>);

// =========================================================================
// Nodes
// =========================================================================

TEST(ListGraphTest, EmptyGraph) {
    list_graph<int, directed> g;
    EXPECT_TRUE(g.empty());
    EXPECT_EQ(g.node_count(), 0u);
    EXPECT_EQ(g.edge_count(), 0u);
    EXPECT_FALSE(g.has_node(0));
}

TEST(ListGraphTest, AddNodeReturnsSequentialIndices) {
    list_graph<std::string, directed> g;
    EXPECT_EQ(g.add_node("a"), 0u);
    EXPECT_EQ(g.add_node("b"), 1u);
    EXPECT_EQ(g.add_node("c"), 2u);
    EXPECT_EQ(g.node_count(), 3u);
    EXPECT_EQ(g.node_value(1), "b");
    EXPECT_EQ(g[2].value, "c");
}

TEST(ListGraphTest, NodeValueIsMutable) {
    list_graph<int, directed> g;
    auto a = g.add_node(1);
    g.node_value(a) = 42;
    EXPECT_EQ(g.node_value(a), 42);
}

TEST(ListGraphTest, DuplicateValuesAreDistinctNodes) {
    list_graph<int, directed> g;
    auto a = g.add_node(7);
    auto b = g.add_node(7);
    EXPECT_NE(a, b);
    EXPECT_EQ(g.node_count(), 2u);
}

// =========================================================================
// Edges
// =========================================================================

TEST(ListGraphTest, DirectedEdgeStoredOnce) {
    list_graph<int, directed> g;
    auto a = g.add_node(0);
    auto b = g.add_node(1);
    g.add_edge(a, b, 5);

    EXPECT_EQ(g.edge_count(), 1u);
    EXPECT_TRUE(g.has_edge(a, b));
    EXPECT_FALSE(g.has_edge(b, a));
    ASSERT_EQ(g.edges(a).size(), 1u);
    EXPECT_EQ(g.edges(a)[0].target, b);
    EXPECT_EQ(g.edges(a)[0].weight, 5u);
}

TEST(ListGraphTest, UndirectedEdgeStoredBothWays) {
    list_graph<int, undirected> g;
    auto a = g.add_node(0);
    auto b = g.add_node(1);
    g.add_edge(a, b, 3);

    EXPECT_EQ(g.edge_count(), 2u);
    EXPECT_TRUE(g.has_edge(a, b));
    EXPECT_TRUE(g.has_edge(b, a));
    EXPECT_EQ(g.edges(b)[0].weight, 3u);
}

TEST(ListGraphTest, UnweightedOverloadUsesWeightOne) {
    list_graph<int, directed> g;
    auto a = g.add_node(0);
    auto b = g.add_node(1);
    g.add_edge(a, b);
    EXPECT_EQ(g.edges(a)[0].weight, 1u);
}

TEST(ListGraphTest, ParallelEdgesAreAppended) {
    list_graph<int, directed> g;
    auto a = g.add_node(0);
    auto b = g.add_node(1);
    g.add_edge(a, b, 1);
    g.add_edge(a, b, 9);

    EXPECT_EQ(g.edge_count(), 2u);
    EXPECT_EQ(g.out_degree(a), 2u);
    EXPECT_EQ(g.edges(a)[1].weight, 9u);
}

TEST(ListGraphTest, SelfEdge) {
    list_graph<int, directed> g;
    auto a = g.add_node(0);
    g.add_edge(a, a);
    EXPECT_TRUE(g.has_edge(a, a));
    EXPECT_EQ(neighbours_of(g, a), (std::vector<node_index>{a}));
}

TEST(ListGraphTest, NeighboursInInsertionOrder) {
    list_graph<int, directed> g;
    for (int i = 0; i < 4; ++i) (void)g.add_node(i);
    g.add_edge(0, 3);
    g.add_edge(0, 1);
    g.add_edge(0, 2);

    EXPECT_EQ(neighbours_of(g, 0), (std::vector<node_index>{3, 1, 2}));
    EXPECT_EQ(g.out_neighbors(0).size(), 3u);
    EXPECT_TRUE(g.out_neighbors(3).empty());
}

TEST(ListGraphTest, CustomWeightType) {
    list_graph<std::string, directed, double> g;
    auto a = g.add_node("a");
    auto b = g.add_node("b");
    g.add_edge(a, b, 0.5);
    EXPECT_DOUBLE_EQ(g.edges(a)[0].weight, 0.5);
}

TEST(ListGraphTest, NodesSpanCoversAllNodes) {
    list_graph<int, undirected> g;
    (void)g.add_node(10);
    (void)g.add_node(20);
    g.add_edge(0, 1);

    auto const nodes = g.nodes();
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].value, 10);
    EXPECT_EQ(nodes[1].edges.size(), 1u);
}

// =========================================================================
// Range checks
// =========================================================================

TEST(ListGraphTest, OutOfRangeIndicesThrow) {
    list_graph<int, directed> g;
    auto a = g.add_node(0);

    EXPECT_THROW(g.add_edge(a, 1), std::out_of_range);
    EXPECT_THROW(g.add_edge(5, a), std::out_of_range);
    EXPECT_THROW((void)g.node_value(1), std::out_of_range);
    EXPECT_THROW((void)g.edges(3), std::out_of_range);
    EXPECT_THROW((void)g.out_neighbors(3), std::out_of_range);
    EXPECT_EQ(g.edge_count(), 0u);
}
