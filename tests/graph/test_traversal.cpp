// tests/graph/test_traversal.cpp — Tests for lazy BFS and DFS
//
// Coverage: visitation order on both representations, reachable-set
// equality, laziness, cycles, self-edges, deep chains, range checks.

#include <graphkit/traversal.h>
#include <graphkit/list_graph.h>
#include <graphkit/matrix_graph.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

using namespace graphkit;

namespace {

// 0→1, 0→2, 1→3, 2→3, 3→4; node 5 isolated.
matrix_graph<int, kind::directed_unweighted> make_matrix() {
    matrix_graph<int, kind::directed_unweighted> g;
    for (int i = 0; i < 6; ++i) (void)g.add_node(i);
    g.add_edge(0, 1);
    g.add_edge(0, 2);
    g.add_edge(1, 3);
    g.add_edge(2, 3);
    g.add_edge(3, 4);
    return g;
}

// Same shape, neighbours of 0 inserted as 2 then 1.
list_graph<int, directed> make_list() {
    list_graph<int, directed> g;
    for (int i = 0; i < 6; ++i) (void)g.add_node(i);
    g.add_edge(0, 2);
    g.add_edge(0, 1);
    g.add_edge(1, 3);
    g.add_edge(2, 3);
    g.add_edge(3, 4);
    return g;
}

std::vector<node_index> sorted(std::vector<node_index> v) {
    std::sort(v.begin(), v.end());
    return v;
}

} // namespace

// =========================================================================
// BFS
// =========================================================================

TEST(BfsTest, MatrixOrderIsAscendingByLayer) {
    auto const g = make_matrix();
    EXPECT_EQ(visit_order(bfs(g, 0)), (std::vector<node_index>{0, 1, 2, 3, 4}));
}

TEST(BfsTest, ListOrderFollowsInsertion) {
    auto const g = make_list();
    EXPECT_EQ(visit_order(bfs(g, 0)), (std::vector<node_index>{0, 2, 1, 3, 4}));
}

TEST(BfsTest, RangeForLoop) {
    auto const g = make_matrix();
    std::vector<node_index> seen;
    for (auto v : bfs(g, 1)) seen.push_back(v);
    EXPECT_EQ(seen, (std::vector<node_index>{1, 3, 4}));
}

TEST(BfsTest, IsolatedStartYieldsOnlyStart) {
    auto const g = make_matrix();
    EXPECT_EQ(visit_order(bfs(g, 5)), (std::vector<node_index>{5}));
}

TEST(BfsTest, LazyNextAndDiscovered) {
    auto const g = make_matrix();
    auto view = bfs(g, 0);
    EXPECT_FALSE(view.discovered(3));

    auto first = view.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 0u);
    EXPECT_TRUE(view.discovered(1));
    EXPECT_TRUE(view.discovered(2));
    EXPECT_FALSE(view.discovered(3));
}

TEST(BfsTest, CycleVisitsEachNodeOnce) {
    list_graph<int, directed> g;
    for (int i = 0; i < 3; ++i) (void)g.add_node(i);
    g.add_edge(0, 1);
    g.add_edge(1, 2);
    g.add_edge(2, 0);
    g.add_edge(2, 2);
    EXPECT_EQ(visit_order(bfs(g, 1)), (std::vector<node_index>{1, 2, 0}));
}

TEST(BfsTest, UndirectedReachesBothWays) {
    list_graph<int, undirected> g;
    for (int i = 0; i < 3; ++i) (void)g.add_node(i);
    g.add_edge(0, 1);
    g.add_edge(1, 2);
    EXPECT_EQ(sorted(visit_order(bfs(g, 2))), (std::vector<node_index>{0, 1, 2}));
}

TEST(BfsTest, StartOutOfRangeThrows) {
    auto const g = make_matrix();
    EXPECT_THROW((void)bfs(g, 6), std::out_of_range);
}

// =========================================================================
// DFS
// =========================================================================

TEST(DfsTest, MatrixPreOrder) {
    auto const g = make_matrix();
    EXPECT_EQ(visit_order(dfs(g, 0)), (std::vector<node_index>{0, 1, 3, 4, 2}));
}

TEST(DfsTest, ListPreOrderFollowsInsertion) {
    auto const g = make_list();
    EXPECT_EQ(visit_order(dfs(g, 0)), (std::vector<node_index>{0, 2, 3, 4, 1}));
}

TEST(DfsTest, RangeForLoop) {
    auto const g = make_list();
    std::vector<node_index> seen;
    for (auto v : dfs(g, 2)) seen.push_back(v);
    EXPECT_EQ(seen, (std::vector<node_index>{2, 3, 4}));
}

TEST(DfsTest, StartOutOfRangeThrows) {
    auto const g = make_list();
    EXPECT_THROW((void)dfs(g, 99), std::out_of_range);
}

TEST(DfsTest, DeepChainNoRecursion) {
    constexpr std::size_t N = 100000;
    list_graph<int, directed> g;
    for (std::size_t i = 0; i < N; ++i) (void)g.add_node(0);
    for (std::size_t i = 0; i + 1 < N; ++i) g.add_edge(i, i + 1);

    auto const order = visit_order(dfs(g, 0));
    ASSERT_EQ(order.size(), N);
    EXPECT_EQ(order.front(), 0u);
    EXPECT_EQ(order.back(), N - 1);
}

// =========================================================================
// BFS and DFS agree on the reachable set
// =========================================================================

TEST(TraversalTest, SameReachableSetFromEveryStart) {
    auto const lg = make_list();
    auto const mg = make_matrix();
    for (node_index s = 0; s < 6; ++s) {
        auto const b = sorted(visit_order(bfs(lg, s)));
        EXPECT_EQ(b, sorted(visit_order(dfs(lg, s))));
        EXPECT_EQ(b, sorted(visit_order(bfs(mg, s))));
        EXPECT_EQ(b, sorted(visit_order(dfs(mg, s))));
    }
}
