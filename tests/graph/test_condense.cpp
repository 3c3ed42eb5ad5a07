// tests/graph/test_condense.cpp — Tests for SCC grouping and condensation
//
// Coverage: gather_components grouping, component mapping, condensed
// edges, cyclic flags, acyclicity of the result, error paths.

#include <graphkit/condense.h>
#include <graphkit/list_graph.h>
#include <graphkit/matrix_graph.h>
#include <graphkit/topological_sort.h>

#include <gtest/gtest.h>

#include <cstddef>
#include <map>
#include <stdexcept>
#include <vector>

using namespace graphkit;

namespace {

// a=0, b=1, c=2, d=3, e=4.  b→a, a→c, c→b, a→d, d→e.
list_graph<char, directed> make_three_components() {
    list_graph<char, directed> g;
    for (char c = 'a'; c <= 'e'; ++c) (void)g.add_node(c);
    g.add_edge(1, 0);
    g.add_edge(0, 2);
    g.add_edge(2, 1);
    g.add_edge(0, 3);
    g.add_edge(3, 4);
    return g;
}

} // namespace

// =========================================================================
// gather_components
// =========================================================================

TEST(GatherComponentsTest, GroupsNonRepresentatives) {
    auto const groups = gather_components({0, 0, 2, 2, 2, 5, 0});
    std::map<node_index, std::vector<node_index>> const expected{
        {0, {1, 6}},
        {2, {3, 4}},
    };
    EXPECT_EQ(groups, expected);
}

TEST(GatherComponentsTest, AllSingletonsIsEmpty) {
    EXPECT_TRUE(gather_components({0, 1, 2}).empty());
    EXPECT_TRUE(gather_components({}).empty());
}

TEST(GatherComponentsTest, FromTarjanLabels) {
    auto const groups = gather_components(sccs(make_three_components()));
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups.begin()->first, 0u);
    EXPECT_EQ(groups.begin()->second, (std::vector<node_index>{1, 2}));
}

// =========================================================================
// condense
// =========================================================================

TEST(CondenseTest, ThreeComponents) {
    auto const g = make_three_components();
    auto const c = condense(g);

    ASSERT_EQ(c.component_count(), 3u);
    EXPECT_EQ(c.graph.node_count(), 3u);

    // Condensed indices follow each component's smallest member.
    EXPECT_EQ(c.component_of, (std::vector<node_index>{0, 0, 0, 1, 2}));
    EXPECT_EQ(c.members[0], (std::vector<node_index>{0, 1, 2}));
    EXPECT_EQ(c.members[1], (std::vector<node_index>{3}));
    EXPECT_EQ(c.members[2], (std::vector<node_index>{4}));

    EXPECT_TRUE(c.graph.has_edge(0, 1));
    EXPECT_TRUE(c.graph.has_edge(1, 2));
    EXPECT_FALSE(c.graph.has_edge(0, 2));
    EXPECT_EQ(c.graph.edge_count(), 2u);

    EXPECT_TRUE(c.cyclic[0]);
    EXPECT_FALSE(c.cyclic[1]);
    EXPECT_FALSE(c.cyclic[2]);
}

TEST(CondenseTest, NodeValuesAreRepresentatives) {
    auto const c = condense(make_three_components());
    EXPECT_EQ(c.graph.node_value(0), 0u);
    EXPECT_EQ(c.graph.node_value(1), 3u);
    EXPECT_EQ(c.graph.index_of(4).value(), 2u);
}

TEST(CondenseTest, SelfEdgeMarksCyclic) {
    matrix_graph<int, kind::directed_unweighted> g;
    (void)g.add_node(0);
    (void)g.add_node(1);
    g.add_edge(1, 1);
    g.add_edge(0, 1);

    auto const c = condense(g);
    EXPECT_EQ(c.component_count(), 2u);
    EXPECT_FALSE(c.cyclic[0]);
    EXPECT_TRUE(c.cyclic[1]);
    EXPECT_FALSE(c.graph.has_edge(1, 1));
}

TEST(CondenseTest, ParallelCrossEdgesDeduplicated) {
    list_graph<int, directed> g;
    for (int i = 0; i < 4; ++i) (void)g.add_node(i);
    g.add_edge(0, 1);
    g.add_edge(1, 0);
    g.add_edge(0, 2);
    g.add_edge(1, 2);
    g.add_edge(1, 2);

    auto const c = condense(g);
    EXPECT_EQ(c.component_count(), 3u);
    EXPECT_EQ(c.graph.edge_count(), 1u);
}

TEST(CondenseTest, ResultIsAcyclic) {
    // {0,1} → {2,3} → {4,5,6} → {7}
    list_graph<int, directed> g;
    for (int i = 0; i < 8; ++i) (void)g.add_node(i);
    g.add_edge(0, 1); g.add_edge(1, 0);
    g.add_edge(2, 3); g.add_edge(3, 2);
    g.add_edge(1, 2);
    g.add_edge(3, 4);
    g.add_edge(4, 5); g.add_edge(5, 6); g.add_edge(6, 4);
    g.add_edge(6, 7);

    auto const c = condense(g);
    EXPECT_EQ(c.component_count(), 4u);
    EXPECT_TRUE(topological_sort(c.graph).is_dag);
}

TEST(CondenseTest, InputIsNotModified) {
    auto const g = make_three_components();
    auto const before = g.edge_count();
    (void)condense(g);
    EXPECT_EQ(g.edge_count(), before);
}

TEST(CondenseTest, MismatchedLabelsThrow) {
    auto const g = make_three_components();
    scc_result bad;
    bad.root_of = {0, 1};
    bad.lowlink = {0, 1};
    bad.component_count = 2;
    EXPECT_THROW((void)condense(g, bad), std::invalid_argument);
}
