// tests/graph/test_graph_umbrella.cpp — Umbrella header compilation test
//
// Verifies that #include <graphkit/graph.h> compiles without errors
// and all major types are accessible through it.

#include <graphkit/graph.h>

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace graphkit;

// Smoke test: build a graph, run the algorithms, apply a transform,
// all via the umbrella header.
TEST(GraphUmbrellaTest, FullPipelineThroughUmbrella) {
    matrix_graph<std::string, kind::directed_weighted> g;
    auto a = g.add_node("a");
    auto b = g.add_node("b");
    auto c = g.add_node("c");
    auto d = g.add_node("d");
    g.add_edge(a, b, 2);
    g.add_edge(b, c, 2);
    g.add_edge(c, a, 2);
    g.add_edge(a, d, 9);

    // Traversal.
    EXPECT_EQ(visit_order(bfs(g, a)).size(), 4u);

    // Shortest path.
    auto const path = path_to(g, b, d);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, (std::vector<node_index>{b, c, a, d}));
    EXPECT_EQ(path_weight(g, *path), 13u);

    // Components.
    auto const comps = scc(g);
    EXPECT_EQ(comps.component_count, 2u);
    auto const cond = condense(g, comps);
    EXPECT_TRUE(topological_sort(cond.graph).is_dag);

    // Closure.
    auto const m = transitive_closure(g);
    EXPECT_TRUE(m.test(c, d));
    EXPECT_FALSE(m.test(d, a));

    // Transform.
    transpose(g);
    EXPECT_TRUE(g.has_edge(d, a));
    EXPECT_TRUE(transitive_closure(g).test(d, c));

    // I/O.
    std::ostringstream os;
    io::write(os, g);
    EXPECT_EQ(os.str().substr(0, 8), "nodes 4\n");
}
