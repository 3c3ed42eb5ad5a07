// graphkit/topological_sort.h — Topological ordering
// Part of the graphkit graph-algorithms library (C++20)
//
// Kahn's algorithm with a min-heap of sources.  A node becomes a source
// once every edge into it has been consumed; the heap always releases the
// lowest-indexed source, so the result is the lexicographically smallest
// topological order and is reproducible across runs.
//
// Complexity: O(E + V log V) plus the cost of enumerating out_neighbors()
// (O(V^2) in total for matrix_graph).
//
// Used by closure_by_condensation to order the condensed DAG; also
// usable on its own to detect cycles.

#ifndef GRAPHKIT_TOPOLOGICAL_SORT_H
#define GRAPHKIT_TOPOLOGICAL_SORT_H

#include "graph_concepts.h"

#include <cstddef>
#include <functional>
#include <queue>
#include <vector>

namespace graphkit {

/// Result of topological sort.
///
/// - order:  nodes such that every edge u→v has u before v
/// - is_dag: false if a cycle stopped the sort; order then holds only
///           the nodes emitted before it stalled
struct topo_result {
    std::vector<node_index> order;
    bool is_dag = true;
};

/// Topological sort, smallest available index first.
///
/// Example:
/// ```cpp
/// // 3→0, 2→1
/// auto r = topological_sort(g);
/// // r.is_dag, r.order == {2, 1, 3, 0}
/// ```
template<graph_queryable G>
[[nodiscard]] topo_result topological_sort(G const& g) {
    auto const V = g.node_count();
    topo_result result;
    result.order.reserve(V);

    // Unconsumed incoming edges per node (parallel edges count each).
    std::vector<std::size_t> pending_in(V, 0);
    for (node_index u = 0; u < V; ++u) {
        for (auto v : g.out_neighbors(u)) ++pending_in[v];
    }

    std::priority_queue<node_index, std::vector<node_index>, std::greater<>> sources;
    for (node_index u = 0; u < V; ++u) {
        if (pending_in[u] == 0) sources.push(u);
    }

    while (!sources.empty()) {
        auto const u = sources.top();
        sources.pop();
        result.order.push_back(u);

        for (auto v : g.out_neighbors(u)) {
            if (--pending_in[v] == 0) sources.push(v);
        }
    }

    // Nodes on or behind a cycle never lose all their incoming edges.
    result.is_dag = result.order.size() == V;
    return result;
}

} // namespace graphkit

#endif // GRAPHKIT_TOPOLOGICAL_SORT_H
