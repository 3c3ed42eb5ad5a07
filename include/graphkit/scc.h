// graphkit/scc.h — Strongly connected components (Tarjan)
// Part of the graphkit graph-algorithms library (C++20)
//
// ALGORITHM: Iterative Tarjan's algorithm.
// Complexity: O(V + E) for list_graph, O(V^2) for matrix_graph (row scans).
// Determinism: DFS roots are tried in ascending index order; neighbours
// follow the graph's out_neighbors() order.
//
// DESIGN RATIONALE:
// Iterative (not recursive): deep graphs would otherwise need a native
// call stack proportional to V.  Uses an explicit call stack with frames
// tracking DFS state, plus the usual Tarjan stack of nodes awaiting
// assignment.
//
// LABELS:
// When a root finishes (discovery index == low-link) every node popped
// down to it receives the root's discovery index as its final low-link
// and the root's node index as its representative.  Labels are therefore
// NOT dense component ids: two nodes are in the same component iff they
// share a label.

#ifndef GRAPHKIT_SCC_H
#define GRAPHKIT_SCC_H

#include "graph_concepts.h"

#include <cstddef>
#include <limits>
#include <ranges>
#include <utility>
#include <vector>

namespace graphkit {

/// Result of strongly connected components analysis.
///
/// - root_of[n]:  index of the root node of n's component
/// - lowlink[n]:  final low-link of n (the root's discovery index)
/// - component_count: total number of SCCs
struct scc_result {
    std::vector<node_index> root_of;
    std::vector<std::size_t> lowlink;
    std::size_t component_count = 0;

    [[nodiscard]] bool same_component(node_index u, node_index v) const {
        return root_of.at(u) == root_of.at(v);
    }
};

/// Strongly connected components via iterative Tarjan's algorithm.
///
/// Example:
/// ```cpp
/// // b→a, a→c, c→b, a→d, d→e
/// auto r = scc(g);
/// // r.component_count == 3; a, b, c share r.root_of
/// ```
template<graph_queryable G>
[[nodiscard]] scc_result scc(G const& g) {
    auto const V = g.node_count();

    scc_result result;
    result.root_of.assign(V, invalid_node);
    result.lowlink.assign(V, 0);

    if (V == 0) {
        return result;
    }

    // Tarjan's state.
    constexpr std::size_t UNVISITED = std::numeric_limits<std::size_t>::max();

    std::vector<std::size_t> index_of(V, UNVISITED);  // discovery index
    auto& lowlink = result.lowlink;                  // lowest reachable index
    std::vector<bool> on_stack(V, false);            // currently on Tarjan stack

    // Tarjan's stack (nodes awaiting SCC assignment).
    std::vector<node_index> tarjan_stack;

    // DFS call stack frame: the node and where to resume in its neighbours.
    using range_type = decltype(g.out_neighbors(node_index{}));
    struct frame {
        node_index node;
        std::ranges::iterator_t<range_type const> next;
        std::ranges::sentinel_t<range_type const> end;
    };
    std::vector<frame> call_stack;

    std::size_t next_index = 0;

    auto discover = [&](node_index u) {
        index_of[u] = next_index;
        lowlink[u] = next_index;
        ++next_index;
        on_stack[u] = true;
        tarjan_stack.push_back(u);
        auto const range = g.out_neighbors(u);
        call_stack.push_back(frame{u, std::ranges::begin(range), std::ranges::end(range)});
    };

    // Process each unvisited node (deterministic: ascending index order).
    for (node_index start = 0; start < V; ++start) {
        if (index_of[start] != UNVISITED) {
            continue;
        }
        discover(start);

        // Iterative DFS loop.
        while (!call_stack.empty()) {
            auto& top = call_stack.back();

            if (top.next != top.end) {
                auto const w = static_cast<node_index>(*top.next);
                ++top.next;

                if (index_of[w] == UNVISITED) {
                    // Tree edge: "recurse" into w.
                    discover(w);
                } else if (on_stack[w]) {
                    // Back edge: update lowlink.
                    if (index_of[w] < lowlink[top.node]) {
                        lowlink[top.node] = index_of[w];
                    }
                }
            } else {
                // All neighbours processed. Check if this is an SCC root.
                auto const u = top.node;
                call_stack.pop_back();

                if (lowlink[u] == index_of[u]) {
                    // u is the root of an SCC. Pop everything up to u.
                    while (true) {
                        auto const w = tarjan_stack.back();
                        tarjan_stack.pop_back();
                        on_stack[w] = false;
                        lowlink[w] = index_of[u];
                        result.root_of[w] = u;
                        if (w == u) break;
                    }
                    ++result.component_count;
                }

                // Update parent's lowlink.
                if (!call_stack.empty()) {
                    auto const parent = call_stack.back().node;
                    if (lowlink[u] < lowlink[parent]) {
                        lowlink[parent] = lowlink[u];
                    }
                }
            }
        }
    }

    return result;
}

/// Per-node component labels: the representative (root) node index of
/// each node's component.
template<graph_queryable G>
[[nodiscard]] std::vector<node_index> sccs(G const& g) {
    return scc(g).root_of;
}

} // namespace graphkit

#endif // GRAPHKIT_SCC_H
