// graphkit/transpose.h — Reverse all edge directions
// Part of the graphkit graph-algorithms library (C++20)
//
// ALGORITHM:
// Given a directed graph G, produce Gᵀ where every edge (u→v) in G
// becomes (v→u) in Gᵀ.  Node count, values and weights are preserved.
// Node indices are identity-mapped.
//
// Two forms:
// - transpose(matrix_graph&)        in place, O(V^2) cell swaps
// - transposed(list_graph const&)   new graph, O(V + E)
//
// Undirected graphs are their own transpose: the matrix form is left
// untouched and the list form is copied.

#ifndef GRAPHKIT_TRANSPOSE_H
#define GRAPHKIT_TRANSPOSE_H

#include "graph_concepts.h"
#include "graph_kind.h"
#include "list_graph.h"
#include "matrix_graph.h"

#include <cstddef>

namespace graphkit {

/// Transpose a matrix graph in place.  Applying it twice restores the
/// original matrix.
///
/// Example:
/// ```cpp
/// // a→b, c→b
/// transpose(g);
/// // b→a, b→c
/// ```
template<hashable_value T, graph_kind_policy Kind>
void transpose(matrix_graph<T, Kind>& g) noexcept {
    g.transpose();
}

/// Build the transpose of a list graph.
///
/// Edge records of Gᵀ are grouped by new source in ascending order of
/// the original source, preserving each source's insertion order.
template<typename V, direction_tag Dir, std::copyable W>
[[nodiscard]] list_graph<V, Dir, W>
transposed(list_graph<V, Dir, W> const& g) {
    if constexpr (!Dir::is_directed) {
        return g;
    } else {
        list_graph<V, Dir, W> out;
        auto const V_count = g.node_count();
        for (std::size_t i = 0; i < V_count; ++i) {
            (void)out.add_node(g.node_value(i));
        }

        // Reverse every edge: (u→v) becomes (v→u).
        for (std::size_t u = 0; u < V_count; ++u) {
            for (auto const& e : g.edges(u)) {
                out.add_edge(e.target, u, e.weight);
            }
        }
        return out;
    }
}

} // namespace graphkit

#endif // GRAPHKIT_TRANSPOSE_H
