// graphkit/graph_concepts.h — Node descriptors and graph concepts
// Part of the graphkit graph-algorithms library (C++20)
//
// DESIGN RATIONALE:
// Both representations (list_graph, matrix_graph) identify nodes by a
// dense zero-based index issued in insertion order.  Algorithms are
// written once against graph_queryable and work on either storage.
//
// Neighbour order is a property of the representation, not of the
// algorithm: list_graph yields edge-insertion order, matrix_graph yields
// ascending index order (row scan).  Traversals inherit that order.

#ifndef GRAPHKIT_GRAPH_CONCEPTS_H
#define GRAPHKIT_GRAPH_CONCEPTS_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <ranges>
#include <utility>

namespace graphkit {

// =============================================================================
// Descriptor types
// =============================================================================

/// Dense node index.  Valid only for the graph instance that issued it.
using node_index = std::size_t;

/// Sentinel for "no node" / "no predecessor" / "unvisited".
inline constexpr node_index invalid_node = std::numeric_limits<node_index>::max();

/// Matrix cell value.  0 is reserved for "no edge".
using matrix_weight = std::size_t;

/// Accumulated path cost used by shortest-path search.
using path_cost = std::uint64_t;

// =============================================================================
// Graph concepts
// =============================================================================

/// A graph_queryable provides read-only adjacency queries.
///
/// Requirements:
/// - node_count(): number of nodes
/// - out_neighbors(u): forward range of node_index (destinations of u)
///
/// Satisfied by:
/// - list_graph<V, Dir, W>
/// - matrix_graph<T, Kind>
template<typename G>
concept graph_queryable =
    requires(G const& g, node_index u) {
        { g.node_count() } -> std::convertible_to<std::size_t>;
        { g.out_neighbors(u) } -> std::ranges::forward_range;
    } &&
    std::convertible_to<
        std::ranges::range_value_t<
            decltype(std::declval<G const&>().out_neighbors(node_index{}))>,
        node_index>;

/// A matrix_queryable additionally exposes each node's full weight row
/// (N cells, 0 = absent) and O(1) edge tests.
template<typename G>
concept matrix_queryable =
    graph_queryable<G> &&
    requires(G const& g, node_index u, node_index v) {
        { g.edges(u) } -> std::ranges::contiguous_range;
        { g.has_edge(u, v) } -> std::convertible_to<bool>;
    } &&
    std::convertible_to<
        std::ranges::range_value_t<
            decltype(std::declval<G const&>().edges(node_index{}))>,
        matrix_weight>;

/// Node values usable as matrix_graph lookup keys.
template<typename T>
concept hashable_value =
    std::equality_comparable<T> &&
    std::copy_constructible<T> &&
    requires(T const& t) {
        { std::hash<T>{}(t) } -> std::convertible_to<std::size_t>;
    };

} // namespace graphkit

#endif // GRAPHKIT_GRAPH_CONCEPTS_H
