// graphkit/index_guard.h — Uniform node-index checks for graphs and algorithms
// Part of the graphkit graph-algorithms library (C++20)
//
// DESIGN RATIONALE:
// Every operation that accepts a node index indexes into per-node
// storage.  An index >= node_count() would otherwise read or write out of
// bounds.  This header provides the single enforcement point:
//
//   require_node(u, g.node_count(), "dijkstra: start not in graph");
//
// Throws std::out_of_range with the message.  Use at the top of every
// public operation taking a node index.

#ifndef GRAPHKIT_INDEX_GUARD_H
#define GRAPHKIT_INDEX_GUARD_H

#include "graph_concepts.h"

#include <cstddef>
#include <stdexcept>

namespace graphkit {

/// Check that `u` names an existing node of a graph with `count` nodes.
///
/// Throws std::out_of_range(msg) otherwise.
inline void require_node(node_index u, std::size_t count, char const* msg) {
    if (u >= count) {
        throw std::out_of_range(msg);
    }
}

/// Check both endpoints of an edge.
inline void require_edge_endpoints(node_index u, node_index v,
                                   std::size_t count,
                                   char const* source_msg,
                                   char const* target_msg) {
    require_node(u, count, source_msg);
    require_node(v, count, target_msg);
}

} // namespace graphkit

#endif // GRAPHKIT_INDEX_GUARD_H
