// graphkit/graph_io.h — Stream-based text output for graphs and closures
// Part of the graphkit graph-algorithms library (C++20)
//
// Includes <ostream> only; callers choose the stream.
//
// Graph format:
//   nodes N
//   undirected            (undirected graphs only)
//   edge 0 1 [weight]
//   ...
//
// One line per stored directed edge.  Undirected graphs emit each edge
// once, from the smaller endpoint (u <= v); a self-edge appears once per
// add_edge call.  Weights are written for
// weighted matrix kinds and for list graphs whose weight type is
// streamable.
//
// Reachability format: one row per line, one '0'/'1' per column.

#ifndef GRAPHKIT_GRAPH_IO_H
#define GRAPHKIT_GRAPH_IO_H

#include "graph_concepts.h"
#include "graph_kind.h"
#include "list_graph.h"
#include "matrix_graph.h"
#include "transitive_closure.h"

#include <cstddef>
#include <ostream>

namespace graphkit::io {

/// Write a list graph.
template<typename V, direction_tag Dir, std::copyable W>
void write(std::ostream& os, list_graph<V, Dir, W> const& g) {
    os << "nodes " << g.node_count() << '\n';
    if constexpr (!Dir::is_directed) {
        os << "undirected\n";
    }

    for (node_index u = 0; u < g.node_count(); ++u) {
        // An undirected self-edge is stored as two records on u; every
        // second one is the reciprocal.
        [[maybe_unused]] bool self_pending = false;
        for (auto const& e : g.edges(u)) {
            if constexpr (!Dir::is_directed) {
                if (u > e.target) continue;
                if (u == e.target) {
                    self_pending = !self_pending;
                    if (!self_pending) continue;
                }
            }
            os << "edge " << u << ' ' << e.target;
            if constexpr (requires { os << e.weight; }) {
                os << ' ' << e.weight;
            }
            os << '\n';
        }
    }
}

/// Write a matrix graph.  Rows are scanned in ascending order.
template<hashable_value T, graph_kind_policy Kind>
void write(std::ostream& os, matrix_graph<T, Kind> const& g) {
    os << "nodes " << g.node_count() << '\n';
    if constexpr (!Kind::is_directed) {
        os << "undirected\n";
    }

    for (node_index u = 0; u < g.node_count(); ++u) {
        auto const row = g.edges(u);
        for (node_index v = 0; v < row.size(); ++v) {
            if (row[v] == 0) continue;
            if constexpr (!Kind::is_directed) {
                if (u > v) continue;
            }
            os << "edge " << u << ' ' << v;
            if constexpr (Kind::is_weighted) {
                os << ' ' << row[v];
            }
            os << '\n';
        }
    }
}

/// Write a reachability matrix as rows of '0'/'1'.
inline void write(std::ostream& os, reachability_matrix const& m) {
    for (std::size_t i = 0; i < m.size(); ++i) {
        for (bool cell : m[i]) {
            os << (cell ? '1' : '0');
        }
        os << '\n';
    }
}

} // namespace graphkit::io

namespace graphkit {

inline std::ostream& operator<<(std::ostream& os, reachability_matrix const& m) {
    io::write(os, m);
    return os;
}

} // namespace graphkit

#endif // GRAPHKIT_GRAPH_IO_H
