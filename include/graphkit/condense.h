// graphkit/condense.h — Collapse strongly connected components
// Part of the graphkit graph-algorithms library (C++20)
//
// ALGORITHM:
// Given a directed graph G and its SCC labels, produce the condensation
// G' where:
// - Each component becomes a single node
// - Edges between components are preserved (deduplicated)
// - Intra-component edges are dropped (G' has no self-edges)
//
// G' is acyclic by construction.
//
// COMPLEXITY: O(V + E) plus O(μ^2) for the condensed matrix, where μ is
// the component count.
//
// IDENTITY REMAPPING:
// Condensed indices are issued in ascending order of each component's
// smallest member.  component_of maps original → condensed; members maps
// condensed → original (ascending).  The condensed graph's node values are
// the components' representative (root) indices from the SCC labels.
//
// The input graph is never modified.

#ifndef GRAPHKIT_CONDENSE_H
#define GRAPHKIT_CONDENSE_H

#include "graph_concepts.h"
#include "graph_kind.h"
#include "matrix_graph.h"
#include "scc.h"

#include <cstddef>
#include <map>
#include <stdexcept>
#include <vector>

namespace graphkit {

/// Result of condensation.
struct condensation {
    /// One node per component; value = representative original index.
    matrix_graph<node_index, kind::directed_unweighted> graph;

    /// Original node → condensed index.
    std::vector<node_index> component_of;

    /// Condensed index → original nodes, ascending.
    std::vector<std::vector<node_index>> members;

    /// True if the component contains a cycle: more than one member, or
    /// a single member with a self-edge.
    std::vector<bool> cyclic;

    [[nodiscard]] std::size_t component_count() const noexcept {
        return members.size();
    }
};

/// Group nodes by component label.
///
/// Maps each representative label to the other members of its component
/// (the representative itself excluded).  Components with a single member
/// whose label is its own index do not appear.
///
/// Example:
/// ```cpp
/// gather_components({0, 0, 2, 2, 2, 5, 0});
/// // {0: [1, 6], 2: [3, 4]}
/// ```
[[nodiscard]] inline std::map<node_index, std::vector<node_index>>
gather_components(std::vector<node_index> const& labels) {
    std::map<node_index, std::vector<node_index>> groups;
    for (node_index v = 0; v < labels.size(); ++v) {
        if (labels[v] == v) continue;
        groups[labels[v]].push_back(v);
    }
    return groups;
}

/// Condense `g` using precomputed SCC labels.
///
/// Throws std::invalid_argument if `components` was computed for a graph
/// of a different size.
template<graph_queryable G>
[[nodiscard]] condensation condense(G const& g, scc_result const& components) {
    auto const V = g.node_count();
    if (components.root_of.size() != V) {
        throw std::invalid_argument("condense: SCC labels do not match graph size");
    }

    condensation result;
    result.component_of.assign(V, invalid_node);
    result.graph.reserve(components.component_count);

    // Root label → condensed index, issued on first (smallest) member.
    std::map<node_index, node_index> condensed_of_root;
    for (node_index v = 0; v < V; ++v) {
        auto const root = components.root_of[v];
        auto [it, inserted] = condensed_of_root.try_emplace(root, result.members.size());
        if (inserted) {
            (void)result.graph.add_node(root);
            result.members.emplace_back();
            result.cyclic.push_back(false);
        }
        result.component_of[v] = it->second;
        result.members[it->second].push_back(v);
    }

    // Cross-component edges become condensed edges; the matrix
    // deduplicates parallel ones.
    for (node_index u = 0; u < V; ++u) {
        auto const cu = result.component_of[u];
        for (auto v : g.out_neighbors(u)) {
            auto const cv = result.component_of[v];
            if (cu == cv) {
                result.cyclic[cu] = true;
            } else {
                result.graph.add_edge(cu, cv);
            }
        }
    }

    return result;
}

/// Condense `g`, computing its SCCs first.
template<graph_queryable G>
[[nodiscard]] condensation condense(G const& g) {
    return condense(g, scc(g));
}

} // namespace graphkit

#endif // GRAPHKIT_CONDENSE_H
