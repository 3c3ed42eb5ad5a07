// graphkit/shortest_path.h — Dijkstra's shortest path over matrix graphs
// Part of the graphkit graph-algorithms library (C++20)
//
// ALGORITHM: Dijkstra with an index-based binary min-heap.
// Complexity: O(V^2 + V log V) on a matrix graph (every pop scans a row).
//
// DESIGN RATIONALE:
// The heap is index-based: a position array tracks where each node sits
// in the heap, enabling O(log V) decrease-key via sift-up.  All nodes
// start in the heap at infinite cost; the loop stops at the first node
// whose cost is still infinite (everything left is undiscovered).
//
// Only positive cells relax distances.  A cell of 0 is "no edge", so a
// genuine zero-cost edge cannot be expressed (see matrix_graph.h).
//
// A node's cost and predecessor change only when a strictly smaller cost
// is found.  Ties between equal-cost frontier nodes are broken
// arbitrarily by the heap.
//
// Optional controls:
// - max_cost: a relaxation whose new cost exceeds max_cost is rejected,
//   bounding the search radius.
// - target:   the search stops as soon as target is popped (settled).
//   Equal-cost alternatives elsewhere may be left unexplored.

#ifndef GRAPHKIT_SHORTEST_PATH_H
#define GRAPHKIT_SHORTEST_PATH_H

#include "graph_concepts.h"
#include "index_guard.h"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace graphkit {

/// Cost of a node that has not been discovered.
inline constexpr path_cost unreachable_cost = std::numeric_limits<path_cost>::max();

// =========================================================================
// Result type
// =========================================================================

/// Discovered nodes of a Dijkstra run and how each was reached.
///
/// - predecessor(v): node v was reached from, std::nullopt for the source
/// - cost(v):        cost of the best path found to v
///
/// Only nodes discovered before the search stopped are present.  A node
/// cut off by max_cost is absent.
class predecessor_map {
public:
    struct entry {
        std::optional<node_index> predecessor;
        path_cost cost = 0;
    };

    using container_type = std::unordered_map<node_index, entry>;
    using const_iterator = container_type::const_iterator;

    predecessor_map() = default;
    predecessor_map(node_index source, container_type entries)
        : source_(source), entries_(std::move(entries)) {}

    [[nodiscard]] node_index source() const noexcept { return source_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] bool contains(node_index v) const {
        return entries_.find(v) != entries_.end();
    }

    /// Predecessor of `v`; std::nullopt for the source.
    /// Throws std::out_of_range if `v` was not discovered.
    [[nodiscard]] std::optional<node_index> predecessor(node_index v) const {
        return lookup(v).predecessor;
    }

    /// Cost of the best path found to `v`.
    /// Throws std::out_of_range if `v` was not discovered.
    [[nodiscard]] path_cost cost(node_index v) const {
        return lookup(v).cost;
    }

    /// Walk predecessors back from `target` to the source.
    ///
    /// Returns the path in source → target order, both endpoints
    /// included (a path to the source itself is {source}).  Returns
    /// std::nullopt if `target` was not discovered or the chain breaks.
    [[nodiscard]] std::optional<std::vector<node_index>>
    path_to(node_index target) const {
        if (!contains(target)) {
            return std::nullopt;
        }
        std::vector<node_index> path;
        auto cur = target;
        while (true) {
            path.push_back(cur);
            if (cur == source_) break;
            if (path.size() > entries_.size()) {
                return std::nullopt;  // malformed chain
            }
            auto const it = entries_.find(cur);
            if (it == entries_.end() || !it->second.predecessor) {
                return std::nullopt;
            }
            cur = *it->second.predecessor;
        }
        std::reverse(path.begin(), path.end());
        return path;
    }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

private:
    entry const& lookup(node_index v) const {
        auto const it = entries_.find(v);
        if (it == entries_.end()) {
            throw std::out_of_range("predecessor_map: node was not discovered");
        }
        return it->second;
    }

    node_index source_ = invalid_node;
    container_type entries_;
};

// =========================================================================
// Dijkstra's algorithm
// =========================================================================

/// Dijkstra's shortest path from a single source.
///
/// Template parameters:
/// - G: graph type satisfying matrix_queryable (matrix_graph of any kind;
///      unweighted kinds cost 1 per edge)
///
/// Preconditions (checked, std::out_of_range):
/// - source is a node of g
/// - target, when given, is a node of g
///
/// Example:
/// ```cpp
/// auto pm = dijkstra(g, a);                     // full search
/// auto near = dijkstra(g, a, path_cost{10});    // radius 10
/// auto to_c = dijkstra(g, a, std::nullopt, c);  // stop once c settles
/// ```
template<matrix_queryable G>
[[nodiscard]] predecessor_map
dijkstra(G const& g, node_index source,
         std::optional<path_cost> max_cost = std::nullopt,
         std::optional<node_index> target = std::nullopt)
{
    auto const V = g.node_count();
    require_node(source, V, "dijkstra: source not in graph");
    if (target) {
        require_node(*target, V, "dijkstra: target not in graph");
    }

    std::vector<path_cost> dist(V, unreachable_cost);
    std::vector<node_index> pred(V, invalid_node);
    dist[source] = 0;

    // =====================================================================
    // Index-based binary min-heap
    // =====================================================================
    //
    // heap[0..heap_size): node indices ordered by dist[].
    // pos[node]: index into heap[] where this node sits (NOT_IN_HEAP if
    // already settled).

    std::vector<node_index> heap(V);
    std::vector<node_index> pos(V);
    std::size_t heap_size = V;

    constexpr node_index NOT_IN_HEAP = invalid_node;

    for (std::size_t i = 0; i < V; ++i) {
        heap[i] = i;
        pos[i] = i;
    }

    auto heap_swap = [&](std::size_t a, std::size_t b) {
        auto const na = heap[a];
        auto const nb = heap[b];
        heap[a] = nb;
        heap[b] = na;
        pos[na] = b;
        pos[nb] = a;
    };

    auto sift_up = [&](std::size_t i) {
        while (i > 0) {
            std::size_t const parent = (i - 1) / 2;
            if (dist[heap[i]] < dist[heap[parent]]) {
                heap_swap(i, parent);
                i = parent;
            } else {
                break;
            }
        }
    };

    auto sift_down = [&](std::size_t i) {
        while (true) {
            std::size_t smallest = i;
            std::size_t const left = 2 * i + 1;
            std::size_t const right = 2 * i + 2;
            if (left < heap_size && dist[heap[left]] < dist[heap[smallest]]) {
                smallest = left;
            }
            if (right < heap_size && dist[heap[right]] < dist[heap[smallest]]) {
                smallest = right;
            }
            if (smallest == i) break;
            heap_swap(i, smallest);
            i = smallest;
        }
    };

    // Only the source has a finite cost, so one sift_up builds the heap.
    sift_up(pos[source]);

    while (heap_size > 0) {
        auto const u = heap[0];
        heap_swap(0, heap_size - 1);
        pos[u] = NOT_IN_HEAP;
        --heap_size;
        if (heap_size > 0) {
            sift_down(0);
        }

        auto const du = dist[u];
        if (du == unreachable_cost) {
            break;  // remaining nodes undiscovered
        }
        if (target && u == *target) {
            break;
        }

        auto const row = g.edges(u);
        for (std::size_t v = 0; v < row.size(); ++v) {
            auto const w = static_cast<path_cost>(row[v]);
            if (w == 0) continue;
            if (w > unreachable_cost - 1 - du) continue;  // would overflow

            auto const new_cost = du + w;
            if (max_cost && new_cost > *max_cost) continue;
            if (new_cost < dist[v]) {
                dist[v] = new_cost;
                pred[v] = u;
                if (pos[v] != NOT_IN_HEAP) {
                    sift_up(pos[v]);
                }
            }
        }
    }

    predecessor_map::container_type entries;
    for (std::size_t v = 0; v < V; ++v) {
        if (dist[v] == unreachable_cost) continue;
        std::optional<node_index> p;
        if (v != source) p = pred[v];
        entries.emplace(v, predecessor_map::entry{p, dist[v]});
    }
    return predecessor_map(source, std::move(entries));
}

/// Shortest path from `start` to `target`, start → target inclusive.
///
/// Runs dijkstra() with early exit at `target`.  Returns std::nullopt
/// when `target` is unreachable.
template<matrix_queryable G>
[[nodiscard]] std::optional<std::vector<node_index>>
path_to(G const& g, node_index start, node_index target) {
    auto const pm = dijkstra(g, start, std::nullopt, target);
    return pm.path_to(target);
}

/// Sum of edge weights along `path`.
///
/// Throws std::invalid_argument if two consecutive nodes are not joined
/// by an edge.
template<matrix_queryable G>
[[nodiscard]] path_cost path_weight(G const& g, std::vector<node_index> const& path) {
    path_cost total = 0;
    for (std::size_t i = 1; i < path.size(); ++i) {
        require_node(path[i], g.node_count(), "path_weight: node not in graph");
        auto const w = g.edges(path[i - 1])[path[i]];
        if (w == 0) {
            throw std::invalid_argument("path_weight: consecutive nodes not adjacent");
        }
        total += static_cast<path_cost>(w);
    }
    return total;
}

} // namespace graphkit

#endif // GRAPHKIT_SHORTEST_PATH_H
