// graphkit/list_graph.h — Adjacency-list graph
// Part of the graphkit graph-algorithms library (C++20)
//
// DESIGN RATIONALE:
// Each node owns its payload and a growing vector of outgoing edge
// records (weight, target).  Node insertion is O(1) amortised, edge
// insertion is O(1) amortised, and neighbour iteration is O(out-degree),
// which favours sparse graphs.
//
// Direction is a type-level tag (directed / undirected).  For undirected
// graphs add_edge(a, b, w) appends both a→b and b→a in one call, so edge
// records are always symmetric.
//
// Re-adding an existing edge APPENDS a duplicate record.  No
// canonicalisation (sort / dedup) is performed: edges() reports records in
// exactly the order they were inserted, and traversals follow that order.

#ifndef GRAPHKIT_LIST_GRAPH_H
#define GRAPHKIT_LIST_GRAPH_H

#include "graph_concepts.h"
#include "graph_kind.h"
#include "index_guard.h"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace graphkit {

// =============================================================================
// Edge and node records
// =============================================================================

/// One outgoing edge: its weight and destination node.
template<typename W>
struct list_edge {
    W weight{};
    node_index target = invalid_node;

    friend bool operator==(list_edge const&, list_edge const&) = default;
};

/// A node's payload plus its outgoing edges in insertion order.
template<typename V, typename W>
struct list_node {
    V value;
    std::vector<list_edge<W>> edges;
};

// =============================================================================
// list_graph<V, Dir, W>
// =============================================================================

/// Append-only adjacency-list graph.
///
/// Template parameters:
/// - V:   node payload type (any movable type)
/// - Dir: `directed` or `undirected` (default)
/// - W:   edge weight type (any copyable type, default std::uint32_t)
///
/// Example:
/// ```cpp
/// list_graph<std::string, directed> g;
/// auto a = g.add_node("a");
/// auto b = g.add_node("b");
/// g.add_edge(a, b, 3u);
/// for (auto v : g.out_neighbors(a)) { ... }   // b
/// ```
template<typename V, direction_tag Dir = undirected, std::copyable W = std::uint32_t>
class list_graph {
public:
    using value_type = V;
    using weight_type = W;
    using direction = Dir;
    using edge_type = list_edge<W>;
    using node_type = list_node<V, W>;

    static constexpr bool is_directed = Dir::is_directed;

    list_graph() = default;

    // =========================================================================
    // Construction
    // =========================================================================

    /// Append a node and return its index (== previous node_count()).
    node_index add_node(V value) {
        nodes_.push_back(node_type{std::move(value), {}});
        return nodes_.size() - 1;
    }

    /// Append an edge record from `from` to `to`.  Undirected graphs also
    /// append the reciprocal record.
    void add_edge(node_index from, node_index to, W weight) {
        require_edge_endpoints(from, to, nodes_.size(),
            "list_graph::add_edge: source not in graph",
            "list_graph::add_edge: target not in graph");
        nodes_[from].edges.push_back(edge_type{weight, to});
        if constexpr (!is_directed) {
            nodes_[to].edges.push_back(edge_type{weight, from});
        }
    }

    /// Append an edge of weight 1 (arithmetic weight types only).
    void add_edge(node_index from, node_index to)
        requires std::is_arithmetic_v<W>
    {
        add_edge(from, to, W{1});
    }

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    /// Number of stored edge records (an undirected edge counts twice).
    [[nodiscard]] std::size_t edge_count() const noexcept {
        std::size_t total = 0;
        for (auto const& n : nodes_) total += n.edges.size();
        return total;
    }

    [[nodiscard]] bool has_node(node_index u) const noexcept {
        return u < nodes_.size();
    }

    // =========================================================================
    // Node access
    // =========================================================================

    [[nodiscard]] V const& node_value(node_index u) const {
        require_node(u, nodes_.size(), "list_graph::node_value: node not in graph");
        return nodes_[u].value;
    }

    [[nodiscard]] V& node_value(node_index u) {
        require_node(u, nodes_.size(), "list_graph::node_value: node not in graph");
        return nodes_[u].value;
    }

    [[nodiscard]] std::span<node_type const> nodes() const noexcept {
        return {nodes_.data(), nodes_.size()};
    }

    [[nodiscard]] node_type const& operator[](node_index u) const {
        require_node(u, nodes_.size(), "list_graph::operator[]: node not in graph");
        return nodes_[u];
    }

    // =========================================================================
    // Adjacency access
    // =========================================================================

    /// Outgoing edge records of `u` in insertion order.
    [[nodiscard]] std::span<edge_type const> edges(node_index u) const {
        require_node(u, nodes_.size(), "list_graph::edges: node not in graph");
        auto const& e = nodes_[u].edges;
        return {e.data(), e.size()};
    }

    /// Projects an edge record pointer onto its destination index.
    class neighbor_iterator {
    public:
        using value_type = node_index;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::forward_iterator_tag;

        neighbor_iterator() = default;
        explicit neighbor_iterator(edge_type const* p) noexcept : p_(p) {}

        [[nodiscard]] node_index operator*() const noexcept { return p_->target; }

        neighbor_iterator& operator++() noexcept {
            ++p_;
            return *this;
        }
        neighbor_iterator operator++(int) noexcept {
            auto tmp = *this;
            ++p_;
            return tmp;
        }

        friend bool operator==(neighbor_iterator const&,
                               neighbor_iterator const&) = default;

    private:
        edge_type const* p_ = nullptr;
    };

    struct adjacency_range {
        neighbor_iterator begin_;
        neighbor_iterator end_;
        std::size_t size_ = 0;

        [[nodiscard]] neighbor_iterator begin() const noexcept { return begin_; }
        [[nodiscard]] neighbor_iterator end() const noexcept { return end_; }
        [[nodiscard]] std::size_t size() const noexcept { return size_; }
        [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    };

    /// Destinations of `u` in edge-insertion order (duplicates included).
    [[nodiscard]] adjacency_range out_neighbors(node_index u) const {
        auto const e = edges(u);
        return {neighbor_iterator{e.data()},
                neighbor_iterator{e.data() + e.size()},
                e.size()};
    }

    [[nodiscard]] adjacency_range neighbors(node_index u) const {
        return out_neighbors(u);
    }

    [[nodiscard]] std::size_t out_degree(node_index u) const {
        return edges(u).size();
    }

    /// O(out-degree) scan of u's edge records.
    [[nodiscard]] bool has_edge(node_index u, node_index v) const {
        require_node(v, nodes_.size(), "list_graph::has_edge: target not in graph");
        auto const e = edges(u);
        return std::any_of(e.begin(), e.end(),
                           [v](edge_type const& x) { return x.target == v; });
    }

private:
    std::vector<node_type> nodes_;
};

// Verify concept satisfaction.
static_assert(graph_queryable<list_graph<int, directed>>);
static_assert(graph_queryable<list_graph<int, undirected, double>>);
static_assert(std::forward_iterator<list_graph<int>::neighbor_iterator>);

} // namespace graphkit

#endif // GRAPHKIT_LIST_GRAPH_H
