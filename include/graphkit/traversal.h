// graphkit/traversal.h — Lazy breadth-first and depth-first traversal
// Part of the graphkit graph-algorithms library (C++20)
//
// ALGORITHM:
// - bfs: FIFO frontier.  A node is marked visited when it is enqueued,
//   so it is never enqueued twice.  Nodes are yielded in non-decreasing
//   distance from the start, ties broken by neighbour order.
// - dfs: explicit stack of (node, next-neighbour) frames.  Yields the
//   pre-order of the equivalent recursive walk, ties broken by neighbour
//   order.  Stack depth is bounded by V; there is no native recursion.
//
// Neighbour order is the graph's out_neighbors() order: insertion order
// for list_graph, ascending index for matrix_graph.
//
// Complexity: O(V + E) for list_graph, O(V^2) for matrix_graph.
//
// Both views are lazy and single-pass.  Work happens inside next();
// begin() pulls the first node.  Every call to bfs()/dfs() starts a fresh
// traversal.  Consuming the whole view from S yields exactly the set of
// nodes reachable from S (S included), each once.
//
// The view stores a pointer to the graph.  The graph must outlive the
// view and must not be mutated while the view is in use.

#ifndef GRAPHKIT_TRAVERSAL_H
#define GRAPHKIT_TRAVERSAL_H

#include "graph_concepts.h"
#include "index_guard.h"

#include <cstddef>
#include <iterator>
#include <optional>
#include <queue>
#include <ranges>
#include <utility>
#include <vector>

namespace graphkit {

namespace detail {

/// Input iterator over any view exposing next() -> optional<node_index>.
template<typename View>
class traversal_iterator {
public:
    using value_type = node_index;
    using difference_type = std::ptrdiff_t;
    using iterator_concept = std::input_iterator_tag;

    traversal_iterator() = default;
    explicit traversal_iterator(View* view)
        : view_(view), current_(view->next()) {}

    [[nodiscard]] node_index operator*() const { return *current_; }

    traversal_iterator& operator++() {
        current_ = view_->next();
        return *this;
    }
    void operator++(int) { ++*this; }

    friend bool operator==(traversal_iterator const& it,
                           std::default_sentinel_t) noexcept {
        return !it.current_.has_value();
    }

private:
    View* view_ = nullptr;
    std::optional<node_index> current_;
};

} // namespace detail

// =============================================================================
// bfs_view
// =============================================================================

template<graph_queryable G>
class bfs_view {
public:
    using iterator = detail::traversal_iterator<bfs_view>;

    bfs_view(G const& g, node_index start)
        : g_(&g), visited_(g.node_count(), false) {
        require_node(start, g.node_count(), "bfs: start not in graph");
        visited_[start] = true;
        frontier_.push(start);
    }

    /// Dequeue the next node, enqueue its unvisited neighbours, return it.
    [[nodiscard]] std::optional<node_index> next() {
        if (frontier_.empty()) {
            return std::nullopt;
        }
        auto const u = frontier_.front();
        frontier_.pop();
        for (auto v : g_->out_neighbors(u)) {
            if (!visited_[v]) {
                visited_[v] = true;
                frontier_.push(v);
            }
        }
        return u;
    }

    [[nodiscard]] iterator begin() { return iterator{this}; }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    /// True once `v` has been discovered (enqueued) by this traversal.
    [[nodiscard]] bool discovered(node_index v) const {
        require_node(v, visited_.size(), "bfs: node not in graph");
        return visited_[v];
    }

private:
    G const* g_;
    std::queue<node_index> frontier_;
    std::vector<bool> visited_;
};

// =============================================================================
// dfs_view
// =============================================================================

template<graph_queryable G>
class dfs_view {
    using range_type = decltype(std::declval<G const&>().out_neighbors(node_index{}));
    using neighbor_iter = std::ranges::iterator_t<range_type const>;
    using neighbor_sent = std::ranges::sentinel_t<range_type const>;

    // One frame of the simulated recursion: the node and the resume point
    // in its neighbour range.
    struct frame {
        node_index node;
        neighbor_iter next;
        neighbor_sent end;
    };

public:
    using iterator = detail::traversal_iterator<dfs_view>;

    dfs_view(G const& g, node_index start)
        : g_(&g), visited_(g.node_count(), false) {
        require_node(start, g.node_count(), "dfs: start not in graph");
        pending_ = start;
    }

    /// Advance the simulated recursion to the next newly visited node.
    [[nodiscard]] std::optional<node_index> next() {
        if (pending_) {
            auto const s = *pending_;
            pending_.reset();
            enter(s);
            return s;
        }

        while (!stack_.empty()) {
            auto& top = stack_.back();
            if (top.next == top.end) {
                stack_.pop_back();  // "return" from this frame
                continue;
            }
            auto const w = static_cast<node_index>(*top.next);
            ++top.next;
            if (!visited_[w]) {
                enter(w);  // "recurse" into w
                return w;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] iterator begin() { return iterator{this}; }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    [[nodiscard]] bool discovered(node_index v) const {
        require_node(v, visited_.size(), "dfs: node not in graph");
        return visited_[v];
    }

private:
    void enter(node_index u) {
        visited_[u] = true;
        auto const range = g_->out_neighbors(u);
        stack_.push_back(frame{u, std::ranges::begin(range), std::ranges::end(range)});
    }

    G const* g_;
    std::optional<node_index> pending_;
    std::vector<frame> stack_;
    std::vector<bool> visited_;
};

// =============================================================================
// Entry points
// =============================================================================

/// Breadth-first traversal of `g` from `start`.
///
/// Example:
/// ```cpp
/// for (auto v : bfs(g, a)) { ... }
/// ```
template<graph_queryable G>
[[nodiscard]] bfs_view<G> bfs(G const& g, node_index start) {
    return bfs_view<G>(g, start);
}

/// Depth-first (pre-order) traversal of `g` from `start`.
template<graph_queryable G>
[[nodiscard]] dfs_view<G> dfs(G const& g, node_index start) {
    return dfs_view<G>(g, start);
}

/// Drain a traversal view into a vector, in visitation order.
template<typename View>
[[nodiscard]] std::vector<node_index> visit_order(View&& view) {
    std::vector<node_index> order;
    while (auto v = view.next()) {
        order.push_back(*v);
    }
    return order;
}

} // namespace graphkit

#endif // GRAPHKIT_TRAVERSAL_H
