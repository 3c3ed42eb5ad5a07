// graphkit/matrix_graph.h — Adjacency-matrix graph with value lookup
// Part of the graphkit graph-algorithms library (C++20)
//
// DESIGN RATIONALE:
// A single flat row-major array of non-negative integer weights,
// logically N×N, where 0 means "no edge".  Edge tests and weight lookups
// are O(1); a node's full row is a contiguous span, which favours dense
// graphs and row-scanning algorithms.
//
// Rows are laid out with a stride equal to the node capacity.  Adding a
// node inside the capacity touches nothing (the new row and column are
// already zero); adding past it doubles the stride and re-lays the
// existing N×N block.  Total growth cost across N insertions is O(N^2),
// i.e. O(N) amortised per node, against list_graph's O(1).
//
// Invariant: every cell outside [0, N) × [0, N) is zero.
//
// Direction and weightedness come from a kind policy (graph_kind.h).
// Weighted kinds expose add_edge(x, y, w) and edge_weight(x, y);
// unweighted kinds expose add_edge(x, y) and always store 1.
//
// ZERO WEIGHTS:
// 0 is the "absent" encoding, so an edge of weight 0 is not
// representable.  Weighted add_edge rejects w == 0 rather than silently
// erasing the cell.
//
// A value→index map supports index_of(value).  Adding a duplicate value
// re-points the map at the new node; the earlier node keeps its row.

#ifndef GRAPHKIT_MATRIX_GRAPH_H
#define GRAPHKIT_MATRIX_GRAPH_H

#include "graph_concepts.h"
#include "graph_kind.h"
#include "index_guard.h"

#include <cstddef>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace graphkit {

// =============================================================================
// matrix_graph<T, Kind>
// =============================================================================

/// Append-only adjacency-matrix graph.
///
/// Template parameters:
/// - T:    node value type (hashable, equality comparable, copyable)
/// - Kind: one of kind::{directed,undirected}_{weighted,unweighted}
///         (default: kind::undirected_unweighted)
///
/// Example:
/// ```cpp
/// matrix_graph<std::string, kind::directed_weighted> g;
/// auto a = g.add_node("a");
/// auto b = g.add_node("b");
/// g.add_edge(a, b, 7);
/// g.edge_weight(a, b);        // 7
/// g.index_of("b");            // std::optional{1}
/// ```
template<hashable_value T, graph_kind_policy Kind = kind::undirected_unweighted>
class matrix_graph {
public:
    using value_type = T;
    using kind_type = Kind;
    using weight_type = matrix_weight;

    static constexpr bool is_directed = Kind::is_directed;
    static constexpr bool is_weighted = Kind::is_weighted;

    matrix_graph() = default;

    // =========================================================================
    // Construction
    // =========================================================================

    /// Append a node and return its index (== previous node_count()).
    ///
    /// Cells of previously added nodes are unchanged; the new row and
    /// column read as 0.
    node_index add_node(T value) {
        if (n_ == stride_) {
            relayout(stride_ == 0 ? 1 : 2 * stride_);
        }
        auto const idx = n_;
        values_.push_back(std::move(value));
        index_.insert_or_assign(values_.back(), idx);
        ++n_;
        return idx;
    }

    /// Pre-size storage for `capacity` nodes.  Never shrinks.
    void reserve(std::size_t capacity) {
        if (capacity > stride_) {
            relayout(capacity);
        }
        values_.reserve(capacity);
    }

    /// Store an edge of weight 1 (unweighted kinds).
    void add_edge(node_index x, node_index y)
        requires (!Kind::is_weighted)
    {
        set_weight(x, y, 1);
    }

    /// Store an edge of weight `w` (weighted kinds).  Overwrites any
    /// previous weight.  Throws std::invalid_argument if w == 0.
    void add_edge(node_index x, node_index y, weight_type w)
        requires Kind::is_weighted
    {
        if (w == 0) {
            throw std::invalid_argument(
                "matrix_graph::add_edge: weight 0 encodes 'no edge'");
        }
        set_weight(x, y, w);
    }

    /// Reverse every edge in place: swaps cell (x, y) with (y, x).
    /// O(N^2).  No-op for undirected kinds, whose matrix is symmetric.
    void transpose() noexcept {
        if constexpr (is_directed) {
            for (std::size_t y = 0; y < n_; ++y) {
                for (std::size_t x = y + 1; x < n_; ++x) {
                    std::swap(cells_[x * stride_ + y], cells_[y * stride_ + x]);
                }
            }
        }
    }

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return n_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return stride_; }
    [[nodiscard]] bool empty() const noexcept { return n_ == 0; }

    [[nodiscard]] bool has_node(node_index u) const noexcept { return u < n_; }

    /// Number of non-zero cells (an undirected edge between distinct
    /// nodes counts twice).
    [[nodiscard]] std::size_t edge_count() const noexcept {
        std::size_t count = 0;
        for (std::size_t r = 0; r < n_; ++r) {
            for (std::size_t c = 0; c < n_; ++c) {
                if (cells_[r * stride_ + c] > 0) ++count;
            }
        }
        return count;
    }

    // =========================================================================
    // Node values
    // =========================================================================

    [[nodiscard]] T const& node_value(node_index u) const {
        require_node(u, n_, "matrix_graph::node_value: node not in graph");
        return values_[u];
    }

    [[nodiscard]] std::span<T const> values() const noexcept {
        return {values_.data(), values_.size()};
    }

    /// Index most recently issued for `value`, if any.
    [[nodiscard]] std::optional<node_index> index_of(T const& value) const {
        auto const it = index_.find(value);
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }

    // =========================================================================
    // Edge access
    // =========================================================================

    /// The N weights of row `u` (0 = no edge to that column).
    [[nodiscard]] std::span<weight_type const> edges(node_index u) const {
        require_node(u, n_, "matrix_graph::edges: node not in graph");
        return {cells_.data() + u * stride_, n_};
    }

    [[nodiscard]] bool has_edge(node_index u, node_index v) const {
        require_edge_endpoints(u, v, n_,
            "matrix_graph::has_edge: source not in graph",
            "matrix_graph::has_edge: target not in graph");
        return cells_[u * stride_ + v] > 0;
    }

    /// Stored weight of u→v, 0 if absent.
    [[nodiscard]] weight_type edge_weight(node_index u, node_index v) const
        requires Kind::is_weighted
    {
        require_edge_endpoints(u, v, n_,
            "matrix_graph::edge_weight: source not in graph",
            "matrix_graph::edge_weight: target not in graph");
        return cells_[u * stride_ + v];
    }

    /// Yields the column indices of positive cells in a row, ascending.
    class neighbor_iterator {
    public:
        using value_type = node_index;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::forward_iterator_tag;

        neighbor_iterator() = default;
        neighbor_iterator(weight_type const* row, std::size_t n,
                          std::size_t col) noexcept
            : row_(row), n_(n), col_(col) {
            skip_absent();
        }

        [[nodiscard]] node_index operator*() const noexcept { return col_; }

        neighbor_iterator& operator++() noexcept {
            ++col_;
            skip_absent();
            return *this;
        }
        neighbor_iterator operator++(int) noexcept {
            auto tmp = *this;
            ++*this;
            return tmp;
        }

        friend bool operator==(neighbor_iterator const& a,
                               neighbor_iterator const& b) noexcept {
            return a.row_ == b.row_ && a.col_ == b.col_;
        }

    private:
        void skip_absent() noexcept {
            while (col_ < n_ && row_[col_] == 0) ++col_;
        }

        weight_type const* row_ = nullptr;
        std::size_t n_ = 0;
        std::size_t col_ = 0;
    };

    struct adjacency_range {
        weight_type const* row_ = nullptr;
        std::size_t n_ = 0;

        [[nodiscard]] neighbor_iterator begin() const noexcept { return {row_, n_, 0}; }
        [[nodiscard]] neighbor_iterator end() const noexcept { return {row_, n_, n_}; }
    };

    /// Destinations of `u` in ascending index order.
    [[nodiscard]] adjacency_range out_neighbors(node_index u) const {
        auto const row = edges(u);
        return {row.data(), row.size()};
    }

    [[nodiscard]] adjacency_range neighbors(node_index u) const {
        return out_neighbors(u);
    }

    friend bool operator==(matrix_graph const& a, matrix_graph const& b) {
        if (a.n_ != b.n_ || a.values_ != b.values_) return false;
        for (std::size_t r = 0; r < a.n_; ++r) {
            for (std::size_t c = 0; c < a.n_; ++c) {
                if (a.cells_[r * a.stride_ + c] != b.cells_[r * b.stride_ + c]) {
                    return false;
                }
            }
        }
        return true;
    }

private:
    void set_weight(node_index x, node_index y, weight_type w) {
        require_edge_endpoints(x, y, n_,
            "matrix_graph::add_edge: source not in graph",
            "matrix_graph::add_edge: target not in graph");
        cells_[x * stride_ + y] = w;
        if constexpr (!is_directed) {
            cells_[y * stride_ + x] = w;
        }
    }

    // Copy the live N×N block into a zeroed array of the new stride.
    void relayout(std::size_t new_stride) {
        std::vector<weight_type> next(new_stride * new_stride, 0);
        for (std::size_t r = 0; r < n_; ++r) {
            for (std::size_t c = 0; c < n_; ++c) {
                next[r * new_stride + c] = cells_[r * stride_ + c];
            }
        }
        cells_ = std::move(next);
        stride_ = new_stride;
    }

    std::size_t n_ = 0;
    std::size_t stride_ = 0;
    std::vector<weight_type> cells_;
    std::vector<T> values_;
    std::unordered_map<T, node_index> index_;
};

// Verify concept satisfaction.
static_assert(graph_queryable<matrix_graph<int>>);
static_assert(matrix_queryable<matrix_graph<int, kind::directed_weighted>>);
static_assert(std::forward_iterator<matrix_graph<int>::neighbor_iterator>);

} // namespace graphkit

#endif // GRAPHKIT_MATRIX_GRAPH_H
