// graphkit/transitive_closure.h — Reachability matrices
// Part of the graphkit graph-algorithms library (C++20)
//
// Two interchangeable algorithms with one output contract: an N×N
// boolean matrix where cell (i, j) is true iff j is reachable from i.
//
// closure_by_traversal
//   BFS from every node.  Works on any graph_queryable.
//   Complexity: O(V * (V + E)) list_graph, O(V^3) matrix_graph.
//
// closure_by_condensation (Purdom)
//   1. Tarjan SCC labels.
//   2. Condensed DAG: one node per component, intra-component edges
//      dropped.
//   3. Topological sort of the condensed DAG.
//   4. Walk the order from last to first.  Each component's set becomes
//      the union, over its direct successors s, of {s} ∪ reach(s); every
//      successor has already been finalised.
//   5. Expand: every original node takes its component's row.  Within a
//      cyclic component all pairs are reachable.
//   Complexity: O(E + μV) set operations, μ = number of components; the
//   per-component sets are packed 64 to a word.
//
// THE DIAGONAL:
//   closure_kind::reflexive  (i, i) is always true (every node reaches
//                            itself by the empty path).
//   closure_kind::strict     (i, i) is true only if a path of length >= 1
//                            returns to i (i lies on a cycle or has a
//                            self-edge).
//   Off-diagonal cells are identical for both kinds.

#ifndef GRAPHKIT_TRANSITIVE_CLOSURE_H
#define GRAPHKIT_TRANSITIVE_CLOSURE_H

#include "condense.h"
#include "graph_concepts.h"
#include "index_guard.h"
#include "topological_sort.h"
#include "traversal.h"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace graphkit {

enum class closure_kind {
    reflexive,
    strict,
};

// =============================================================================
// reachability_matrix
// =============================================================================

/// Square boolean matrix, indexable as m[i][j].  Both indices are
/// checked; either out of range throws std::out_of_range.
class reachability_matrix {
public:
    using row_type = std::vector<bool>;

    /// Read-only view of one row.  Valid while the matrix is alive and
    /// unmodified.
    class row_view {
    public:
        using value_type = bool;
        using const_iterator = row_type::const_iterator;
        using iterator = const_iterator;

        [[nodiscard]] bool operator[](std::size_t j) const {
            require_node(j, row_->size(), "reachability_matrix: column out of range");
            return (*row_)[j];
        }

        [[nodiscard]] std::size_t size() const noexcept { return row_->size(); }
        [[nodiscard]] const_iterator begin() const noexcept { return row_->begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return row_->end(); }

        friend bool operator==(row_view a, row_view b) { return *a.row_ == *b.row_; }
        friend bool operator==(row_view a, row_type const& b) { return *a.row_ == b; }

    private:
        friend class reachability_matrix;
        explicit row_view(row_type const& r) noexcept : row_(&r) {}

        row_type const* row_;
    };

    reachability_matrix() = default;

    /// n×n, all false.
    explicit reachability_matrix(std::size_t n)
        : rows_(n, row_type(n, false)) {}

    /// From explicit rows.  Throws std::invalid_argument unless square.
    explicit reachability_matrix(std::vector<row_type> rows)
        : rows_(std::move(rows)) {
        for (auto const& r : rows_) {
            if (r.size() != rows_.size()) {
                throw std::invalid_argument("reachability_matrix: rows must form a square");
            }
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }

    [[nodiscard]] row_view operator[](std::size_t i) const {
        require_node(i, rows_.size(), "reachability_matrix: row out of range");
        return row_view{rows_[i]};
    }

    [[nodiscard]] bool test(std::size_t i, std::size_t j) const {
        return (*this)[i][j];
    }

    void set(std::size_t i, std::size_t j, bool value = true) {
        require_node(i, rows_.size(), "reachability_matrix: row out of range");
        require_node(j, rows_.size(), "reachability_matrix: column out of range");
        rows_[i][j] = value;
    }

    /// Replace row `i`.  Throws std::invalid_argument on a length mismatch.
    void set_row(std::size_t i, row_type row) {
        require_node(i, rows_.size(), "reachability_matrix: row out of range");
        if (row.size() != rows_.size()) {
            throw std::invalid_argument("reachability_matrix: row length mismatch");
        }
        rows_[i] = std::move(row);
    }

    /// Number of true cells.
    [[nodiscard]] std::size_t count() const noexcept {
        std::size_t total = 0;
        for (auto const& r : rows_) {
            for (bool b : r) total += b ? 1 : 0;
        }
        return total;
    }

    friend bool operator==(reachability_matrix const&,
                           reachability_matrix const&) = default;

private:
    std::vector<row_type> rows_;
};

// =============================================================================
// Repeated traversal
// =============================================================================

/// Transitive closure by one breadth-first traversal per node.
template<graph_queryable G>
[[nodiscard]] reachability_matrix
closure_by_traversal(G const& g, closure_kind kind = closure_kind::reflexive) {
    auto const V = g.node_count();
    reachability_matrix m(V);

    for (node_index i = 0; i < V; ++i) {
        auto view = bfs(g, i);
        while (auto v = view.next()) {
            if (*v != i) {
                m.set(i, *v);
            }
            if (kind == closure_kind::strict) {
                // i reaches itself iff some reachable node has an edge back.
                for (auto w : g.out_neighbors(*v)) {
                    if (w == i) {
                        m.set(i, i);
                        break;
                    }
                }
            }
        }
        if (kind == closure_kind::reflexive) {
            m.set(i, i);
        }
    }

    return m;
}

// =============================================================================
// SCC condensation (Purdom)
// =============================================================================

namespace detail {

/// Fixed-size bit set over component indices.
class component_set {
public:
    explicit component_set(std::size_t bits)
        : words_((bits + 63) / 64, 0) {}

    void insert(std::size_t c) noexcept {
        words_[c / 64] |= std::uint64_t{1} << (c % 64);
    }

    [[nodiscard]] bool contains(std::size_t c) const noexcept {
        return (words_[c / 64] >> (c % 64)) & 1u;
    }

    void merge(component_set const& other) noexcept {
        for (std::size_t w = 0; w < words_.size(); ++w) {
            words_[w] |= other.words_[w];
        }
    }

private:
    std::vector<std::uint64_t> words_;
};

} // namespace detail

/// Transitive closure via SCC condensation and reverse topological
/// propagation (Purdom's algorithm).
///
/// Produces exactly the same matrix as closure_by_traversal for the
/// same `kind`.
template<graph_queryable G>
[[nodiscard]] reachability_matrix
closure_by_condensation(G const& g, closure_kind kind = closure_kind::reflexive) {
    auto const V = g.node_count();

    // 1-2. Components and their acyclic condensation.
    auto const cond = condense(g);
    auto const mu = cond.component_count();

    // 3. Topological order of the condensation.
    auto const topo = topological_sort(cond.graph);
    if (!topo.is_dag) {
        throw std::logic_error("closure_by_condensation: condensation is cyclic");
    }

    // 4. Propagate from the last component in topological order to the
    //    first; successors are always complete before their predecessors.
    std::vector<detail::component_set> reach(mu, detail::component_set(mu));
    for (auto it = topo.order.rbegin(); it != topo.order.rend(); ++it) {
        auto const c = *it;
        for (auto s : cond.graph.out_neighbors(c)) {
            reach[c].insert(s);
            reach[c].merge(reach[s]);
        }
    }

    // 5. Expand each component's set to a row over original nodes and
    //    hand it to every member.
    reachability_matrix m(V);
    for (std::size_t c = 0; c < mu; ++c) {
        reachability_matrix::row_type row(V, false);
        for (node_index j = 0; j < V; ++j) {
            auto const cj = cond.component_of[j];
            row[j] = reach[c].contains(cj) || (cj == c && cond.cyclic[c]);
        }
        for (auto i : cond.members[c]) {
            auto member_row = row;
            if (kind == closure_kind::reflexive) {
                member_row[i] = true;
            }
            m.set_row(i, std::move(member_row));
        }
    }

    return m;
}

/// Transitive closure of `g` (condensation method).
template<graph_queryable G>
[[nodiscard]] reachability_matrix
transitive_closure(G const& g, closure_kind kind = closure_kind::reflexive) {
    return closure_by_condensation(g, kind);
}

} // namespace graphkit

#endif // GRAPHKIT_TRANSITIVE_CLOSURE_H
