// graphkit/graph_kind.h — Directedness / weightedness policy types
// Part of the graphkit graph-algorithms library (C++20)
//
// DESIGN RATIONALE:
// Graph templates take a SINGLE kind struct instead of two boolean
// template parameters.  The struct travels as one token through template
// arguments and aliases:
//
//   matrix_graph<std::string>                             g;   // undirected, unweighted
//   matrix_graph<int, kind::directed_weighted>            g2;
//   list_graph<std::string, directed>                     g3;
//
// The set of kinds is closed: four named combinations for the matrix
// form, two direction tags for the list form.  Graph classes enable the
// matching add_edge signature with requires-clauses, so the wrong
// insertion shape is a compile error, not a runtime branch.

#ifndef GRAPHKIT_GRAPH_KIND_H
#define GRAPHKIT_GRAPH_KIND_H

#include <concepts>
#include <type_traits>

namespace graphkit {

// =============================================================================
// Direction tags (list_graph)
// =============================================================================

/// One-way edges: add_edge(a, b) stores a→b only.
struct directed {
    static constexpr bool is_directed = true;
};

/// Two-way edges: add_edge(a, b) stores a→b and b→a.
struct undirected {
    static constexpr bool is_directed = false;
};

template<typename D>
concept direction_tag =
    std::same_as<D, directed> || std::same_as<D, undirected>;

// =============================================================================
// graph_kind_policy concept
// =============================================================================

/// A type satisfies graph_kind_policy if it states both directedness and
/// weightedness as compile-time booleans.
template<typename K>
concept graph_kind_policy = requires {
    { K::is_directed } -> std::convertible_to<bool>;
    { K::is_weighted } -> std::convertible_to<bool>;
};

// =============================================================================
// Named kinds (matrix_graph)
// =============================================================================

namespace kind {

/// One-way edges, explicit positive weights.
struct directed_weighted {
    static constexpr bool is_directed = true;
    static constexpr bool is_weighted = true;
};

/// One-way edges, every edge stored with weight 1.
struct directed_unweighted {
    static constexpr bool is_directed = true;
    static constexpr bool is_weighted = false;
};

/// Symmetric edges, explicit positive weights.
struct undirected_weighted {
    static constexpr bool is_directed = false;
    static constexpr bool is_weighted = true;
};

/// Symmetric edges, every edge stored with weight 1.
struct undirected_unweighted {
    static constexpr bool is_directed = false;
    static constexpr bool is_weighted = false;
};

} // namespace kind

static_assert(graph_kind_policy<kind::directed_weighted>);
static_assert(graph_kind_policy<kind::directed_unweighted>);
static_assert(graph_kind_policy<kind::undirected_weighted>);
static_assert(graph_kind_policy<kind::undirected_unweighted>);

// =============================================================================
// kind_from<Directed, Weighted>: kind from raw booleans
// =============================================================================

template<bool Directed, bool Weighted>
using kind_from = std::conditional_t<
    Directed,
    std::conditional_t<Weighted, kind::directed_weighted, kind::directed_unweighted>,
    std::conditional_t<Weighted, kind::undirected_weighted, kind::undirected_unweighted>>;

} // namespace graphkit

#endif // GRAPHKIT_GRAPH_KIND_H
