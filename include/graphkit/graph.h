// graphkit/graph.h — Umbrella header for the graphkit library
// Part of the graphkit graph-algorithms library (C++20)
//
// Single-include convenience header.  Pulls in all components:
// representations, algorithms, transforms and I/O.
//
// Usage:
//   #include <graphkit/graph.h>
//
// For compilation-time-sensitive translation units, prefer including
// individual headers.

#ifndef GRAPHKIT_GRAPH_H
#define GRAPHKIT_GRAPH_H

// --- Core types & concepts ---
#include "graph_concepts.h"
#include "graph_kind.h"
#include "index_guard.h"

// --- Representation ---
#include "list_graph.h"
#include "matrix_graph.h"

// --- Algorithms ---
#include "traversal.h"
#include "shortest_path.h"
#include "scc.h"
#include "topological_sort.h"
#include "transitive_closure.h"

// --- Transforms ---
#include "transpose.h"
#include "condense.h"

// --- I/O ---
#include "graph_io.h"

#endif // GRAPHKIT_GRAPH_H
