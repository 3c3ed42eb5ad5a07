// examples/graph/example_components_scc.cpp — SCC & condensation
//
// Analyse a software module dependency graph:
// - SCC finds circular dependencies that prevent incremental builds
// - Condensation collapses each cycle into one build unit
// - A topological sort of the condensation gives a valid build order
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_components_scc examples/graph/example_components_scc.cpp

#include <graphkit/condense.h>
#include <graphkit/list_graph.h>
#include <graphkit/scc.h>
#include <graphkit/topological_sort.h>
#include <iostream>
#include <string>

using namespace graphkit;

// =========================================================================
// Module dependency graph
// =========================================================================
//
// Subsystem A (UI): modules 0,1,2 form a cycle (0→1→2→0)
// Subsystem B (Backend): modules 3,4 form a cycle (3→4→3)
// Subsystem C (Utils): modules 5,6 are acyclic (5→6)
//
// Cross-subsystem edges: A→B (module 1→3), B→C (module 4→5)

list_graph<std::string, directed> make_module_graph() {
    list_graph<std::string, directed> g;
    for (auto const* name : {"ui_view", "ui_controller", "ui_model",
                             "api_server", "api_handler",
                             "utils_core", "utils_log"}) {
        (void)g.add_node(name);
    }

    g.add_edge(0, 1);
    g.add_edge(1, 2);
    g.add_edge(2, 0);   // cycle!

    g.add_edge(3, 4);
    g.add_edge(4, 3);   // cycle!

    g.add_edge(5, 6);

    g.add_edge(1, 3);   // UI → Backend
    g.add_edge(4, 5);   // Backend → Utils
    return g;
}

int main() {
    auto const modules = make_module_graph();

    std::cout << "=== Module Dependency Analysis ===\n\n";

    std::cout << "Dependencies:\n";
    for (node_index u = 0; u < modules.node_count(); ++u) {
        for (auto v : modules.out_neighbors(u))
            std::cout << "  " << modules.node_value(u) << " → "
                      << modules.node_value(v) << "\n";
    }

    auto const comps = scc(modules);
    std::cout << "\nStrongly connected components: " << comps.component_count << "\n";

    auto const cond = condense(modules, comps);
    for (std::size_t c = 0; c < cond.component_count(); ++c) {
        std::cout << "  SCC " << c << ": {";
        bool first = true;
        for (auto m : cond.members[c]) {
            if (!first) std::cout << ", ";
            std::cout << modules.node_value(m);
            first = false;
        }
        std::cout << "}";
        if (cond.cyclic[c])
            std::cout << "  ← CIRCULAR DEPENDENCY (" << cond.members[c].size() << " modules)";
        std::cout << "\n";
    }

    auto const order = topological_sort(cond.graph);
    std::cout << "\nBuild order of condensed units:";
    for (auto c : order.order) std::cout << " " << c;
    std::cout << (order.is_dag ? "" : "  (cycle!)") << "\n";
    return 0;
}
