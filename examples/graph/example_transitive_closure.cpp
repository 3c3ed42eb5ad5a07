// examples/graph/example_transitive_closure.cpp — Reachability
//
// Which services can a failure propagate to?  Build a call graph, compute
// its transitive closure by both algorithms, and print the matrix.
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_transitive_closure examples/graph/example_transitive_closure.cpp

#include <graphkit/graph_io.h>
#include <graphkit/matrix_graph.h>
#include <graphkit/transitive_closure.h>
#include <iostream>
#include <string>

using namespace graphkit;

int main() {
    matrix_graph<std::string, kind::directed_unweighted> calls;
    auto gateway = calls.add_node("gateway");
    auto auth    = calls.add_node("auth");
    auto session = calls.add_node("session");
    auto billing = calls.add_node("billing");

    calls.add_edge(gateway, auth);
    calls.add_edge(gateway, session);
    calls.add_edge(auth, session);
    calls.add_edge(session, gateway);   // retry loop
    calls.add_edge(session, billing);

    std::cout << "=== Call graph ===\n";
    io::write(std::cout, calls);

    auto const by_traversal = closure_by_traversal(calls);
    auto const by_condensation = closure_by_condensation(calls);

    std::cout << "\n=== Reachability (reflexive) ===\n" << by_condensation;
    std::cout << "Algorithms agree: " << (by_traversal == by_condensation ? "yes" : "NO") << "\n";

    auto const strict = transitive_closure(calls, closure_kind::strict);
    std::cout << "\n=== Reachability (strict) ===\n" << strict;

    std::cout << "\nServices on a call cycle:";
    for (node_index i = 0; i < calls.node_count(); ++i) {
        if (strict.test(i, i)) std::cout << " " << calls.node_value(i);
    }
    std::cout << "\n";
    return 0;
}
