// examples/graph/example_shortest_path.cpp — Dijkstra: Network Routing
//
// Find the cheapest route through a data-centre network.  Edge weights
// represent latency in microseconds.  Dijkstra finds the minimum-latency
// path from the web server to every other node, then the same search is
// repeated with a latency budget and with an early stop at one target.
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_shortest_path examples/graph/example_shortest_path.cpp

#include <graphkit/matrix_graph.h>
#include <graphkit/shortest_path.h>
#include <iostream>
#include <iomanip>
#include <string>

using namespace graphkit;

// =========================================================================
// Data-centre network topology
// =========================================================================
//
// Edges (latencies in microseconds, directed):
//   web → lb (2μs), lb → app1 (3μs), lb → app2 (5μs),
//   app1 → cache (1μs), app2 → cache (2μs),
//   app1 → db_primary (10μs), cache → db_primary (4μs),
//   db_primary → db_replica (1μs)

using network = matrix_graph<std::string, kind::directed_weighted>;

network make_network() {
    network g;
    for (auto const* name : {"web_server", "load_balancer", "app_server_1",
                             "app_server_2", "cache", "db_primary", "db_replica"}) {
        (void)g.add_node(name);
    }

    auto at = [&g](char const* name) { return g.index_of(name).value(); };

    g.add_edge(at("web_server"),    at("load_balancer"), 2);
    g.add_edge(at("load_balancer"), at("app_server_1"),  3);
    g.add_edge(at("load_balancer"), at("app_server_2"),  5);
    g.add_edge(at("app_server_1"),  at("cache"),         1);
    g.add_edge(at("app_server_2"),  at("cache"),         2);
    g.add_edge(at("app_server_1"),  at("db_primary"),   10);
    g.add_edge(at("cache"),         at("db_primary"),    4);
    g.add_edge(at("db_primary"),    at("db_replica"),    1);
    return g;
}

void print_route(network const& g, predecessor_map const& pm, node_index target) {
    auto const path = pm.path_to(target);
    if (!path) {
        std::cout << "  " << std::setw(14) << g.node_value(target) << ": unreachable\n";
        return;
    }
    std::cout << "  " << std::setw(14) << g.node_value(target)
              << ": " << std::setw(3) << pm.cost(target) << "μs  ";
    for (std::size_t i = 0; i < path->size(); ++i) {
        if (i > 0) std::cout << " → ";
        std::cout << g.node_value((*path)[i]);
    }
    std::cout << "\n";
}

int main() {
    auto const g = make_network();
    auto const web = g.index_of("web_server").value();

    std::cout << "=== Minimum-latency routes from web_server ===\n\n";
    auto const all = dijkstra(g, web);
    for (node_index v = 0; v < g.node_count(); ++v) {
        print_route(g, all, v);
    }

    std::cout << "\n=== Within a 7μs budget ===\n\n";
    auto const near = dijkstra(g, web, path_cost{7});
    for (node_index v = 0; v < g.node_count(); ++v) {
        if (near.contains(v)) print_route(g, near, v);
    }

    std::cout << "\n=== Early stop at cache ===\n\n";
    auto const cache = g.index_of("cache").value();
    auto const to_cache = dijkstra(g, web, std::nullopt, cache);
    print_route(g, to_cache, cache);
    std::cout << "  (" << to_cache.size() << " of " << g.node_count()
              << " nodes discovered before stopping)\n";
    return 0;
}
