/**
 * Summary maintenance example
 *
 * Builds a tiny summary by hand, merges two objects into a supernode and
 * removes one of the facts that justified the merge.
 */

#include "graph/summary_graph.hpp"
#include "index/clique_index.hpp"
#include "update/deletion.hpp"
#include <iostream>

using namespace isum;

void print_graph(const SummaryGraph& graph) {
    for (NodeId id : graph.supernode_ids()) {
        std::cout << "  supernode " << id << ":";
        for (NodeId member : graph.members(id)) {
            std::cout << " " << member;
        }
        std::cout << "\n";
    }
    for (NodeId id : graph.node_ids()) {
        const auto& info = graph.node(id);
        std::cout << "  node " << id << " parent=";
        if (info.parent) {
            std::cout << *info.parent;
        } else {
            std::cout << "-";
        }
        std::cout << " in=" << info.incoming.size() << " out=" << info.outgoing.size() << "\n";
    }
}

int main() {
    std::cout << "=== Summary Maintenance Example ===\n\n";

    // (1, 10, 2) and (1, 10, 3): objects 2 and 3 share the incoming fingerprint {10}
    std::vector<Triple> facts = {
        Triple(1, 10, 2),
        Triple(1, 10, 3)
    };

    SummaryGraph graph = SummaryGraph::from_triples(facts);
    graph.new_snode({2, 3}, 99);

    std::cout << "After merging 2 and 3 into 99:\n";
    print_graph(graph);

    CliqueIndex cliques;
    cliques.build(graph);
    cliques.print_summary();

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.set_verbose(true);

    std::cout << "\nDeleting (1, 10, 2)...\n";
    maintainer.apply(Triple(1, 10, 2));

    std::cout << "\nAfter deletion:\n";
    print_graph(graph);
    std::cout << "\n";
    maintainer.statistics().print_summary();

    std::string error;
    if (!graph.validate(error) || !cliques.validate(error)) {
        std::cerr << "Invariant check failed: " << error << "\n";
        return 1;
    }

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
