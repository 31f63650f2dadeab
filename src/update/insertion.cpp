#include "update/insertion.hpp"
#include <algorithm>
#include <iostream>

namespace isum {

void InsertionStatistics::print_summary() const {
    std::cout << "Insertion pass:\n";
    std::cout << "  Triples processed: " << triples_processed << "\n";
    std::cout << "  Nodes created: " << nodes_created << "\n";
    std::cout << "  Edges added: " << edges_added << "\n";
    if (duplicates > 0) {
        std::cout << "  Duplicate facts skipped: " << duplicates << "\n";
    }
    std::cout << "  Fingerprints extended: " << fingerprints_extended << "\n";
    std::cout << "  Clique relocations: " << relocations << "\n";
}

nlohmann::json InsertionStatistics::to_json() const {
    nlohmann::json j;
    j["triples_processed"] = triples_processed;
    j["nodes_created"] = nodes_created;
    j["edges_added"] = edges_added;
    j["duplicates"] = duplicates;
    j["fingerprints_extended"] = fingerprints_extended;
    j["relocations"] = relocations;
    return j;
}

InsertionMaintainer::InsertionMaintainer(SummaryGraph& graph, CliqueIndex& cliques)
    : graph_(graph), cliques_(cliques) {}

void InsertionMaintainer::apply(const std::vector<Triple>& additions) {
    for (const auto& triple : additions) {
        apply(triple);
    }
}

void InsertionMaintainer::apply(const Triple& triple) {
    transaction_.clear();

    process_endpoint(triple, true);
    process_endpoint(triple, false);

    CommitResult result = transaction_.commit(graph_, cliques_);
    stats_.fingerprints_extended += result.fingerprints_extended;
    stats_.relocations += result.relocations;
    stats_.triples_processed++;
}

void InsertionMaintainer::process_endpoint(const Triple& triple, bool is_subject) {
    NodeId id = is_subject ? triple.sub : triple.obj;

    if (graph_.contains_supernode(id)) {
        throw ConsistencyError(id, "Added fact uses a supernode id as endpoint");
    }

    if (!graph_.contains_node(id)) {
        graph_.new_node(triple, is_subject);
        transaction_.stage_place(id);
        stats_.nodes_created++;
        stats_.edges_added++;
        return;
    }

    const auto& info = graph_.node(id);
    const auto& edges = is_subject ? info.outgoing : info.incoming;
    Edge edge(triple.pred, is_subject ? triple.obj : triple.sub);
    if (std::find(edges.begin(), edges.end(), edge) != edges.end()) {
        stats_.duplicates++;
        if (verbose_) {
            std::cerr << "Added fact (" << triple.sub << " " << triple.pred << " "
                      << triple.obj << ") is already recorded on node " << id << "\n";
        }
        return;
    }

    if (is_subject) {
        graph_.add_outgoing(triple);
    } else {
        graph_.add_incoming(triple);
    }
    stats_.edges_added++;

    transaction_.stage_extend(id, is_subject ? CliqueRole::Source : CliqueRole::Target,
                              triple.pred);
}

} // namespace isum
