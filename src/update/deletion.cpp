#include "update/deletion.hpp"
#include <iostream>
#include <set>

namespace isum {

// ==========================================
// DeletionStatistics
// ==========================================

void DeletionStatistics::print_summary() const {
    std::cout << "Deletion pass:\n";
    std::cout << "  Triples processed: " << triples_processed << "\n";
    std::cout << "  Edges removed: " << edges_removed << "\n";
    if (edges_missing > 0) {
        std::cout << "  Edges missing: " << edges_missing << "\n";
    }
    std::cout << "  Detach attempts: " << detach_attempts
              << " (" << splits << " splits, " << reverts << " reverted)\n";
    std::cout << "  Collapsed supernodes: " << collapses << "\n";
    std::cout << "  Clique placements: " << placements << "\n";
    std::cout << "  Supernode fingerprints refreshed: " << refreshes << "\n";
    std::cout << "  Fingerprints pruned: " << fingerprints_pruned << "\n";
}

nlohmann::json DeletionStatistics::to_json() const {
    nlohmann::json j;
    j["triples_processed"] = triples_processed;
    j["edges_removed"] = edges_removed;
    j["edges_missing"] = edges_missing;
    j["detach_attempts"] = detach_attempts;
    j["splits"] = splits;
    j["reverts"] = reverts;
    j["collapses"] = collapses;
    j["placements"] = placements;
    j["refreshes"] = refreshes;
    j["fingerprints_pruned"] = fingerprints_pruned;
    return j;
}

// ==========================================
// Split test
// ==========================================

bool shares_edge(const SummaryGraph& graph, NodeId node, const std::vector<NodeId>& others) {
    std::set<Edge> rest_incoming;
    std::set<Edge> rest_outgoing;
    for (NodeId other : others) {
        if (other == node) {
            continue;
        }
        const auto& info = graph.node(other);
        rest_incoming.insert(info.incoming.begin(), info.incoming.end());
        rest_outgoing.insert(info.outgoing.begin(), info.outgoing.end());
    }

    const auto& info = graph.node(node);
    for (const auto& edge : info.incoming) {
        if (rest_incoming.count(edge) > 0) {
            return true;
        }
    }
    for (const auto& edge : info.outgoing) {
        if (rest_outgoing.count(edge) > 0) {
            return true;
        }
    }
    return false;
}

// ==========================================
// DeletionMaintainer
// ==========================================

DeletionMaintainer::DeletionMaintainer(SummaryGraph& graph, CliqueIndex& cliques)
    : graph_(graph), cliques_(cliques) {}

void DeletionMaintainer::apply(const std::vector<Triple>& deletions) {
    for (const auto& triple : deletions) {
        apply(triple);
    }
}

void DeletionMaintainer::apply(const Triple& triple) {
    transaction_.clear();

    process_endpoint(triple, true);
    process_endpoint(triple, false);

    CommitResult result = transaction_.commit(graph_, cliques_);
    stats_.placements += result.placements;
    stats_.refreshes += result.refreshes;
    stats_.fingerprints_pruned += result.fingerprints_pruned;
    stats_.triples_processed++;
}

void DeletionMaintainer::process_endpoint(const Triple& triple, bool is_subject) {
    NodeId id = is_subject ? triple.sub : triple.obj;

    if (!graph_.contains_node(id)) {
        throw ConsistencyError(id, graph_.contains_supernode(id)
            ? "Deleted fact uses a supernode id as endpoint"
            : "Deleted fact references unknown node");
    }

    bool removed = is_subject ? graph_.remove_outgoing(triple) : graph_.remove_incoming(triple);
    if (removed) {
        stats_.edges_removed++;
    } else {
        stats_.edges_missing++;
        if (verbose_) {
            std::cerr << "Deleted fact (" << triple.sub << " " << triple.pred << " "
                      << triple.obj << ") was not recorded on node " << id << "\n";
        }
    }

    auto parent = graph_.get_parent(id);
    if (parent && try_split(id, *parent)) {
        transaction_.stage_place(id);
        if (!collapse_if_singleton(*parent)) {
            transaction_.stage_refresh(*parent);
        }
    }

    transaction_.stage_prune(id, is_subject ? CliqueRole::Source : CliqueRole::Target,
                             triple.pred);
}

bool DeletionMaintainer::try_split(NodeId node, NodeId snode) {
    if (graph_.supernode_len(snode) < 2) {
        throw ConsistencyError(snode, "Singleton supernode survived an earlier pass");
    }

    stats_.detach_attempts++;
    size_t position = graph_.remove_from_supernode(node);

    if (shares_edge(graph_, node, graph_.members(snode))) {
        graph_.attach_to_supernode(node, snode, position);
        stats_.reverts++;
        return false;
    }

    stats_.splits++;
    if (verbose_) {
        std::cout << "Split node " << node << " from supernode " << snode << "\n";
    }
    return true;
}

bool DeletionMaintainer::collapse_if_singleton(NodeId snode) {
    if (graph_.supernode_len(snode) != 1) {
        return false;
    }

    NodeId survivor = graph_.to_single_node(snode);
    transaction_.stage_collapse(snode, survivor);
    stats_.collapses++;

    if (verbose_) {
        std::cout << "Collapsed supernode " << snode << " into node " << survivor << "\n";
    }
    return true;
}

} // namespace isum
