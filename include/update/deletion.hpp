#pragma once

#include "graph/summary_graph.hpp"
#include "index/clique_index.hpp"
#include "update/maintenance_transaction.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace isum {

/**
 * @brief Counters of a deletion pass
 */
struct DeletionStatistics {
    size_t triples_processed = 0;
    size_t edges_removed = 0;
    size_t edges_missing = 0;           // Deleted facts the graph did not hold
    size_t detach_attempts = 0;
    size_t splits = 0;
    size_t reverts = 0;                 // Detaches undone because edges still overlap
    size_t collapses = 0;
    size_t placements = 0;
    size_t refreshes = 0;               // Supernodes re-fingerprinted after losing a member
    size_t fingerprints_pruned = 0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

/**
 * @brief True if `node` shares an identical edge with any node in `others`
 *
 * Incoming entries are compared with incoming entries and outgoing entries
 * with outgoing entries.
 */
bool shares_edge(const SummaryGraph& graph, NodeId node, const std::vector<NodeId>& others);

/**
 * @brief Keeps a SummaryGraph and its CliqueIndex correct as facts are removed
 *
 * For every removed triple the subject and the object are handled on their
 * own. A plain endpoint loses the edge and, if it sits alone in its clique,
 * any predicate no longer carried by an edge. A clustered endpoint is
 * detached from its supernode and stays out only if none of its edges
 * overlaps the edges of the remaining members; a supernode left with one
 * member is collapsed, and one left with more gets its clique fingerprints
 * recomputed. Split checks always read the current member lists.
 *
 * There is no rollback: a ConsistencyError stops the batch and the triples
 * before it stay applied.
 */
class DeletionMaintainer {
public:
    DeletionMaintainer(SummaryGraph& graph, CliqueIndex& cliques);

    void set_verbose(bool verbose) { verbose_ = verbose; }

    /**
     * @brief Process a batch of removed triples in order
     */
    void apply(const std::vector<Triple>& deletions);

    /**
     * @brief Process one removed triple
     */
    void apply(const Triple& triple);

    const DeletionStatistics& statistics() const { return stats_; }
    void reset_statistics() { stats_ = DeletionStatistics(); }

private:
    SummaryGraph& graph_;
    CliqueIndex& cliques_;
    MaintenanceTransaction transaction_;
    DeletionStatistics stats_;
    bool verbose_ = false;

    void process_endpoint(const Triple& triple, bool is_subject);

    /**
     * @brief Detach `node` from `snode` and undo it if edges still overlap
     * @return True if the node left the cluster
     */
    bool try_split(NodeId node, NodeId snode);

    /**
     * @brief Turn `snode` back into a plain node if one member is left
     * @return True if it collapsed
     */
    bool collapse_if_singleton(NodeId snode);
};

} // namespace isum
