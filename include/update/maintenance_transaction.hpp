#pragma once

#include "graph/summary_graph.hpp"
#include "index/clique_index.hpp"
#include <cstddef>
#include <vector>

namespace isum {

enum class CliqueOpKind {
    Collapse,   // supernode `id` dissolved into member `other`
    Place,      // `id` left its cluster or is new: index it by its own fingerprint
    Refresh,    // supernode `id` lost a member: recompute its fingerprints
    Prune,      // `pred` may no longer be justified for `id` in `role`
    Extend      // `pred` was gained by `id` in `role`
};

struct CliqueOp {
    CliqueOpKind kind;
    NodeId id = 0;
    NodeId other = 0;
    CliqueRole role = CliqueRole::Source;
    NodeId pred = 0;
};

/**
 * @brief Counts of clique changes made by one commit
 */
struct CommitResult {
    size_t collapses = 0;
    size_t placements = 0;
    size_t refreshes = 0;
    size_t fingerprints_pruned = 0;
    size_t fingerprints_extended = 0;
    size_t relocations = 0;
};

/**
 * @brief Clique-side effects of one triple, applied together
 *
 * Graph mutations happen immediately while a triple is processed; the
 * matching clique updates are staged here and committed once both endpoints
 * are done. Commit order is collapses (the survivor's fingerprints are
 * recomputed on the spot), placements, refreshes of supernodes that lost a
 * member, then fingerprint prunes and extensions. Every step sees the final
 * graph state of the triple.
 */
class MaintenanceTransaction {
public:
    void stage_collapse(NodeId snode, NodeId survivor);
    void stage_place(NodeId id);
    void stage_refresh(NodeId snode);
    void stage_prune(NodeId node, CliqueRole role, NodeId pred);
    void stage_extend(NodeId node, CliqueRole role, NodeId pred);

    const std::vector<CliqueOp>& operations() const { return ops_; }
    bool empty() const { return ops_.empty(); }
    void clear() { ops_.clear(); }

    /**
     * @brief Apply the staged operations to `cliques`
     *
     * Clears the transaction afterwards.
     * @throws ConsistencyError if an entity is missing from the index map
     */
    CommitResult commit(const SummaryGraph& graph, CliqueIndex& cliques);

    /**
     * @brief The id that stands for `node` in the clique index
     *
     * Its parent supernode when clustered, the node itself otherwise.
     */
    static NodeId representative(const SummaryGraph& graph, NodeId node);

private:
    std::vector<CliqueOp> ops_;
};

} // namespace isum
