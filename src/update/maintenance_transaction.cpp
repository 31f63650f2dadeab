#include "update/maintenance_transaction.hpp"
#include <set>

namespace isum {

void MaintenanceTransaction::stage_collapse(NodeId snode, NodeId survivor) {
    CliqueOp op{CliqueOpKind::Collapse};
    op.id = snode;
    op.other = survivor;
    ops_.push_back(op);
}

void MaintenanceTransaction::stage_place(NodeId id) {
    CliqueOp op{CliqueOpKind::Place};
    op.id = id;
    ops_.push_back(op);
}

void MaintenanceTransaction::stage_refresh(NodeId snode) {
    CliqueOp op{CliqueOpKind::Refresh};
    op.id = snode;
    ops_.push_back(op);
}

void MaintenanceTransaction::stage_prune(NodeId node, CliqueRole role, NodeId pred) {
    CliqueOp op{CliqueOpKind::Prune};
    op.id = node;
    op.role = role;
    op.pred = pred;
    ops_.push_back(op);
}

void MaintenanceTransaction::stage_extend(NodeId node, CliqueRole role, NodeId pred) {
    CliqueOp op{CliqueOpKind::Extend};
    op.id = node;
    op.role = role;
    op.pred = pred;
    ops_.push_back(op);
}

NodeId MaintenanceTransaction::representative(const SummaryGraph& graph, NodeId node) {
    auto parent = graph.get_parent(node);
    return parent ? *parent : node;
}

CommitResult MaintenanceTransaction::commit(const SummaryGraph& graph, CliqueIndex& cliques) {
    CommitResult result;

    for (const auto& op : ops_) {
        if (op.kind == CliqueOpKind::Collapse) {
            cliques.replace_member(op.id, op.other);
            result.collapses++;
            if (cliques.refresh(op.other, graph)) {
                result.relocations++;
            }
        }
    }

    std::set<NodeId> placed;
    for (const auto& op : ops_) {
        if (op.kind == CliqueOpKind::Place && placed.insert(op.id).second) {
            cliques.place(op.id, graph);
            result.placements++;
        }
    }

    // A supernode refreshed earlier in the triple may have collapsed since
    std::set<NodeId> refreshed;
    for (const auto& op : ops_) {
        if (op.kind != CliqueOpKind::Refresh || !graph.contains_supernode(op.id) ||
            !refreshed.insert(op.id).second) {
            continue;
        }
        if (cliques.refresh(op.id, graph)) {
            result.relocations++;
        }
        result.refreshes++;
    }

    for (const auto& op : ops_) {
        if (op.kind != CliqueOpKind::Prune && op.kind != CliqueOpKind::Extend) {
            continue;
        }

        NodeId rep = representative(graph, op.id);
        Clique& clique = cliques.clique_of(rep, op.role);
        bool justified = op.role == CliqueRole::Source
            ? graph.has_outgoing_pred(rep, op.pred)
            : graph.has_incoming_pred(rep, op.pred);

        if (op.kind == CliqueOpKind::Prune) {
            // Shared cliques describe all their members at once; only a
            // singleton clique follows its entity's edges eagerly
            if (clique.nodes.size() == 1 && !justified && clique.remove_pred(op.pred)) {
                result.fingerprints_pruned++;
            }
        } else if (justified && !clique.has_pred(op.pred)) {
            if (clique.nodes.size() == 1) {
                clique.add_pred(op.pred);
                result.fingerprints_extended++;
            } else {
                cliques.place(rep, graph);
                result.relocations++;
            }
        }
    }

    ops_.clear();
    return result;
}

} // namespace isum
