#include "graph/summary_graph.hpp"
#include <algorithm>
#include <limits>
#include <set>

namespace isum {

SummaryGraph::SummaryGraph(std::map<NodeId, std::vector<NodeId>> supernodes,
                           std::map<NodeId, NodeInfo> nodes)
    : supernodes_(std::move(supernodes)), nodes_(std::move(nodes)) {}

// ==========================================
// Lookup
// ==========================================

bool SummaryGraph::contains(NodeId id) const {
    return contains_node(id) || contains_supernode(id);
}

bool SummaryGraph::contains_node(NodeId id) const {
    return nodes_.find(id) != nodes_.end();
}

bool SummaryGraph::contains_supernode(NodeId id) const {
    return supernodes_.find(id) != supernodes_.end();
}

const NodeInfo& SummaryGraph::node(NodeId id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw ConsistencyError(id, "Node not found");
    }
    return it->second;
}

NodeInfo& SummaryGraph::node_mut(NodeId id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw ConsistencyError(id, "Node not found");
    }
    return it->second;
}

const std::vector<NodeId>& SummaryGraph::members(NodeId snode) const {
    auto it = supernodes_.find(snode);
    if (it == supernodes_.end()) {
        throw ConsistencyError(snode, "Supernode not found");
    }
    return it->second;
}

std::vector<NodeId>& SummaryGraph::members_mut(NodeId snode) {
    auto it = supernodes_.find(snode);
    if (it == supernodes_.end()) {
        throw ConsistencyError(snode, "Supernode not found");
    }
    return it->second;
}

std::optional<NodeId> SummaryGraph::get_parent(NodeId id) const {
    return node(id).parent;
}

bool SummaryGraph::has_parent(NodeId id) const {
    return get_parent(id).has_value();
}

bool SummaryGraph::has_outgoing_pred(NodeId id, NodeId pred) const {
    if (!contains_supernode(id)) {
        for (const auto& edge : node(id).outgoing) {
            if (edge.pred == pred) {
                return true;
            }
        }
        return false;
    }

    for (NodeId member : members(id)) {
        if (has_outgoing_pred(member, pred)) {
            return true;
        }
    }
    return false;
}

bool SummaryGraph::has_incoming_pred(NodeId id, NodeId pred) const {
    if (!contains_supernode(id)) {
        for (const auto& edge : node(id).incoming) {
            if (edge.pred == pred) {
                return true;
            }
        }
        return false;
    }

    for (NodeId member : members(id)) {
        if (has_incoming_pred(member, pred)) {
            return true;
        }
    }
    return false;
}

void SummaryGraph::collect_predicates(NodeId id, bool outgoing, std::vector<NodeId>& out) const {
    if (contains_supernode(id)) {
        for (NodeId member : members(id)) {
            collect_predicates(member, outgoing, out);
        }
        return;
    }

    const auto& info = node(id);
    const auto& edges = outgoing ? info.outgoing : info.incoming;
    for (const auto& edge : edges) {
        out.push_back(edge.pred);
    }
}

std::vector<NodeId> SummaryGraph::outgoing_predicates(NodeId id) const {
    std::vector<NodeId> preds;
    collect_predicates(id, true, preds);
    std::sort(preds.begin(), preds.end());
    preds.erase(std::unique(preds.begin(), preds.end()), preds.end());
    return preds;
}

std::vector<NodeId> SummaryGraph::incoming_predicates(NodeId id) const {
    std::vector<NodeId> preds;
    collect_predicates(id, false, preds);
    std::sort(preds.begin(), preds.end());
    preds.erase(std::unique(preds.begin(), preds.end()), preds.end());
    return preds;
}

size_t SummaryGraph::supernode_len(NodeId snode) const {
    if (!contains_supernode(snode)) {
        throw ConsistencyError(snode, "Trying to get length of non-supernode");
    }
    return members(snode).size();
}

// ==========================================
// Node and Edge Management
// ==========================================

void SummaryGraph::new_node(const Triple& triple, bool is_subject) {
    NodeId id = is_subject ? triple.sub : triple.obj;
    NodeId other = is_subject ? triple.obj : triple.sub;

    if (contains(id)) {
        throw ConsistencyError(id, "Trying to add new node, but it already exists");
    }

    NodeInfo info;
    if (is_subject) {
        info.outgoing.emplace_back(triple.pred, other);
    } else {
        info.incoming.emplace_back(triple.pred, other);
    }
    nodes_.emplace(id, std::move(info));
}

void SummaryGraph::add_outgoing(const Triple& triple) {
    node_mut(triple.sub).outgoing.emplace_back(triple.pred, triple.obj);
}

void SummaryGraph::add_incoming(const Triple& triple) {
    node_mut(triple.obj).incoming.emplace_back(triple.pred, triple.sub);
}

bool SummaryGraph::remove_outgoing(const Triple& triple) {
    auto& edges = node_mut(triple.sub).outgoing;
    Edge target(triple.pred, triple.obj);
    auto new_end = std::remove(edges.begin(), edges.end(), target);
    bool removed = new_end != edges.end();
    edges.erase(new_end, edges.end());
    return removed;
}

bool SummaryGraph::remove_incoming(const Triple& triple) {
    auto& edges = node_mut(triple.obj).incoming;
    Edge target(triple.pred, triple.sub);
    auto new_end = std::remove(edges.begin(), edges.end(), target);
    bool removed = new_end != edges.end();
    edges.erase(new_end, edges.end());
    return removed;
}

// ==========================================
// Cluster Operations
// ==========================================

void SummaryGraph::new_snode(const std::vector<NodeId>& old, NodeId new_id) {
    if (old.empty()) {
        throw ConsistencyError(new_id, "Cannot create a supernode without members");
    }
    if (contains_node(new_id)) {
        throw ConsistencyError(new_id, "Supernode id already names a node");
    }
    if (contains_supernode(new_id) &&
        std::find(old.begin(), old.end(), new_id) == old.end()) {
        throw ConsistencyError(new_id, "Supernode id already in use");
    }

    // Check everything up front so a rejected merge leaves the graph untouched
    std::set<NodeId> seen;
    for (NodeId id : old) {
        if (!seen.insert(id).second) {
            throw ConsistencyError(id, "Id listed twice in merge");
        }
        if (contains_supernode(id)) {
            continue;
        }
        const auto& info = node(id);
        if (info.parent) {
            throw ConsistencyError(id, "Cannot merge node that already belongs to supernode " +
                                       std::to_string(*info.parent));
        }
    }

    std::vector<NodeId> merged;
    for (NodeId id : old) {
        auto it = supernodes_.find(id);
        if (it != supernodes_.end()) {
            for (NodeId member : it->second) {
                node_mut(member).set_parent(new_id);
                merged.push_back(member);
            }
            supernodes_.erase(it);
        } else {
            node_mut(id).set_parent(new_id);
            merged.push_back(id);
        }
    }
    supernodes_[new_id] = std::move(merged);
}

size_t SummaryGraph::remove_from_supernode(NodeId id) {
    auto& info = node_mut(id);
    if (!info.parent) {
        throw ConsistencyError(id, "Trying to remove node from supernode, but it has no parent");
    }

    NodeId parent = *info.parent;
    auto& list = members_mut(parent);
    auto it = std::find(list.begin(), list.end(), id);
    if (it == list.end()) {
        throw ConsistencyError(id, "Node is not listed by its parent supernode " +
                                   std::to_string(parent));
    }

    size_t position = static_cast<size_t>(it - list.begin());
    list.erase(it);
    info.remove_parent();
    return position;
}

void SummaryGraph::attach_to_supernode(NodeId id, NodeId snode, size_t position) {
    auto& info = node_mut(id);
    if (info.parent) {
        throw ConsistencyError(id, "Trying to attach node that already belongs to supernode " +
                                   std::to_string(*info.parent));
    }

    auto& list = members_mut(snode);
    if (std::find(list.begin(), list.end(), id) != list.end()) {
        throw ConsistencyError(id, "Supernode " + std::to_string(snode) +
                                   " already lists node");
    }

    position = std::min(position, list.size());
    list.insert(list.begin() + static_cast<std::ptrdiff_t>(position), id);
    info.set_parent(snode);
}

NodeId SummaryGraph::to_single_node(NodeId snode) {
    if (!contains_supernode(snode)) {
        throw ConsistencyError(snode, "Trying to convert non-supernode to single node");
    }
    if (supernode_len(snode) != 1) {
        throw ConsistencyError(snode, "Trying to convert supernode to single node, but it has " +
                                      std::to_string(supernode_len(snode)) + " members");
    }

    NodeId member = members(snode)[0];
    node_mut(member).remove_parent();
    supernodes_.erase(snode);
    return member;
}

// ==========================================
// Iteration and Analysis
// ==========================================

std::vector<NodeId> SummaryGraph::node_ids() const {
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, info] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<NodeId> SummaryGraph::supernode_ids() const {
    std::vector<NodeId> ids;
    ids.reserve(supernodes_.size());
    for (const auto& [id, list] : supernodes_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<NodeId> SummaryGraph::top_level_ids() const {
    std::vector<NodeId> ids;
    for (const auto& [id, info] : nodes_) {
        if (!info.parent) {
            ids.push_back(id);
        }
    }
    for (const auto& [id, list] : supernodes_) {
        ids.push_back(id);
    }
    return ids;
}

NodeId SummaryGraph::max_id() const {
    NodeId result = 0;
    if (!nodes_.empty()) {
        result = std::max(result, nodes_.rbegin()->first);
    }
    if (!supernodes_.empty()) {
        result = std::max(result, supernodes_.rbegin()->first);
    }
    return result;
}

bool SummaryGraph::is_predicate(NodeId id) const {
    for (const auto& [node_id, info] : nodes_) {
        for (const auto& edge : info.outgoing) {
            if (edge.pred == id) {
                return true;
            }
        }
    }
    return false;
}

NodeId SummaryGraph::next_free_id() const {
    NodeId highest = max_id();
    for (const auto& [node_id, info] : nodes_) {
        for (const auto& edge : info.outgoing) {
            highest = std::max(highest, edge.pred);
        }
    }
    if (highest == std::numeric_limits<NodeId>::max()) {
        throw ConsistencyError(highest, "No free id left above");
    }
    return highest + 1;
}

void SummaryGraph::clear() {
    nodes_.clear();
    supernodes_.clear();
}

bool SummaryGraph::validate(std::string& error_message) const {
    std::map<NodeId, NodeId> owner;     // member -> supernode listing it

    for (const auto& [snode, list] : supernodes_) {
        if (nodes_.count(snode) > 0) {
            error_message = "Id " + std::to_string(snode) + " is both a node and a supernode";
            return false;
        }
        if (list.size() < 2) {
            error_message = "Supernode " + std::to_string(snode) + " has " +
                            std::to_string(list.size()) + " member(s)";
            return false;
        }

        for (NodeId member : list) {
            auto it = nodes_.find(member);
            if (it == nodes_.end()) {
                error_message = "Supernode " + std::to_string(snode) +
                                " lists unknown node " + std::to_string(member);
                return false;
            }
            auto [pos, inserted] = owner.emplace(member, snode);
            if (!inserted) {
                error_message = "Node " + std::to_string(member) + " is listed by supernode " +
                                std::to_string(pos->second) + " and supernode " +
                                std::to_string(snode);
                return false;
            }
            if (it->second.parent != snode) {
                error_message = "Node " + std::to_string(member) + " is listed by supernode " +
                                std::to_string(snode) + " but its parent is " +
                                (it->second.parent ? std::to_string(*it->second.parent) : "none");
                return false;
            }
        }
    }

    for (const auto& [id, info] : nodes_) {
        if (info.parent && owner.count(id) == 0) {
            error_message = "Node " + std::to_string(id) + " has parent " +
                            std::to_string(*info.parent) + " which does not list it";
            return false;
        }
    }

    return true;
}

SummaryStatistics SummaryGraph::compute_statistics() const {
    SummaryStatistics stats;
    stats.num_nodes = nodes_.size();
    stats.num_supernodes = supernodes_.size();

    for (const auto& [id, info] : nodes_) {
        if (info.parent) {
            stats.num_clustered_nodes++;
        }
        stats.num_edges += info.outgoing.size();
    }

    if (!supernodes_.empty()) {
        stats.min_supernode_size = supernodes_.begin()->second.size();
        size_t total = 0;
        for (const auto& [id, list] : supernodes_) {
            stats.max_supernode_size = std::max(stats.max_supernode_size, list.size());
            stats.min_supernode_size = std::min(stats.min_supernode_size, list.size());
            total += list.size();
        }
        stats.avg_supernode_size = static_cast<double>(total) / supernodes_.size();
    }

    stats.num_top_level = stats.num_nodes - stats.num_clustered_nodes + stats.num_supernodes;
    if (stats.num_nodes > 0) {
        stats.compression_ratio = static_cast<double>(stats.num_top_level) / stats.num_nodes;
    }

    return stats;
}

SummaryGraph SummaryGraph::from_triples(const std::vector<Triple>& triples) {
    SummaryGraph graph;

    for (const auto& triple : triples) {
        if (!graph.contains(triple.sub)) {
            graph.new_node(triple, true);
        } else {
            const auto& out = graph.node(triple.sub).outgoing;
            if (std::find(out.begin(), out.end(), Edge(triple.pred, triple.obj)) != out.end()) {
                continue;  // Repeated fact
            }
            graph.add_outgoing(triple);
        }

        if (!graph.contains(triple.obj)) {
            graph.new_node(triple, false);
        } else {
            graph.add_incoming(triple);
        }
    }

    return graph;
}

} // namespace isum
