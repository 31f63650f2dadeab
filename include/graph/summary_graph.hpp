#ifndef ISUM_SUMMARY_GRAPH_HPP
#define ISUM_SUMMARY_GRAPH_HPP

#include "graph/errors.hpp"
#include "graph/triple.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace isum {

/**
 * @brief Record of a plain node
 *
 * A node belongs to at most one supernode. Its edge lists keep the order in
 * which facts were observed.
 */
struct NodeInfo {
    std::optional<NodeId> parent;       // Supernode this node is merged into
    EdgeList incoming;                  // (pred, subject) where this node is the object
    EdgeList outgoing;                  // (pred, object) where this node is the subject

    NodeInfo() = default;
    NodeInfo(std::optional<NodeId> parent, EdgeList incoming, EdgeList outgoing)
        : parent(parent), incoming(std::move(incoming)), outgoing(std::move(outgoing)) {}

    void set_parent(NodeId p) { parent = p; }
    void remove_parent() { parent.reset(); }

    bool operator==(const NodeInfo& other) const {
        return parent == other.parent && incoming == other.incoming && outgoing == other.outgoing;
    }
};

/**
 * @brief Size figures of a summary graph
 */
struct SummaryStatistics {
    size_t num_nodes = 0;
    size_t num_supernodes = 0;
    size_t num_clustered_nodes = 0;     // Nodes with a parent
    size_t num_top_level = 0;           // Plain unclustered nodes + supernodes
    size_t num_edges = 0;               // Outgoing entries, i.e. facts
    size_t max_supernode_size = 0;
    size_t min_supernode_size = 0;
    double avg_supernode_size = 0.0;
    double compression_ratio = 1.0;     // num_top_level / num_nodes

    nlohmann::json to_json() const;
    void print_summary() const;
};

/**
 * @brief Node/supernode graph of a compressed fact index
 *
 * Holds two maps over one id space: node id -> NodeInfo and supernode id ->
 * ordered member list. The key sets never overlap, a node's parent points at
 * the single supernode listing it, and member lists partition the clustered
 * nodes.
 *
 * Every precondition failure throws ConsistencyError.
 */
class SummaryGraph {
public:
    SummaryGraph() = default;
    SummaryGraph(std::map<NodeId, std::vector<NodeId>> supernodes,
                 std::map<NodeId, NodeInfo> nodes);

    // ==========================================
    // Lookup
    // ==========================================

    /**
     * @brief True if `id` names a node or a supernode
     */
    bool contains(NodeId id) const;
    bool contains_node(NodeId id) const;
    bool contains_supernode(NodeId id) const;

    /**
     * @brief Node record for `id`
     * @throws ConsistencyError if `id` is not a node
     */
    const NodeInfo& node(NodeId id) const;

    /**
     * @brief Ordered members of supernode `snode`
     * @throws ConsistencyError if `snode` is not a supernode
     */
    const std::vector<NodeId>& members(NodeId snode) const;

    std::optional<NodeId> get_parent(NodeId id) const;
    bool has_parent(NodeId id) const;

    /**
     * @brief True if some outgoing edge of `id` carries `pred`
     *
     * For a supernode id this holds if any member satisfies it.
     */
    bool has_outgoing_pred(NodeId id, NodeId pred) const;

    /**
     * @brief True if some incoming edge of `id` carries `pred`
     *
     * For a supernode id this holds if any member satisfies it.
     */
    bool has_incoming_pred(NodeId id, NodeId pred) const;

    /**
     * @brief Sorted distinct outgoing predicates of a node or supernode
     */
    std::vector<NodeId> outgoing_predicates(NodeId id) const;

    /**
     * @brief Sorted distinct incoming predicates of a node or supernode
     */
    std::vector<NodeId> incoming_predicates(NodeId id) const;

    /**
     * @brief Member count of supernode `snode`
     * @throws ConsistencyError if `snode` is not a supernode
     */
    size_t supernode_len(NodeId snode) const;

    // ==========================================
    // Node and Edge Management
    // ==========================================

    /**
     * @brief Register an endpoint of `triple` as a brand-new plain node
     * @param is_subject Register the subject (with the edge as outgoing)
     *                   or the object (with the edge as incoming)
     * @throws ConsistencyError if the id already exists
     */
    void new_node(const Triple& triple, bool is_subject);

    void add_outgoing(const Triple& triple);
    void add_incoming(const Triple& triple);

    /**
     * @brief Remove every outgoing entry of the subject equal to (pred, obj)
     * @return Whether an entry was removed
     */
    bool remove_outgoing(const Triple& triple);

    /**
     * @brief Remove every incoming entry of the object equal to (pred, sub)
     * @return Whether an entry was removed
     */
    bool remove_incoming(const Triple& triple);

    // ==========================================
    // Cluster Operations
    // ==========================================

    /**
     * @brief Merge plain nodes and existing supernodes into supernode `new_id`
     * @param old Nodes to append and supernodes to absorb, in order
     * @param new_id Fresh id, or the id of a supernode listed in `old`
     *
     * Absorbed supernode records are deleted and every member's parent is
     * repointed to `new_id`. The only way clusters are created.
     */
    void new_snode(const std::vector<NodeId>& old, NodeId new_id);

    /**
     * @brief Detach `id` from its parent supernode
     * @return Position `id` held in the member list
     * @throws ConsistencyError if `id` has no parent
     */
    size_t remove_from_supernode(NodeId id);

    /**
     * @brief Put a detached node back into `snode` at `position`
     *
     * Inverse of remove_from_supernode(). Positions past the end append.
     */
    void attach_to_supernode(NodeId id, NodeId snode, size_t position);

    /**
     * @brief Collapse a one-member supernode back into a plain node
     * @return The former sole member
     * @throws ConsistencyError if `snode` is missing or does not have exactly one member
     */
    NodeId to_single_node(NodeId snode);

    // ==========================================
    // Iteration and Analysis
    // ==========================================

    std::vector<NodeId> node_ids() const;
    std::vector<NodeId> supernode_ids() const;

    /**
     * @brief Plain nodes without a parent followed by all supernodes
     */
    std::vector<NodeId> top_level_ids() const;

    /**
     * @brief Largest id in use, 0 for an empty graph
     */
    NodeId max_id() const;

    /**
     * @brief Whether `id` labels an edge anywhere in the graph
     */
    bool is_predicate(NodeId id) const;

    /**
     * @brief Smallest id above every node, supernode and predicate
     * @throws ConsistencyError when the id space is exhausted
     */
    NodeId next_free_id() const;

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_supernodes() const { return supernodes_.size(); }
    bool empty() const { return nodes_.empty() && supernodes_.empty(); }
    void clear();

    /**
     * @brief Check the partition, parent and no-singleton invariants
     * @param error_message Receives the first violation found
     */
    bool validate(std::string& error_message) const;

    SummaryStatistics compute_statistics() const;

    /**
     * @brief Build an unclustered graph holding every fact as edges
     */
    static SummaryGraph from_triples(const std::vector<Triple>& triples);

    // ==========================================
    // Import/Export
    // ==========================================

    nlohmann::json to_json() const;
    void save_to_json(const std::string& filename) const;

    /**
     * @brief Rebuild a graph from its snapshot records
     * @throws SnapshotError on duplicate ids, malformed records or a
     *         snapshot that breaks the graph invariants
     */
    static SummaryGraph from_json(const nlohmann::json& j);
    static SummaryGraph load_from_json(const std::string& filename);

    bool operator==(const SummaryGraph& other) const {
        return nodes_ == other.nodes_ && supernodes_ == other.supernodes_;
    }

private:
    std::map<NodeId, std::vector<NodeId>> supernodes_;   // supernode_id -> members
    std::map<NodeId, NodeInfo> nodes_;                   // node_id -> record

    NodeInfo& node_mut(NodeId id);
    std::vector<NodeId>& members_mut(NodeId snode);

    void collect_predicates(NodeId id, bool outgoing, std::vector<NodeId>& out) const;
};

} // namespace isum

#endif // ISUM_SUMMARY_GRAPH_HPP
