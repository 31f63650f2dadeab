#pragma once

#include "graph/summary_graph.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace isum {

enum class CliqueRole {
    Source = 0,     // grouped by outgoing predicates
    Target = 1      // grouped by incoming predicates
};

std::string clique_role_to_string(CliqueRole role);

/**
 * @brief Entities sharing one predicate fingerprint in a given role
 *
 * `preds` is kept sorted and duplicate free.
 */
struct Clique {
    std::vector<NodeId> nodes;
    std::vector<NodeId> preds;

    bool has_member(NodeId id) const;
    bool has_pred(NodeId pred) const;

    bool remove_member(NodeId id);
    bool remove_pred(NodeId pred);
    bool add_pred(NodeId pred);

    nlohmann::json to_json() const;
};

/**
 * @brief Source and target cliques plus the id -> clique index map
 *
 * Indexes the top-level entities of a SummaryGraph: plain nodes without a
 * parent and supernodes. Clique slots are never compacted, so an index
 * stays valid after its clique empties.
 */
struct CliqueIndex {
    std::vector<Clique> source_cliques;
    std::vector<Clique> target_cliques;

    // id -> [source clique index, target clique index]
    std::unordered_map<NodeId, std::array<size_t, 2>> index_map;

    /**
     * @brief Group every top-level entity of `graph` by fingerprint
     */
    void build(const SummaryGraph& graph);

    bool contains(NodeId id) const { return index_map.count(id) > 0; }

    /**
     * @brief Index of the clique holding `id` in `role`
     * @throws ConsistencyError if `id` is not indexed
     */
    size_t index_of(NodeId id, CliqueRole role) const;

    Clique& clique_of(NodeId id, CliqueRole role);
    const Clique& clique_of(NodeId id, CliqueRole role) const;

    std::vector<Clique>& cliques(CliqueRole role);
    const std::vector<Clique>& cliques(CliqueRole role) const;

    /**
     * @brief Put `id` into the cliques matching its fingerprints
     *
     * Joins an existing clique with an identical fingerprint or opens a new
     * one. An already indexed id is removed from its cliques first.
     */
    void place(NodeId id,
               const std::vector<NodeId>& source_fingerprint,
               const std::vector<NodeId>& target_fingerprint);

    /**
     * @brief Place `id` using its current fingerprints in `graph`
     */
    void place(NodeId id, const SummaryGraph& graph);

    /**
     * @brief Drop `id` from its cliques and from the index map
     */
    void remove(NodeId id);

    /**
     * @brief Let `new_id` take over every clique slot of `old_id`
     *
     * Used when a supernode collapses into its last member.
     */
    void replace_member(NodeId old_id, NodeId new_id);

    /**
     * @brief Bring the cliques of `id` in line with its current fingerprints
     *
     * A clique `id` holds alone takes over the new fingerprint. If `id`
     * shares a clique whose fingerprint no longer matches, it is placed
     * again.
     * @return True if `id` moved to other cliques
     */
    bool refresh(NodeId id, const SummaryGraph& graph);

    /**
     * @brief Check that the index map and clique member lists agree
     */
    bool validate(std::string& error_message) const;

    size_t num_cliques(CliqueRole role) const { return cliques(role).size(); }

    nlohmann::json to_json() const;
    void print_summary() const;

private:
    static size_t find_or_create(std::vector<Clique>& list, const std::vector<NodeId>& fingerprint);
};

} // namespace isum
