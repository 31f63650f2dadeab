#include "index/clique_index.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <utility>

namespace isum {

std::string clique_role_to_string(CliqueRole role) {
    return role == CliqueRole::Source ? "source" : "target";
}

// ==========================================
// Clique
// ==========================================

bool Clique::has_member(NodeId id) const {
    return std::find(nodes.begin(), nodes.end(), id) != nodes.end();
}

bool Clique::has_pred(NodeId pred) const {
    return std::binary_search(preds.begin(), preds.end(), pred);
}

bool Clique::remove_member(NodeId id) {
    auto it = std::find(nodes.begin(), nodes.end(), id);
    if (it == nodes.end()) {
        return false;
    }
    nodes.erase(it);
    return true;
}

bool Clique::remove_pred(NodeId pred) {
    auto it = std::lower_bound(preds.begin(), preds.end(), pred);
    if (it == preds.end() || *it != pred) {
        return false;
    }
    preds.erase(it);
    return true;
}

bool Clique::add_pred(NodeId pred) {
    auto it = std::lower_bound(preds.begin(), preds.end(), pred);
    if (it != preds.end() && *it == pred) {
        return false;
    }
    preds.insert(it, pred);
    return true;
}

nlohmann::json Clique::to_json() const {
    nlohmann::json j;
    j["nodes"] = nodes;
    j["preds"] = preds;
    return j;
}

// ==========================================
// CliqueIndex
// ==========================================

void CliqueIndex::build(const SummaryGraph& graph) {
    source_cliques.clear();
    target_cliques.clear();
    index_map.clear();

    std::map<std::vector<NodeId>, size_t> source_lookup;
    std::map<std::vector<NodeId>, size_t> target_lookup;

    auto slot = [](std::vector<Clique>& list,
                   std::map<std::vector<NodeId>, size_t>& lookup,
                   std::vector<NodeId> fingerprint) {
        auto it = lookup.find(fingerprint);
        if (it != lookup.end()) {
            return it->second;
        }
        size_t index = list.size();
        Clique clique;
        clique.preds = fingerprint;
        list.push_back(std::move(clique));
        lookup.emplace(std::move(fingerprint), index);
        return index;
    };

    for (NodeId id : graph.top_level_ids()) {
        size_t s = slot(source_cliques, source_lookup, graph.outgoing_predicates(id));
        size_t t = slot(target_cliques, target_lookup, graph.incoming_predicates(id));
        source_cliques[s].nodes.push_back(id);
        target_cliques[t].nodes.push_back(id);
        index_map[id] = {s, t};
    }
}

size_t CliqueIndex::index_of(NodeId id, CliqueRole role) const {
    auto it = index_map.find(id);
    if (it == index_map.end()) {
        throw ConsistencyError(id, "Id has no " + clique_role_to_string(role) + " clique");
    }
    return it->second[static_cast<size_t>(role)];
}

std::vector<Clique>& CliqueIndex::cliques(CliqueRole role) {
    return role == CliqueRole::Source ? source_cliques : target_cliques;
}

const std::vector<Clique>& CliqueIndex::cliques(CliqueRole role) const {
    return role == CliqueRole::Source ? source_cliques : target_cliques;
}

Clique& CliqueIndex::clique_of(NodeId id, CliqueRole role) {
    size_t index = index_of(id, role);
    auto& list = cliques(role);
    if (index >= list.size()) {
        throw ConsistencyError(id, "Index map points past the " + clique_role_to_string(role) +
                                   " cliques");
    }
    return list[index];
}

const Clique& CliqueIndex::clique_of(NodeId id, CliqueRole role) const {
    size_t index = index_of(id, role);
    const auto& list = cliques(role);
    if (index >= list.size()) {
        throw ConsistencyError(id, "Index map points past the " + clique_role_to_string(role) +
                                   " cliques");
    }
    return list[index];
}

size_t CliqueIndex::find_or_create(std::vector<Clique>& list,
                                   const std::vector<NodeId>& fingerprint) {
    for (size_t i = 0; i < list.size(); ++i) {
        if (list[i].preds == fingerprint) {
            return i;
        }
    }
    Clique clique;
    clique.preds = fingerprint;
    list.push_back(std::move(clique));
    return list.size() - 1;
}

void CliqueIndex::place(NodeId id,
                        const std::vector<NodeId>& source_fingerprint,
                        const std::vector<NodeId>& target_fingerprint) {
    if (contains(id)) {
        remove(id);
    }

    size_t s = find_or_create(source_cliques, source_fingerprint);
    size_t t = find_or_create(target_cliques, target_fingerprint);
    source_cliques[s].nodes.push_back(id);
    target_cliques[t].nodes.push_back(id);
    index_map[id] = {s, t};
}

void CliqueIndex::place(NodeId id, const SummaryGraph& graph) {
    place(id, graph.outgoing_predicates(id), graph.incoming_predicates(id));
}

void CliqueIndex::remove(NodeId id) {
    clique_of(id, CliqueRole::Source).remove_member(id);
    clique_of(id, CliqueRole::Target).remove_member(id);
    index_map.erase(id);
}

void CliqueIndex::replace_member(NodeId old_id, NodeId new_id) {
    if (contains(new_id)) {
        throw ConsistencyError(new_id, "Cannot take over clique slots of " +
                                       std::to_string(old_id) + ", id is already indexed");
    }

    std::array<size_t, 2> slots = {index_of(old_id, CliqueRole::Source),
                                   index_of(old_id, CliqueRole::Target)};
    for (CliqueRole role : {CliqueRole::Source, CliqueRole::Target}) {
        auto& members = clique_of(old_id, role).nodes;
        std::replace(members.begin(), members.end(), old_id, new_id);
    }
    index_map.erase(old_id);
    index_map[new_id] = slots;
}

bool CliqueIndex::refresh(NodeId id, const SummaryGraph& graph) {
    std::vector<NodeId> source_fingerprint = graph.outgoing_predicates(id);
    std::vector<NodeId> target_fingerprint = graph.incoming_predicates(id);

    Clique& source = clique_of(id, CliqueRole::Source);
    Clique& target = clique_of(id, CliqueRole::Target);

    bool source_shared = source.nodes.size() > 1 && source.preds != source_fingerprint;
    bool target_shared = target.nodes.size() > 1 && target.preds != target_fingerprint;
    if (source_shared || target_shared) {
        place(id, source_fingerprint, target_fingerprint);
        return true;
    }

    if (source.nodes.size() == 1) {
        source.preds = std::move(source_fingerprint);
    }
    if (target.nodes.size() == 1) {
        target.preds = std::move(target_fingerprint);
    }
    return false;
}

bool CliqueIndex::validate(std::string& error_message) const {
    for (const auto& [id, slots] : index_map) {
        for (CliqueRole role : {CliqueRole::Source, CliqueRole::Target}) {
            const auto& list = cliques(role);
            size_t index = slots[static_cast<size_t>(role)];
            if (index >= list.size() || !list[index].has_member(id)) {
                error_message = "Id " + std::to_string(id) + " is not a member of its " +
                                clique_role_to_string(role) + " clique " + std::to_string(index);
                return false;
            }
        }
    }

    for (CliqueRole role : {CliqueRole::Source, CliqueRole::Target}) {
        const auto& list = cliques(role);
        for (size_t i = 0; i < list.size(); ++i) {
            for (NodeId id : list[i].nodes) {
                auto it = index_map.find(id);
                if (it == index_map.end() || it->second[static_cast<size_t>(role)] != i) {
                    error_message = clique_role_to_string(role) + " clique " + std::to_string(i) +
                                    " lists " + std::to_string(id) +
                                    " but the index map disagrees";
                    return false;
                }
            }
        }
    }

    return true;
}

nlohmann::json CliqueIndex::to_json() const {
    nlohmann::json j;

    nlohmann::json sources = nlohmann::json::array();
    for (const auto& clique : source_cliques) {
        sources.push_back(clique.to_json());
    }
    j["source_cliques"] = sources;

    nlohmann::json targets = nlohmann::json::array();
    for (const auto& clique : target_cliques) {
        targets.push_back(clique.to_json());
    }
    j["target_cliques"] = targets;

    nlohmann::json map_json = nlohmann::json::object();
    for (const auto& [id, slots] : index_map) {
        map_json[std::to_string(id)] = {slots[0], slots[1]};
    }
    j["index_map"] = map_json;

    return j;
}

void CliqueIndex::print_summary() const {
    auto non_empty = [](const std::vector<Clique>& list) {
        return std::count_if(list.begin(), list.end(),
                             [](const Clique& c) { return !c.nodes.empty(); });
    };

    std::cout << "Clique index:\n";
    std::cout << "  Source cliques: " << non_empty(source_cliques)
              << " (" << source_cliques.size() << " slots)\n";
    std::cout << "  Target cliques: " << non_empty(target_cliques)
              << " (" << target_cliques.size() << " slots)\n";
    std::cout << "  Indexed ids: " << index_map.size() << "\n";
}

} // namespace isum
