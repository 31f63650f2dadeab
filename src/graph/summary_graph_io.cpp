#include "graph/summary_graph.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <set>

namespace isum {

namespace {

nlohmann::json edges_to_json(const EdgeList& edges) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& edge : edges) {
        arr.push_back({edge.pred, edge.other});
    }
    return arr;
}

NodeId id_from_json(const nlohmann::json& j, const std::string& what) {
    if (!j.is_number_unsigned()) {
        throw SnapshotError("Expected unsigned integer for " + what + ", got: " + j.dump());
    }
    uint64_t value = j.get<uint64_t>();
    if (value > std::numeric_limits<NodeId>::max()) {
        throw SnapshotError("Id out of range for " + what + ": " + j.dump());
    }
    return static_cast<NodeId>(value);
}

EdgeList edges_from_json(const nlohmann::json& j, NodeId owner) {
    if (!j.is_array()) {
        throw SnapshotError("Edge list of node " + std::to_string(owner) + " is not an array");
    }

    EdgeList edges;
    edges.reserve(j.size());
    for (const auto& pair : j) {
        if (!pair.is_array() || pair.size() != 2) {
            throw SnapshotError("Malformed edge of node " + std::to_string(owner) + ": " +
                                pair.dump());
        }
        edges.emplace_back(id_from_json(pair[0], "edge predicate"),
                           id_from_json(pair[1], "edge endpoint"));
    }
    return edges;
}

} // namespace

// ==========================================
// SummaryStatistics
// ==========================================

nlohmann::json SummaryStatistics::to_json() const {
    nlohmann::json j;
    j["num_nodes"] = num_nodes;
    j["num_supernodes"] = num_supernodes;
    j["num_clustered_nodes"] = num_clustered_nodes;
    j["num_top_level"] = num_top_level;
    j["num_edges"] = num_edges;
    j["max_supernode_size"] = max_supernode_size;
    j["min_supernode_size"] = min_supernode_size;
    j["avg_supernode_size"] = avg_supernode_size;
    j["compression_ratio"] = compression_ratio;
    return j;
}

void SummaryStatistics::print_summary() const {
    std::cout << "Summary graph:\n";
    std::cout << "  Nodes: " << num_nodes << " (" << num_clustered_nodes << " clustered)\n";
    std::cout << "  Supernodes: " << num_supernodes << "\n";
    if (num_supernodes > 0) {
        std::cout << "  Supernode size: min " << min_supernode_size
                  << ", max " << max_supernode_size
                  << ", avg " << avg_supernode_size << "\n";
    }
    std::cout << "  Facts: " << num_edges << "\n";
    std::cout << "  Top-level entities: " << num_top_level
              << " (ratio " << compression_ratio << ")\n";
}

// ==========================================
// Export/Import Methods
// ==========================================

nlohmann::json SummaryGraph::to_json() const {
    nlohmann::json j;

    nlohmann::json snodes_json = nlohmann::json::array();
    for (const auto& [id, list] : supernodes_) {
        snodes_json.push_back({{"id", id}, {"members", list}});
    }
    j["supernodes"] = snodes_json;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& [id, info] : nodes_) {
        nlohmann::json node_json;
        node_json["id"] = id;
        if (info.parent) {
            node_json["parent"] = *info.parent;
        } else {
            node_json["parent"] = nullptr;
        }
        node_json["incoming"] = edges_to_json(info.incoming);
        node_json["outgoing"] = edges_to_json(info.outgoing);
        nodes_json.push_back(node_json);
    }
    j["nodes"] = nodes_json;

    j["metadata"] = {
        {"num_nodes", nodes_.size()},
        {"num_supernodes", supernodes_.size()}
    };

    return j;
}

void SummaryGraph::save_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << to_json().dump(2);
    file.close();
}

SummaryGraph SummaryGraph::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("supernodes") || !j.contains("nodes")) {
        throw SnapshotError("Snapshot must contain 'supernodes' and 'nodes'");
    }
    if (!j["supernodes"].is_array() || !j["nodes"].is_array()) {
        throw SnapshotError("Snapshot 'supernodes' and 'nodes' must be arrays");
    }

    std::map<NodeId, std::vector<NodeId>> supernodes;
    std::map<NodeId, NodeInfo> nodes;
    std::set<NodeId> seen;

    for (const auto& record : j["supernodes"]) {
        if (!record.is_object() || !record.contains("id") || !record.contains("members")) {
            throw SnapshotError("Malformed supernode record: " + record.dump());
        }
        NodeId id = id_from_json(record["id"], "supernode id");
        if (!seen.insert(id).second) {
            throw SnapshotError("Duplicate id in snapshot: " + std::to_string(id));
        }
        if (!record["members"].is_array()) {
            throw SnapshotError("Members of supernode " + std::to_string(id) + " are not an array");
        }

        std::vector<NodeId> list;
        for (const auto& member : record["members"]) {
            list.push_back(id_from_json(member, "supernode member"));
        }
        supernodes.emplace(id, std::move(list));
    }

    for (const auto& record : j["nodes"]) {
        if (!record.is_object() || !record.contains("id")) {
            throw SnapshotError("Malformed node record: " + record.dump());
        }
        NodeId id = id_from_json(record["id"], "node id");
        if (!seen.insert(id).second) {
            throw SnapshotError("Duplicate id in snapshot: " + std::to_string(id));
        }

        NodeInfo info;
        if (record.contains("parent") && !record["parent"].is_null()) {
            info.parent = id_from_json(record["parent"], "parent");
        }
        if (record.contains("incoming")) {
            info.incoming = edges_from_json(record["incoming"], id);
        }
        if (record.contains("outgoing")) {
            info.outgoing = edges_from_json(record["outgoing"], id);
        }
        nodes.emplace(id, std::move(info));
    }

    SummaryGraph graph(std::move(supernodes), std::move(nodes));

    std::string error;
    if (!graph.validate(error)) {
        throw SnapshotError("Snapshot violates graph invariants: " + error);
    }

    return graph;
}

SummaryGraph SummaryGraph::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw SnapshotError("Failed to parse snapshot " + filename + ": " + e.what());
    }

    return from_json(j);
}

} // namespace isum
