#pragma once

#include "graph/triple.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace isum {

/**
 * @brief Two-way mapping between RDF terms and integer ids
 *
 * Ids are handed out densely in order of first appearance, starting at 0.
 * Subjects, predicates and objects share one id space with the supernodes
 * of a summary, so reserve_through() must be called with the largest
 * supernode id before new terms are added.
 */
class Dictionary {
public:
    Dictionary() = default;

    /**
     * @brief Id of `term`, assigning the next free id if unseen
     */
    NodeId get_or_insert(const std::string& term);

    std::optional<NodeId> id_of(const std::string& term) const;
    std::optional<std::string> term_of(NodeId id) const;

    bool contains(const std::string& term) const { return ids_.count(term) > 0; }
    size_t size() const { return ids_.size(); }
    NodeId next_id() const { return next_id_; }

    /**
     * @brief Never hand out ids at or below `id` from now on
     */
    void reserve_through(NodeId id);

    nlohmann::json to_json() const;
    void save_to_json(const std::string& filename) const;
    static Dictionary from_json(const nlohmann::json& j);

private:
    std::unordered_map<std::string, NodeId> ids_;
    std::map<NodeId, std::string> terms_;
    NodeId next_id_ = 0;
};

} // namespace isum
