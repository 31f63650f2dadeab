#include "parser/dictionary.hpp"
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace isum {

namespace {

NodeId id_from_json(const nlohmann::json& j, const std::string& what) {
    if (!j.is_number_unsigned()) {
        throw std::runtime_error("Expected unsigned integer for dictionary " + what +
                                 ", got: " + j.dump());
    }
    uint64_t value = j.get<uint64_t>();
    if (value > std::numeric_limits<NodeId>::max()) {
        throw std::runtime_error("Dictionary " + what + " out of range: " + j.dump());
    }
    return static_cast<NodeId>(value);
}

} // namespace

NodeId Dictionary::get_or_insert(const std::string& term) {
    auto it = ids_.find(term);
    if (it != ids_.end()) {
        return it->second;
    }

    if (next_id_ == std::numeric_limits<NodeId>::max()) {
        throw std::runtime_error("Dictionary id space exhausted at term: " + term);
    }
    NodeId id = next_id_++;
    ids_.emplace(term, id);
    terms_.emplace(id, term);
    return id;
}

std::optional<NodeId> Dictionary::id_of(const std::string& term) const {
    auto it = ids_.find(term);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> Dictionary::term_of(NodeId id) const {
    auto it = terms_.find(id);
    if (it == terms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Dictionary::reserve_through(NodeId id) {
    if (id == std::numeric_limits<NodeId>::max()) {
        throw std::runtime_error("No ids left above " + std::to_string(id));
    }
    if (id >= next_id_) {
        next_id_ = id + 1;
    }
}

nlohmann::json Dictionary::to_json() const {
    nlohmann::json j;
    j["next_id"] = next_id_;

    nlohmann::json terms = nlohmann::json::array();
    for (const auto& [id, term] : terms_) {
        terms.push_back({{"id", id}, {"term", term}});
    }
    j["terms"] = terms;
    return j;
}

void Dictionary::save_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

Dictionary Dictionary::from_json(const nlohmann::json& j) {
    Dictionary dict;

    for (const auto& entry : j.at("terms")) {
        NodeId id = id_from_json(entry.at("id"), "id");
        std::string term = entry.at("term").get<std::string>();
        if (dict.ids_.count(term) > 0 || dict.terms_.count(id) > 0) {
            throw std::runtime_error("Duplicate dictionary entry: " + std::to_string(id) +
                                     " " + term);
        }
        dict.ids_.emplace(term, id);
        dict.terms_.emplace(id, std::move(term));
        dict.reserve_through(id);
    }

    if (j.contains("next_id")) {
        NodeId next = id_from_json(j["next_id"], "next_id");
        if (next > dict.next_id_) {
            dict.next_id_ = next;
        }
    }

    return dict;
}

} // namespace isum
