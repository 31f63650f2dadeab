#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace isum {

/**
 * @brief Raised when a graph or clique contract is broken
 *
 * Covers adding an id that already exists, detaching a node without a
 * parent, collapsing a non-singleton supernode and looking up ids that are
 * absent from the model. Continuing after one of these would corrupt the
 * cluster partition, so callers must not retry.
 */
class ConsistencyError : public std::logic_error {
public:
    ConsistencyError(uint32_t id, const std::string& message)
        : std::logic_error(message + " (id " + std::to_string(id) + ")"), id_(id) {}

    uint32_t id() const { return id_; }

private:
    uint32_t id_;
};

/**
 * @brief Raised when a snapshot file cannot be turned back into a graph
 */
class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace isum
