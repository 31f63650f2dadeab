#pragma once

#include <cstdint>
#include <vector>

namespace isum {

// Nodes, supernodes and predicates share one id space
using NodeId = uint32_t;

/**
 * @brief An integer-encoded subject-predicate-object fact
 */
struct Triple {
    NodeId sub = 0;
    NodeId pred = 0;
    NodeId obj = 0;

    Triple() = default;
    Triple(NodeId sub, NodeId pred, NodeId obj)
        : sub(sub), pred(pred), obj(obj) {}

    bool operator==(const Triple& other) const {
        return sub == other.sub && pred == other.pred && obj == other.obj;
    }
    bool operator!=(const Triple& other) const { return !(*this == other); }
};

/**
 * @brief One entry of a node's edge list: (predicate, other endpoint)
 *
 * For an outgoing entry `other` is the object, for an incoming entry it is
 * the subject.
 */
struct Edge {
    NodeId pred = 0;
    NodeId other = 0;

    Edge() = default;
    Edge(NodeId pred, NodeId other) : pred(pred), other(other) {}

    bool operator==(const Edge& rhs) const {
        return pred == rhs.pred && other == rhs.other;
    }
    bool operator!=(const Edge& rhs) const { return !(*this == rhs); }
    bool operator<(const Edge& rhs) const {
        return pred != rhs.pred ? pred < rhs.pred : other < rhs.other;
    }
};

using EdgeList = std::vector<Edge>;

} // namespace isum
