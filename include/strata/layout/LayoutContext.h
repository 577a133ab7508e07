#pragma once

#include "../core/GraphData.h"
#include "../core/Types.h"

#include <any>
#include <map>
#include <optional>
#include <string>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace strata {

/// Node of the working graph. Real nodes come from the input, dummy nodes are
/// inserted for edges spanning several levels.
struct LayoutNode {
    std::string id;
    int level = -1;               ///< Rank, -1 until assigned
    int order = -1;               ///< Index within its level, -1 until ordered
    bool isDummy = false;
    std::string originalEdgeId;   ///< Edge a dummy node belongs to
    Point position;
};

/// Edge of the working graph
struct LayoutEdge {
    std::string id;
    NodeId source = INVALID_NODE;
    NodeId target = INVALID_NODE;
    std::string label;
    std::any userData;

    bool reversed = false;              ///< source/target swapped to break a cycle
    std::vector<NodeId> dummyNodes;     ///< Lower level first
    std::vector<Point> controlPoints;   ///< Filled by edge routing
};

/// Nodes sharing one rank
struct Level {
    std::vector<NodeId> nodes;   ///< Ordered; nodes[i].order == i once ordered
    float coordinate = 0.0f;     ///< Position along the primary axis
};

/// All state of one layout computation.
///
/// Built from the input by fromGraph() and handed by reference to each phase
/// in turn. Nothing in it outlives the call that created it.
///
/// Adjacency lists are sets with insertion order: an arc appears at most once
/// even when several edges connect the same pair of nodes. Arcs must be
/// changed through addArc()/removeArc() so the membership index stays in step.
struct LayoutContext {
    std::vector<LayoutNode> nodes;
    std::vector<LayoutEdge> edges;
    std::vector<std::vector<NodeId>> adjacency;         ///< node -> children
    std::vector<std::vector<NodeId>> reverseAdjacency;  ///< node -> parents
    std::map<int, Level> levels;

    /// Ingest a raw graph: dangling edges and self-loops are dropped,
    /// duplicate ids collapse onto their first slot.
    static LayoutContext fromGraph(const GraphData& graph);

    std::optional<NodeId> findNode(const std::string& id) const;

    /// Add arc from -> to; returns false if it already existed
    bool addArc(NodeId from, NodeId to);
    void removeArc(NodeId from, NodeId to);
    bool hasArc(NodeId from, NodeId to) const;

    /// Append a routing node on `level`. The node is not connected.
    NodeId addDummyNode(const std::string& id, int level, const std::string& originalEdgeId);

    /// Group nodes into levels by their `level`, in node order, and number
    /// each level's nodes 0..n-1
    void buildLevels();

    /// Level keys in ascending (or descending) order
    std::vector<int> sortedLevelKeys(bool descending = false) const;

    size_t nodeCount() const { return nodes.size(); }
    size_t realNodeCount() const { return realNodeCount_; }
    size_t dummyNodeCount() const { return nodes.size() - realNodeCount_; }

private:
    static uint64_t arcKey(NodeId from, NodeId to) {
        return (static_cast<uint64_t>(from) << 32) | to;
    }

    std::unordered_map<std::string, NodeId> nodeIndex_;
    std::unordered_set<uint64_t> arcs_;
    size_t realNodeCount_ = 0;
};

}  // namespace strata
