#include "strata/layout/LayoutContext.h"
#include "strata/common/Logger.h"

#include <algorithm>

namespace strata {

LayoutContext LayoutContext::fromGraph(const GraphData& graph) {
    LayoutContext ctx;
    ctx.nodes.reserve(graph.nodeCount());

    for (const NodeData& data : graph.nodes()) {
        if (ctx.nodeIndex_.count(data.id) > 0) {
            LOG_WARN("Duplicate node id '{}' merged into its first occurrence", data.id);
            continue;
        }
        LayoutNode node;
        node.id = data.id;
        ctx.nodeIndex_[data.id] = static_cast<NodeId>(ctx.nodes.size());
        ctx.nodes.push_back(std::move(node));
    }
    ctx.realNodeCount_ = ctx.nodes.size();

    std::unordered_map<std::string, EdgeId> edgeIndex;
    size_t dropped = 0;

    for (const EdgeData& data : graph.edges()) {
        const std::string& sourceId = endpointId(data.source);
        const std::string& targetId = endpointId(data.target);

        auto source = ctx.findNode(sourceId);
        auto target = ctx.findNode(targetId);
        if (!source || !target || *source == *target) {
            LOG_DEBUG("Dropping edge '{}' ({} -> {})", data.id, sourceId, targetId);
            ++dropped;
            continue;
        }

        LayoutEdge edge;
        edge.id = data.id;
        edge.source = *source;
        edge.target = *target;
        edge.label = data.label;
        edge.userData = data.userData;

        auto it = edgeIndex.find(data.id);
        if (it != edgeIndex.end()) {
            LOG_WARN("Duplicate edge id '{}', later definition wins", data.id);
            ctx.edges[it->second] = std::move(edge);
            continue;
        }
        edgeIndex[data.id] = static_cast<EdgeId>(ctx.edges.size());
        ctx.edges.push_back(std::move(edge));
    }

    ctx.adjacency.assign(ctx.nodes.size(), {});
    ctx.arcs_.reserve(ctx.edges.size());
    ctx.reverseAdjacency.assign(ctx.nodes.size(), {});
    for (const LayoutEdge& edge : ctx.edges) {
        ctx.addArc(edge.source, edge.target);
    }

    LOG_DEBUG("Ingested {} nodes, {} edges ({} dropped)",
              ctx.nodes.size(), ctx.edges.size(), dropped);
    return ctx;
}

std::optional<NodeId> LayoutContext::findNode(const std::string& id) const {
    auto it = nodeIndex_.find(id);
    if (it == nodeIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LayoutContext::addArc(NodeId from, NodeId to) {
    if (!arcs_.insert(arcKey(from, to)).second) {
        return false;
    }
    adjacency[from].push_back(to);
    reverseAdjacency[to].push_back(from);
    return true;
}

void LayoutContext::removeArc(NodeId from, NodeId to) {
    if (arcs_.erase(arcKey(from, to)) == 0) {
        return;
    }

    auto& children = adjacency[from];
    children.erase(std::remove(children.begin(), children.end(), to), children.end());

    auto& parents = reverseAdjacency[to];
    parents.erase(std::remove(parents.begin(), parents.end(), from), parents.end());
}

bool LayoutContext::hasArc(NodeId from, NodeId to) const {
    return arcs_.count(arcKey(from, to)) > 0;
}

NodeId LayoutContext::addDummyNode(const std::string& id, int level,
                                   const std::string& originalEdgeId) {
    NodeId dummyId = static_cast<NodeId>(nodes.size());

    LayoutNode dummy;
    dummy.id = id;
    dummy.level = level;
    dummy.isDummy = true;
    dummy.originalEdgeId = originalEdgeId;
    nodes.push_back(std::move(dummy));

    adjacency.emplace_back();
    reverseAdjacency.emplace_back();

    Level& target = levels[level];
    nodes[dummyId].order = static_cast<int>(target.nodes.size());
    target.nodes.push_back(dummyId);

    return dummyId;
}

void LayoutContext::buildLevels() {
    levels.clear();

    for (NodeId id = 0; id < nodes.size(); ++id) {
        levels[nodes[id].level].nodes.push_back(id);
    }

    for (auto& [key, level] : levels) {
        for (size_t i = 0; i < level.nodes.size(); ++i) {
            nodes[level.nodes[i]].order = static_cast<int>(i);
        }
    }
}

std::vector<int> LayoutContext::sortedLevelKeys(bool descending) const {
    std::vector<int> keys;
    keys.reserve(levels.size());
    for (const auto& [key, level] : levels) {
        keys.push_back(key);
    }
    if (descending) {
        std::reverse(keys.begin(), keys.end());
    }
    return keys;
}

}  // namespace strata
