#include "RankAssignment.h"
#include "strata/layout/LayoutContext.h"
#include "strata/common/Logger.h"

#include <algorithm>
#include <deque>

namespace strata {
namespace algorithms {

// =============================================================================
// LongestPathRankAssignment
// =============================================================================

std::vector<NodeId> LongestPathRankAssignment::findRootNodes(
    const LayoutContext& ctx, const LayoutOptions& options) {

    std::vector<NodeId> roots;

    if (!options.rootNodes.empty()) {
        for (const std::string& id : options.rootNodes) {
            if (auto node = ctx.findNode(id)) {
                roots.push_back(*node);
            }
        }
        return roots;
    }

    for (NodeId id = 0; id < ctx.nodeCount(); ++id) {
        if (ctx.reverseAdjacency[id].empty()) {
            roots.push_back(id);
        }
    }

    if (roots.empty() && ctx.nodeCount() > 0) {
        NodeId best = 0;
        for (NodeId id = 1; id < ctx.nodeCount(); ++id) {
            if (ctx.adjacency[id].size() > ctx.adjacency[best].size()) {
                best = id;
            }
        }
        roots.push_back(best);
    }

    return roots;
}

void LongestPathRankAssignment::computeLongestPath(
    LayoutContext& ctx, const LayoutOptions& options) const {

    std::vector<int> ranks(ctx.nodeCount(), -1);
    std::deque<std::pair<NodeId, int>> queue;

    for (NodeId root : findRootNodes(ctx, options)) {
        if (ranks[root] == -1) {
            ranks[root] = 0;
            queue.emplace_back(root, 0);
        }
    }

    while (!queue.empty()) {
        auto [node, rank] = queue.front();
        queue.pop_front();

        // A later entry raised this node already
        if (rank < ranks[node]) {
            continue;
        }

        for (NodeId child : ctx.adjacency[node]) {
            int newRank = rank + 1;
            if (newRank > ranks[child]) {
                ranks[child] = newRank;
                queue.emplace_back(child, newRank);
            }
        }
    }

    size_t unreached = 0;
    for (NodeId id = 0; id < ctx.nodeCount(); ++id) {
        if (ranks[id] == -1) {
            ranks[id] = 0;
            ++unreached;
        }
        ctx.nodes[id].level = ranks[id];
    }

    if (unreached > 0) {
        LOG_DEBUG("{} nodes unreachable from roots placed on level 0", unreached);
    }
}

void LongestPathRankAssignment::assignRanks(LayoutContext& ctx,
                                            const LayoutOptions& options) const {
    computeLongestPath(ctx, options);
    ctx.buildLevels();
}

// =============================================================================
// TightTreeRankAssignment
// =============================================================================

void TightTreeRankAssignment::assignRanks(LayoutContext& ctx,
                                          const LayoutOptions& options) const {
    computeLongestPath(ctx, options);
    int passes = tighten(ctx, options.tightTreeMaxIterations);
    LOG_DEBUG("Rank tightening moved nodes in {} passes", passes);
    ctx.buildLevels();
}

int TightTreeRankAssignment::tighten(LayoutContext& ctx, int maxIterations) const {
    int passes = 0;

    for (int iteration = 0; iteration < maxIterations; ++iteration) {
        bool moved = false;

        for (NodeId id = 0; id < ctx.nodeCount(); ++id) {
            int rank = idealRank(ctx, id);
            if (rank != ctx.nodes[id].level && canMoveToRank(ctx, id, rank)) {
                ctx.nodes[id].level = rank;
                moved = true;
            }
        }

        if (!moved) {
            break;
        }
        ++passes;
    }

    return passes;
}

int TightTreeRankAssignment::idealRank(const LayoutContext& ctx, NodeId node) const {
    const auto& parents = ctx.reverseAdjacency[node];
    const auto& children = ctx.adjacency[node];

    if (parents.empty() && children.empty()) {
        return ctx.nodes[node].level;
    }

    std::vector<int> candidates;
    candidates.reserve(parents.size() + children.size());
    for (NodeId parent : parents) {
        candidates.push_back(ctx.nodes[parent].level + 1);
    }
    for (NodeId child : children) {
        candidates.push_back(ctx.nodes[child].level - 1);
    }

    std::sort(candidates.begin(), candidates.end());
    return candidates[candidates.size() / 2];
}

bool TightTreeRankAssignment::canMoveToRank(const LayoutContext& ctx, NodeId node,
                                            int rank) const {
    if (rank < 0) {
        return false;
    }
    for (NodeId parent : ctx.reverseAdjacency[node]) {
        if (ctx.nodes[parent].level >= rank) {
            return false;
        }
    }
    for (NodeId child : ctx.adjacency[node]) {
        if (ctx.nodes[child].level <= rank) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<IRankAssignment> makeRankAssignment(RankingAlgorithm algorithm) {
    switch (algorithm) {
        case RankingAlgorithm::TightTree:
            return std::make_unique<TightTreeRankAssignment>();
        case RankingAlgorithm::NetworkSimplex:
            return std::make_unique<NetworkSimplexRankAssignment>();
        case RankingAlgorithm::LongestPath:
        default:
            return std::make_unique<LongestPathRankAssignment>();
    }
}

}  // namespace algorithms
}  // namespace strata
