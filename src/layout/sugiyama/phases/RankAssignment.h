#pragma once

#include "strata/layout/api/IRankAssignment.h"
#include "strata/core/Types.h"

#include <memory>
#include <vector>

namespace strata {
namespace algorithms {

/// Longest-path rank assignment
///
/// Breadth-first from the root nodes: every node ends up one level below its
/// deepest parent. Nodes the sweep never reaches are placed on level 0.
class LongestPathRankAssignment : public IRankAssignment {
public:
    LongestPathRankAssignment() = default;

    const char* algorithmName() const override { return "LongestPath"; }

    void assignRanks(LayoutContext& ctx, const LayoutOptions& options) const override;

    /// Explicit roots that exist in the graph; otherwise every node without
    /// parents; otherwise the first node with the highest out-degree.
    static std::vector<NodeId> findRootNodes(const LayoutContext& ctx,
                                             const LayoutOptions& options);

protected:
    /// Set LayoutNode::level without touching ctx.levels
    void computeLongestPath(LayoutContext& ctx, const LayoutOptions& options) const;
};

/// Longest-path followed by median tightening
///
/// Each pass moves a node to the upper median of {parent + 1} and
/// {child - 1} when that keeps all parents above and all children below it.
/// Stops after a pass without moves or after tightTreeMaxIterations passes.
class TightTreeRankAssignment : public LongestPathRankAssignment {
public:
    const char* algorithmName() const override { return "TightTree"; }

    void assignRanks(LayoutContext& ctx, const LayoutOptions& options) const override;

    /// Number of passes that moved at least one node
    int tighten(LayoutContext& ctx, int maxIterations) const;

private:
    int idealRank(const LayoutContext& ctx, NodeId node) const;
    bool canMoveToRank(const LayoutContext& ctx, NodeId node, int rank) const;
};

/// Network simplex approximated by tight-tree ranking
class NetworkSimplexRankAssignment : public TightTreeRankAssignment {
public:
    const char* algorithmName() const override { return "NetworkSimplex"; }
};

/// Strategy instance for a ranking selector
std::unique_ptr<IRankAssignment> makeRankAssignment(RankingAlgorithm algorithm);

}  // namespace algorithms
}  // namespace strata
