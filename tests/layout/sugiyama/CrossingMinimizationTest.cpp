#include <gtest/gtest.h>
#include <strata/layout/LayoutContext.h>
#include "layout/sugiyama/phases/CrossingMinimization.h"
#include "layout/sugiyama/phases/DummyNodeInsertion.h"
#include "layout/sugiyama/phases/RankAssignment.h"

using namespace strata;
using namespace strata::algorithms;

namespace {

LayoutContext layeredContext(const std::vector<std::string>& nodes,
                             const std::vector<std::pair<std::string, std::string>>& edges) {
    GraphData graph;
    for (const auto& id : nodes) {
        graph.addNode(id);
    }
    for (const auto& [from, to] : edges) {
        graph.addEdge(from + to, from, to);
    }
    LayoutContext ctx = LayoutContext::fromGraph(graph);
    LongestPathRankAssignment().assignRanks(ctx, LayoutOptions{});
    DummyNodeInsertion::insert(ctx);
    return ctx;
}

// Level 0: [a, b], level 1: [c, d], arcs a->d and b->c cross once
LayoutContext crossedPair() {
    return layeredContext({"a", "b", "c", "d"}, {{"a", "d"}, {"b", "c"}});
}

// Children listed so that the insertion order of level 2 interleaves subtrees
LayoutContext interleavedTree() {
    return layeredContext({"r", "x", "y", "y1", "x1", "y2", "x2"},
                          {{"r", "x"}, {"r", "y"}, {"x", "x1"}, {"x", "x2"},
                           {"y", "y1"}, {"y", "y2"}});
}

void expectOrdersMatchLevels(const LayoutContext& ctx) {
    for (const auto& [key, level] : ctx.levels) {
        for (size_t i = 0; i < level.nodes.size(); ++i) {
            EXPECT_EQ(ctx.nodes[level.nodes[i]].order, static_cast<int>(i));
        }
    }
}

}  // namespace

// --- Counting ---

TEST(CrossingMinimizationTest, CountCrossings_SingleInversion) {
    auto ctx = crossedPair();
    LayerSweepCrossingMinimization minimizer;

    EXPECT_EQ(minimizer.countCrossings(ctx, 0, 1), 1);
    EXPECT_EQ(minimizer.countTotalCrossings(ctx), 1);
}

TEST(CrossingMinimizationTest, CountCrossings_InterleavedSubtrees) {
    auto ctx = interleavedTree();
    LayerSweepCrossingMinimization minimizer;

    EXPECT_EQ(minimizer.countCrossings(ctx, 1, 2), 3);
}

TEST(CrossingMinimizationTest, CountCrossings_SharedEndpointsDoNotCross) {
    auto ctx = layeredContext({"a", "b", "c"}, {{"a", "b"}, {"a", "c"}});
    LayerSweepCrossingMinimization minimizer;

    EXPECT_EQ(minimizer.countTotalCrossings(ctx), 0);
}

// --- Minimization ---

TEST(CrossingMinimizationTest, Barycenter_RemovesSingleCrossing) {
    auto ctx = crossedPair();
    LayerSweepCrossingMinimization minimizer;

    auto result = minimizer.minimize(ctx, CrossingMinimization::Barycenter, 24);

    EXPECT_EQ(result.initialCrossings, 1);
    EXPECT_EQ(result.crossingCount, 0);
    EXPECT_EQ(result.bestIteration, 0);
    EXPECT_EQ(minimizer.countTotalCrossings(ctx), 0);
    EXPECT_EQ(ctx.levels[1].nodes, std::vector<NodeId>({3, 2}));
    expectOrdersMatchLevels(ctx);
}

TEST(CrossingMinimizationTest, Median_RemovesSingleCrossing) {
    auto ctx = crossedPair();
    LayerSweepCrossingMinimization minimizer;

    auto result = minimizer.minimize(ctx, CrossingMinimization::Median, 24);

    EXPECT_EQ(result.crossingCount, 0);
    expectOrdersMatchLevels(ctx);
}

TEST(CrossingMinimizationTest, Barycenter_GroupsSubtrees) {
    auto ctx = interleavedTree();
    LayerSweepCrossingMinimization minimizer;

    auto result = minimizer.minimize(ctx, CrossingMinimization::Barycenter, 24);

    EXPECT_EQ(result.initialCrossings, 3);
    EXPECT_EQ(result.crossingCount, 0);
    EXPECT_EQ(minimizer.countTotalCrossings(ctx), 0);
    expectOrdersMatchLevels(ctx);
}

TEST(CrossingMinimizationTest, None_KeepsInsertionOrder) {
    auto ctx = crossedPair();
    LayerSweepCrossingMinimization minimizer;

    auto result = minimizer.minimize(ctx, CrossingMinimization::None, 24);

    EXPECT_EQ(result.crossingCount, 1);
    EXPECT_EQ(ctx.levels[1].nodes, std::vector<NodeId>({2, 3}));
}

TEST(CrossingMinimizationTest, ZeroIterations_ReportsInitialCount) {
    auto ctx = crossedPair();
    LayerSweepCrossingMinimization minimizer;

    auto result = minimizer.minimize(ctx, CrossingMinimization::Barycenter, 0);

    EXPECT_EQ(result.crossingCount, 1);
    EXPECT_EQ(result.bestIteration, -1);
}

TEST(CrossingMinimizationTest, NeverWorseThanInitialOrder) {
    auto ctx = layeredContext({"a", "b", "c", "d", "e", "f", "g"},
                              {{"a", "e"}, {"a", "f"}, {"b", "d"}, {"b", "g"},
                               {"c", "d"}, {"c", "e"}, {"a", "g"}});
    LayerSweepCrossingMinimization minimizer;
    int before = minimizer.countTotalCrossings(ctx);

    auto result = minimizer.minimize(ctx, CrossingMinimization::Median, 24);

    EXPECT_LE(result.crossingCount, before);
    EXPECT_EQ(result.crossingCount, minimizer.countTotalCrossings(ctx));
    expectOrdersMatchLevels(ctx);
}

TEST(CrossingMinimizationTest, NodeWithoutNeighborsKeepsItsSlot) {
    // Level 1 is [c, d, e]; e has no parent and keeps position 2
    auto ctx = layeredContext({"a", "b", "c", "d", "e"}, {{"a", "d"}, {"b", "c"}});
    LayerSweepCrossingMinimization minimizer;
    ctx.nodes[4].level = 1;
    ctx.buildLevels();

    auto result = minimizer.minimize(ctx, CrossingMinimization::Barycenter, 1);

    EXPECT_EQ(result.crossingCount, 0);
    EXPECT_EQ(ctx.levels[1].nodes, std::vector<NodeId>({3, 2, 4}));
    expectOrdersMatchLevels(ctx);
}
