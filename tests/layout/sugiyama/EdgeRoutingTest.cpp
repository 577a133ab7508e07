#include <gtest/gtest.h>
#include <strata/layout/LayoutContext.h>
#include "layout/sugiyama/phases/CoordinateAssignment.h"
#include "layout/sugiyama/phases/CycleRemoval.h"
#include "layout/sugiyama/phases/DummyNodeInsertion.h"
#include "layout/sugiyama/phases/RankAssignment.h"
#include "layout/sugiyama/routing/EdgeRouting.h"

#include <cmath>
#include <stdexcept>

using namespace strata;
using namespace strata::algorithms;

namespace {

LayoutContext placedContext(const std::vector<std::string>& nodes,
                            const std::vector<std::pair<std::string, std::string>>& edges) {
    GraphData graph;
    for (const auto& id : nodes) {
        graph.addNode(id);
    }
    for (const auto& [from, to] : edges) {
        graph.addEdge(from + to, from, to);
    }
    LayoutContext ctx = LayoutContext::fromGraph(graph);
    DfsCycleRemoval().removeCycles(ctx);
    LongestPathRankAssignment().assignRanks(ctx, LayoutOptions{});
    DummyNodeInsertion::insert(ctx);
    SimpleCoordinateAssignment().assign(ctx, LayoutOptions{});
    return ctx;
}

const LayoutEdge& edgeById(const LayoutContext& ctx, const std::string& id) {
    for (const auto& edge : ctx.edges) {
        if (edge.id == id) return edge;
    }
    throw std::out_of_range(id);
}

}  // namespace

TEST(EdgeRoutingTest, ShortEdge_TwoControlPoints) {
    auto ctx = placedContext({"a", "b"}, {{"a", "b"}});

    EdgeRouting::route(ctx);

    const LayoutEdge& edge = edgeById(ctx, "ab");
    ASSERT_EQ(edge.controlPoints.size(), 2u);
    EXPECT_EQ(edge.controlPoints.front(), ctx.nodes[edge.source].position);
    EXPECT_EQ(edge.controlPoints.back(), ctx.nodes[edge.target].position);
}

TEST(EdgeRoutingTest, LongEdge_PassesThroughDummies) {
    auto ctx = placedContext({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"a", "c"}});

    EdgeRouting::route(ctx);

    const LayoutEdge& edge = edgeById(ctx, "ac");
    ASSERT_EQ(edge.dummyNodes.size(), 1u);
    ASSERT_EQ(edge.controlPoints.size(), 3u);
    EXPECT_EQ(edge.controlPoints[0], ctx.nodes[edge.source].position);
    EXPECT_EQ(edge.controlPoints[1], ctx.nodes[edge.dummyNodes[0]].position);
    EXPECT_EQ(edge.controlPoints[2], ctx.nodes[edge.target].position);
}

TEST(EdgeRoutingTest, ReversedEdge_RoutedInLayoutDirection) {
    auto ctx = placedContext({"a", "b"}, {{"a", "b"}, {"b", "a"}});

    EdgeRouting::route(ctx);

    const LayoutEdge& edge = edgeById(ctx, "ba");
    ASSERT_TRUE(edge.reversed);
    EXPECT_EQ(edge.controlPoints.front(), ctx.nodes[ctx.findNode("a").value()].position);
    EXPECT_EQ(edge.controlPoints.back(), ctx.nodes[ctx.findNode("b").value()].position);
}

TEST(EdgeRoutingTest, RouteTwice_DoesNotAccumulatePoints) {
    auto ctx = placedContext({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"a", "c"}});

    EdgeRouting::route(ctx);
    EdgeRouting::route(ctx);

    EXPECT_EQ(edgeById(ctx, "ab").controlPoints.size(), 2u);
    EXPECT_EQ(edgeById(ctx, "ac").controlPoints.size(), 3u);
}

TEST(EdgeRoutingTest, TotalLength_SumsAllSegments) {
    // a(0,0); b(-25,100) and the dummy (25,100); c(0,200)
    auto ctx = placedContext({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"a", "c"}});

    EdgeRouting::route(ctx);

    const float segment = std::sqrt(25.0f * 25.0f + 100.0f * 100.0f);
    EXPECT_NEAR(EdgeRouting::totalLength(ctx), 4.0f * segment, 1e-2f);
}

TEST(EdgeRoutingTest, TotalLength_ZeroBeforeRouting) {
    auto ctx = placedContext({"a", "b"}, {{"a", "b"}});

    EXPECT_FLOAT_EQ(EdgeRouting::totalLength(ctx), 0.0f);
}
