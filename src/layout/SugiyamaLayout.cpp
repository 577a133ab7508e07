#include "strata/layout/SugiyamaLayout.h"
#include "strata/layout/api/ICycleRemoval.h"
#include "strata/layout/api/IRankAssignment.h"
#include "strata/layout/api/ICrossingMinimization.h"
#include "strata/layout/api/ICoordinateAssignment.h"
#include "strata/layout/LayoutContext.h"
#include "strata/core/GraphData.h"
#include "strata/common/Logger.h"
#include "sugiyama/phases/CycleRemoval.h"
#include "sugiyama/phases/RankAssignment.h"
#include "sugiyama/phases/DummyNodeInsertion.h"
#include "sugiyama/phases/CrossingMinimization.h"
#include "sugiyama/phases/CoordinateAssignment.h"
#include "sugiyama/routing/EdgeRouting.h"

#include <algorithm>
#include <limits>

namespace strata {

SugiyamaLayout::SugiyamaLayout()
    : SugiyamaLayout(LayoutOptions{}) {}

SugiyamaLayout::SugiyamaLayout(const LayoutOptions& options)
    : options_(options)
    , cycleRemoval_(std::make_shared<algorithms::DfsCycleRemoval>())
    , crossingMinimization_(std::make_shared<algorithms::LayerSweepCrossingMinimization>()) {}

SugiyamaLayout::SugiyamaLayout(LayoutPreset preset)
    : SugiyamaLayout(LayoutOptions::fromPreset(preset)) {}

SugiyamaLayout::~SugiyamaLayout() = default;

SugiyamaLayout::SugiyamaLayout(SugiyamaLayout&&) noexcept = default;
SugiyamaLayout& SugiyamaLayout::operator=(SugiyamaLayout&&) noexcept = default;

void SugiyamaLayout::setOptions(const LayoutOptions& options) {
    options_ = options;
}

SugiyamaLayout& SugiyamaLayout::setDirection(Direction direction) {
    options_.direction = direction;
    return *this;
}

SugiyamaLayout& SugiyamaLayout::setLevelSeparation(float separation) {
    options_.levelSeparation = separation;
    return *this;
}

SugiyamaLayout& SugiyamaLayout::setNodeSeparation(float separation) {
    options_.nodeSeparation = separation;
    return *this;
}

SugiyamaLayout& SugiyamaLayout::setRankingAlgorithm(RankingAlgorithm algorithm) {
    options_.rankingAlgorithm = algorithm;
    return *this;
}

SugiyamaLayout& SugiyamaLayout::setCrossingMinimization(CrossingMinimization strategy) {
    options_.crossingMinimization = strategy;
    return *this;
}

void SugiyamaLayout::setCycleRemoval(std::shared_ptr<ICycleRemoval> impl) {
    if (impl) cycleRemoval_ = std::move(impl);
}

void SugiyamaLayout::setRankAssignment(std::shared_ptr<IRankAssignment> impl) {
    if (impl) rankAssignment_ = std::move(impl);
}

void SugiyamaLayout::setCrossingMinimization(std::shared_ptr<ICrossingMinimization> impl) {
    if (impl) crossingMinimization_ = std::move(impl);
}

void SugiyamaLayout::setCoordinateAssignment(std::shared_ptr<ICoordinateAssignment> impl) {
    if (impl) coordinateAssignment_ = std::move(impl);
}

LayoutResult SugiyamaLayout::layout(const GraphData& graph) const {
    if (graph.empty()) {
        return LayoutResult{};
    }

    LayoutContext ctx = LayoutContext::fromGraph(graph);
    if (ctx.nodeCount() == 0) {
        return LayoutResult{};
    }

    // Phase 1: Cycle Removal
    CycleRemovalResult cycles = cycleRemoval_->removeCycles(ctx);

    // Phase 2: Rank Assignment
    if (rankAssignment_) {
        rankAssignment_->assignRanks(ctx, options_);
    } else {
        algorithms::makeRankAssignment(options_.rankingAlgorithm)->assignRanks(ctx, options_);
    }
    LOG_DEBUG("Assigned {} nodes to {} levels", ctx.nodeCount(), ctx.levels.size());

    // Phase 3: Dummy Node Insertion
    int dummyCount = algorithms::DummyNodeInsertion::insert(ctx);

    // Phase 4: Crossing Minimization
    CrossingMinimizationResult crossing = crossingMinimization_->minimize(
        ctx, options_.crossingMinimization, options_.crossingIterations);

    // Phase 5: Coordinate Assignment
    assignCoordinates(ctx);

    // Phase 6: Edge Routing
    EdgeRouting::route(ctx);

    return buildResult(ctx, static_cast<int>(cycles.reversedEdges.size()), dummyCount,
                       crossing.crossingCount);
}

void SugiyamaLayout::assignCoordinates(LayoutContext& ctx) const {
    if (coordinateAssignment_) {
        coordinateAssignment_->assign(ctx, options_);
    } else {
        algorithms::makeCoordinateAssignment(options_.coordinateAssignment)->assign(ctx, options_);
    }

    algorithms::CoordinatePostProcess::applyMargin(ctx, options_.margin);

    if (options_.alignToGrid) {
        algorithms::CoordinatePostProcess::alignToGrid(ctx, options_.gridSize, options_.margin);
    }
}

LayoutResult SugiyamaLayout::buildResult(const LayoutContext& ctx, int reversedEdges,
                                         int dummyNodes, int crossings) const {
    LayoutResult result;

    LayoutBounds bounds;
    bounds.minX = std::numeric_limits<float>::max();
    bounds.minY = std::numeric_limits<float>::max();
    bounds.maxX = std::numeric_limits<float>::lowest();
    bounds.maxY = std::numeric_limits<float>::lowest();

    for (const LayoutNode& node : ctx.nodes) {
        if (!node.isDummy) {
            result.setNodeLayout({node.id, node.position, node.level, node.order});
        }
        bounds.minX = std::min(bounds.minX, node.position.x);
        bounds.minY = std::min(bounds.minY, node.position.y);
        bounds.maxX = std::max(bounds.maxX, node.position.x);
        bounds.maxY = std::max(bounds.maxY, node.position.y);
    }
    bounds.width = bounds.maxX - bounds.minX;
    bounds.height = bounds.maxY - bounds.minY;

    for (const LayoutEdge& edge : ctx.edges) {
        EdgeLayout layout;
        layout.id = edge.id;
        layout.source = ctx.nodes[edge.source].id;
        layout.target = ctx.nodes[edge.target].id;
        layout.label = edge.label;
        layout.userData = edge.userData;
        layout.reversed = edge.reversed;
        layout.controlPoints = edge.controlPoints;
        layout.dummyNodes.reserve(edge.dummyNodes.size());
        for (NodeId dummy : edge.dummyNodes) {
            layout.dummyNodes.push_back(ctx.nodes[dummy].id);
        }
        result.addEdgeLayout(std::move(layout));
    }

    LayoutStats stats;
    stats.crossings = crossings;
    stats.dummyNodes = dummyNodes;
    stats.reversedEdges = reversedEdges;
    stats.totalEdgeLength = EdgeRouting::totalLength(ctx);

    result.setBounds(bounds);
    result.setStats(stats);
    result.setLevelCount(static_cast<int>(ctx.levels.size()));

    LOG_DEBUG("Layout done: {} nodes, {} edges, {} crossings, {} dummies, {} reversed",
              result.nodeCount(), result.edgeCount(), crossings, dummyNodes, reversedEdges);
    return result;
}

}  // namespace strata
