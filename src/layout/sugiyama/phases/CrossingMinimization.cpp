#include "CrossingMinimization.h"
#include "strata/layout/LayoutContext.h"
#include "strata/common/Logger.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace strata {
namespace algorithms {

CrossingMinimizationResult LayerSweepCrossingMinimization::minimize(
    LayoutContext& ctx,
    CrossingMinimization strategy,
    int iterations) const {

    CrossingMinimizationResult result;
    result.initialCrossings = countTotalCrossings(ctx);
    result.crossingCount = result.initialCrossings;

    if (strategy == CrossingMinimization::None || ctx.levels.size() < 2) {
        return result;
    }

    int bestCrossings = result.initialCrossings;
    std::vector<int> bestOrder = captureOrder(ctx);

    for (int i = 0; i < iterations; ++i) {
        sweep(ctx, strategy, i % 2 == 0);

        int crossings = countTotalCrossings(ctx);
        if (crossings < bestCrossings) {
            LOG_TRACE("Sweep {}: crossings {} -> {}", i, bestCrossings, crossings);
            bestCrossings = crossings;
            bestOrder = captureOrder(ctx);
            result.bestIteration = i;
        }
    }

    restoreOrder(ctx, bestOrder);
    result.crossingCount = bestCrossings;

    LOG_DEBUG("Crossings reduced from {} to {}", result.initialCrossings, bestCrossings);
    return result;
}

void LayerSweepCrossingMinimization::sweep(LayoutContext& ctx,
                                           CrossingMinimization strategy,
                                           bool downward) const {
    // Downward: ascending keys, align to parents. Upward: descending, children.
    std::vector<int> keys = ctx.sortedLevelKeys(!downward);

    for (size_t i = 1; i < keys.size(); ++i) {
        Level& level = ctx.levels.at(keys[i]);
        const Level& fixed = ctx.levels.at(keys[i - 1]);
        orderLevel(ctx, level, fixed, strategy, downward);
    }
}

void LayerSweepCrossingMinimization::orderLevel(LayoutContext& ctx, Level& level,
                                                const Level& fixed,
                                                CrossingMinimization strategy,
                                                bool useParents) const {
    std::unordered_set<NodeId> fixedNodes(fixed.nodes.begin(), fixed.nodes.end());

    std::vector<std::pair<NodeId, double>> positions;
    positions.reserve(level.nodes.size());

    std::vector<int> orders;
    for (NodeId node : level.nodes) {
        const auto& neighbors = useParents ? ctx.reverseAdjacency[node] : ctx.adjacency[node];

        orders.clear();
        for (NodeId neighbor : neighbors) {
            if (fixedNodes.count(neighbor) > 0) {
                orders.push_back(ctx.nodes[neighbor].order);
            }
        }

        if (orders.empty()) {
            positions.emplace_back(node, static_cast<double>(ctx.nodes[node].order));
            continue;
        }

        double pos = 0.0;
        if (strategy == CrossingMinimization::Barycenter) {
            for (int o : orders) {
                pos += o;
            }
            pos /= static_cast<double>(orders.size());
        } else {
            std::sort(orders.begin(), orders.end());
            size_t mid = orders.size() / 2;
            pos = orders.size() % 2 == 0
                ? (orders[mid - 1] + orders[mid]) / 2.0
                : static_cast<double>(orders[mid]);
        }
        positions.emplace_back(node, pos);
    }

    std::stable_sort(positions.begin(), positions.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    for (size_t i = 0; i < positions.size(); ++i) {
        level.nodes[i] = positions[i].first;
        ctx.nodes[positions[i].first].order = static_cast<int>(i);
    }
}

int LayerSweepCrossingMinimization::countCrossings(const LayoutContext& ctx,
                                                   int upperLevel,
                                                   int lowerLevel) const {
    auto it = ctx.levels.find(upperLevel);
    if (it == ctx.levels.end()) {
        return 0;
    }

    std::vector<std::pair<int, int>> arcs;
    for (NodeId node : it->second.nodes) {
        for (NodeId child : ctx.adjacency[node]) {
            if (ctx.nodes[child].level == lowerLevel) {
                arcs.emplace_back(ctx.nodes[node].order, ctx.nodes[child].order);
            }
        }
    }

    int crossings = 0;
    for (size_t i = 0; i < arcs.size(); ++i) {
        for (size_t j = i + 1; j < arcs.size(); ++j) {
            const auto& a = arcs[i];
            const auto& b = arcs[j];
            if ((a.first < b.first && a.second > b.second) ||
                (a.first > b.first && a.second < b.second)) {
                ++crossings;
            }
        }
    }

    LOG_TRACE("Levels {}/{}: {} arcs compared pairwise, {} crossings",
              upperLevel, lowerLevel, arcs.size(), crossings);
    return crossings;
}

int LayerSweepCrossingMinimization::countTotalCrossings(const LayoutContext& ctx) const {
    std::vector<int> keys = ctx.sortedLevelKeys();

    int total = 0;
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        total += countCrossings(ctx, keys[i], keys[i + 1]);
    }
    return total;
}

std::vector<int> LayerSweepCrossingMinimization::captureOrder(const LayoutContext& ctx) const {
    std::vector<int> order;
    order.reserve(ctx.nodeCount());
    for (const LayoutNode& node : ctx.nodes) {
        order.push_back(node.order);
    }
    return order;
}

void LayerSweepCrossingMinimization::restoreOrder(LayoutContext& ctx,
                                                  const std::vector<int>& order) const {
    for (NodeId id = 0; id < order.size(); ++id) {
        ctx.nodes[id].order = order[id];
    }

    for (auto& [key, level] : ctx.levels) {
        std::sort(level.nodes.begin(), level.nodes.end(),
                  [&ctx](NodeId a, NodeId b) { return ctx.nodes[a].order < ctx.nodes[b].order; });
    }
}

}  // namespace algorithms
}  // namespace strata
