#include "CoordinateAssignment.h"
#include "strata/layout/LayoutContext.h"
#include "strata/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace strata {
namespace algorithms {

// =============================================================================
// SimpleCoordinateAssignment
// =============================================================================

float SimpleCoordinateAssignment::crossCoordinate(const LayoutNode& node, bool horizontal) {
    return horizontal ? node.position.y : node.position.x;
}

void SimpleCoordinateAssignment::setCrossCoordinate(LayoutNode& node, bool horizontal,
                                                    float value) {
    if (horizontal) {
        node.position.y = value;
    } else {
        node.position.x = value;
    }
}

void SimpleCoordinateAssignment::assign(LayoutContext& ctx,
                                        const LayoutOptions& options) const {
    const bool horizontal = isHorizontal(options.direction);

    float levelCoord = 0.0f;
    for (int key : ctx.sortedLevelKeys(isReversed(options.direction))) {
        ctx.levels.at(key).coordinate = levelCoord;
        levelCoord += options.levelSeparation;
    }

    for (auto& [key, level] : ctx.levels) {
        float totalWidth = (static_cast<float>(level.nodes.size()) - 1.0f) * options.nodeSeparation;
        float nodeCoord = -totalWidth / 2.0f;

        for (NodeId id : level.nodes) {
            LayoutNode& node = ctx.nodes[id];
            if (horizontal) {
                node.position = {level.coordinate, nodeCoord};
            } else {
                node.position = {nodeCoord, level.coordinate};
            }
            nodeCoord += options.nodeSeparation;
        }
    }
}

// =============================================================================
// BrandesKopfCoordinateAssignment
// =============================================================================

void BrandesKopfCoordinateAssignment::assign(LayoutContext& ctx,
                                             const LayoutOptions& options) const {
    SimpleCoordinateAssignment::assign(ctx, options);

    for (int i = 0; i < options.alignmentIterations; ++i) {
        alignToNeighbors(ctx, options, true);
        alignToNeighbors(ctx, options, false);
    }

    if (options.compact && ctx.nodeCount() > 0) {
        compactLayout(ctx, options);
    }
}

void BrandesKopfCoordinateAssignment::alignToNeighbors(LayoutContext& ctx,
                                                       const LayoutOptions& options,
                                                       bool alignToParents) const {
    const bool horizontal = isHorizontal(options.direction);

    for (int key : ctx.sortedLevelKeys(!alignToParents)) {
        const Level& level = ctx.levels.at(key);

        for (size_t i = 0; i < level.nodes.size(); ++i) {
            NodeId id = level.nodes[i];
            const auto& neighbors = alignToParents ? ctx.reverseAdjacency[id] : ctx.adjacency[id];
            if (neighbors.empty()) {
                continue;
            }

            float ideal = 0.0f;
            for (NodeId neighbor : neighbors) {
                ideal += crossCoordinate(ctx.nodes[neighbor], horizontal);
            }
            ideal /= static_cast<float>(neighbors.size());

            float delta = ideal - crossCoordinate(ctx.nodes[id], horizontal);
            if (canShift(ctx, level, i, delta, options)) {
                setCrossCoordinate(ctx.nodes[id], horizontal, ideal);
            }
        }
    }
}

bool BrandesKopfCoordinateAssignment::canShift(const LayoutContext& ctx, const Level& level,
                                               size_t index, float delta,
                                               const LayoutOptions& options) const {
    if (std::abs(delta) < 1.0f) {
        return false;
    }

    const bool horizontal = isHorizontal(options.direction);
    const float minSep = options.nodeSeparation / 2.0f;
    const float newPos = crossCoordinate(ctx.nodes[level.nodes[index]], horizontal) + delta;

    if (index > 0 && delta < 0.0f) {
        float prevPos = crossCoordinate(ctx.nodes[level.nodes[index - 1]], horizontal);
        if (newPos - prevPos < minSep) {
            return false;
        }
    }

    if (index + 1 < level.nodes.size() && delta > 0.0f) {
        float nextPos = crossCoordinate(ctx.nodes[level.nodes[index + 1]], horizontal);
        if (nextPos - newPos < minSep) {
            return false;
        }
    }

    return true;
}

void BrandesKopfCoordinateAssignment::compactLayout(LayoutContext& ctx,
                                                    const LayoutOptions& options) const {
    const bool horizontal = isHorizontal(options.direction);
    const float minSep = options.nodeSeparation;

    for (auto& [key, level] : ctx.levels) {
        std::stable_sort(level.nodes.begin(), level.nodes.end(), [&](NodeId a, NodeId b) {
            return crossCoordinate(ctx.nodes[a], horizontal) <
                   crossCoordinate(ctx.nodes[b], horizontal);
        });

        for (size_t i = 0; i < level.nodes.size(); ++i) {
            ctx.nodes[level.nodes[i]].order = static_cast<int>(i);
        }

        for (size_t i = 1; i < level.nodes.size(); ++i) {
            float prevPos = crossCoordinate(ctx.nodes[level.nodes[i - 1]], horizontal);
            LayoutNode& node = ctx.nodes[level.nodes[i]];
            float idealPos = prevPos + minSep;

            if (crossCoordinate(node, horizontal) > idealPos + minSep) {
                setCrossCoordinate(node, horizontal, idealPos);
            }
        }
    }

    centerLayout(ctx, horizontal);
}

void BrandesKopfCoordinateAssignment::centerLayout(LayoutContext& ctx, bool horizontal) const {
    float minPos = std::numeric_limits<float>::max();
    float maxPos = std::numeric_limits<float>::lowest();
    for (const LayoutNode& node : ctx.nodes) {
        float pos = crossCoordinate(node, horizontal);
        minPos = std::min(minPos, pos);
        maxPos = std::max(maxPos, pos);
    }

    float center = (minPos + maxPos) / 2.0f;
    for (LayoutNode& node : ctx.nodes) {
        setCrossCoordinate(node, horizontal, crossCoordinate(node, horizontal) - center);
    }
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<ICoordinateAssignment> makeCoordinateAssignment(CoordinateAssignment algorithm) {
    switch (algorithm) {
        case CoordinateAssignment::Simple:
            return std::make_unique<SimpleCoordinateAssignment>();
        case CoordinateAssignment::Tight:
            return std::make_unique<TightCoordinateAssignment>();
        case CoordinateAssignment::BrandesKopf:
        default:
            return std::make_unique<BrandesKopfCoordinateAssignment>();
    }
}

// =============================================================================
// CoordinatePostProcess
// =============================================================================

void CoordinatePostProcess::applyMargin(LayoutContext& ctx, float margin) {
    if (ctx.nodes.empty()) {
        return;
    }

    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    for (const LayoutNode& node : ctx.nodes) {
        minX = std::min(minX, node.position.x);
        minY = std::min(minY, node.position.y);
    }

    Point shift{margin - minX, margin - minY};
    for (LayoutNode& node : ctx.nodes) {
        node.position = node.position + shift;
    }
}

void CoordinatePostProcess::alignToGrid(LayoutContext& ctx, float gridSize, float margin) {
    if (gridSize <= 0.0f) {
        LOG_WARN("Grid alignment skipped: grid size {} is not positive", gridSize);
        return;
    }
    if (ctx.nodes.empty()) {
        return;
    }

    auto snap = [gridSize](float v) { return std::round(v / gridSize) * gridSize; };

    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    for (LayoutNode& node : ctx.nodes) {
        node.position = {snap(node.position.x), snap(node.position.y)};
        minX = std::min(minX, node.position.x);
        minY = std::min(minY, node.position.y);
    }

    // Whole cells keep every coordinate on the grid
    auto restore = [gridSize, margin](float min) {
        return min < margin ? std::ceil((margin - min) / gridSize) * gridSize : 0.0f;
    };
    Point shift{restore(minX), restore(minY)};
    if (shift.x != 0.0f || shift.y != 0.0f) {
        for (LayoutNode& node : ctx.nodes) {
            node.position = node.position + shift;
        }
    }
}

}  // namespace algorithms
}  // namespace strata
